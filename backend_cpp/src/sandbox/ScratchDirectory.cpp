#include "sandbox/ScratchDirectory.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <vector>
#include <stdlib.h>
#include <spdlog/spdlog.h>

namespace data_analyst {

ScratchDirectory::ScratchDirectory(const std::string& root) {
    std::string tmpl = (fs::path(root) / "analyst-XXXXXX").string();
    std::vector<char> buf(tmpl.begin(), tmpl.end());
    buf.push_back('\0');

    if (::mkdtemp(buf.data()) == nullptr) {
        throw std::runtime_error("mkdtemp(" + tmpl + "): " + std::strerror(errno));
    }
    // The child chdirs into work/, so every path we hand it must be absolute.
    path_ = fs::absolute(fs::path(buf.data()));

    std::error_code ec;
    fs::create_directory(work_dir(), ec);
    if (ec) {
        remove();
        throw std::runtime_error("create work dir: " + ec.message());
    }
}

ScratchDirectory::~ScratchDirectory() {
    remove();
}

void ScratchDirectory::write_file(const fs::path& target, const std::string& bytes) const {
    std::ofstream f(target, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("cannot create " + target.string());
    f.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    f.close();
    if (!f) throw std::runtime_error("cannot write " + target.string());
}

bool ScratchDirectory::remove() noexcept {
    if (removed_ || path_.empty()) return true;

    std::error_code ec;
    // The child may have chmod'ed things read-only; remove_all copes with
    // files but not with directories lacking write permission.
    fs::permissions(path_, fs::perms::owner_all, fs::perm_options::add, ec);
    for (auto it = fs::recursive_directory_iterator(path_, fs::directory_options::skip_permission_denied, ec);
         !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        std::error_code perm_ec;
        if (it->is_directory(perm_ec) && !it->is_symlink(perm_ec)) {
            fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, perm_ec);
        }
    }

    ec.clear();
    fs::remove_all(path_, ec);
    if (ec) {
        spdlog::error("🧹 Failed to remove scratch dir {}: {}", path_.string(), ec.message());
        return false;
    }
    removed_ = true;
    return true;
}

} // namespace data_analyst
