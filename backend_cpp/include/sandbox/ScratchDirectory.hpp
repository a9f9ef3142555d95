#pragma once
#include <filesystem>
#include <string>

namespace data_analyst {

namespace fs = std::filesystem;

/**
 * Request-scoped scratch area, created with mkdtemp under `root`:
 *
 *   <root>/analyst-XXXXXX/
 *       program.py      generated source
 *       work/           cwd of the child, holds only the attached files
 *
 * The whole tree is removed when the object goes out of scope, whatever the
 * outcome of the run.
 */
class ScratchDirectory {
public:
    explicit ScratchDirectory(const std::string& root);
    ~ScratchDirectory();

    ScratchDirectory(const ScratchDirectory&) = delete;
    ScratchDirectory& operator=(const ScratchDirectory&) = delete;

    const fs::path& path() const { return path_; }
    fs::path work_dir() const { return path_ / "work"; }
    fs::path program_path() const { return path_ / "program.py"; }

    // Throws std::runtime_error on I/O failure.
    void write_file(const fs::path& target, const std::string& bytes) const;

    // Idempotent. Returns false (and logs) if something could not be removed.
    bool remove() noexcept;

private:
    fs::path path_;
    bool removed_ = false;
};

} // namespace data_analyst
