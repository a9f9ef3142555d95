#include <gtest/gtest.h>
#include <deque>
#include <nlohmann/json.hpp>
#include "analysis/AnalysisError.hpp"
#include "code_generation_client.hpp"

using namespace data_analyst;
using json = nlohmann::json;

namespace {

// Replays canned replies in order and records every payload it was sent.
class ScriptedTransport : public ICompletionTransport {
public:
    std::deque<TransportReply> replies;
    std::vector<std::string> payloads;

    TransportReply post(const std::string& payload_json) override {
        payloads.push_back(payload_json);
        if (replies.empty()) return TransportReply{0, "", "no more scripted replies"};
        TransportReply r = replies.front();
        replies.pop_front();
        return r;
    }
};

TransportReply completion(const std::string& content, const std::string& finish_reason = "stop") {
    json body = {
        {"id", "chatcmpl-1"},
        {"choices", json::array({
            {{"index", 0},
             {"message", {{"role", "assistant"}, {"content", content}}},
             {"finish_reason", finish_reason}}
        })}
    };
    return TransportReply{200, body.dump(), ""};
}

GenerationPrompt sample_prompt() {
    return GenerationPrompt{"system text", "user text"};
}

AnalystConfig test_config() {
    AnalystConfig cfg;
    cfg.api_key = "test-key";
    cfg.max_retries = 3;
    cfg.initial_backoff = std::chrono::milliseconds(100);
    return cfg;
}

const std::string kScript = "import json\nprint(json.dumps([1, 2]))\n";

ErrorKind extraction_error(const std::string& response) {
    try {
        extract_single_code_block(response);
    } catch (const AnalysisError& e) {
        return e.kind();
    }
    return ErrorKind::Internal;
}

class CodeGenerationClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        transport = std::make_shared<ScriptedTransport>();
        client = std::make_unique<CodeGenerationClient>(test_config(), transport);
        client->set_sleep_function([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }

    std::shared_ptr<ScriptedTransport> transport;
    std::unique_ptr<CodeGenerationClient> client;
    std::vector<std::chrono::milliseconds> sleeps;
};

} // namespace

TEST(ExtractCodeBlockTest, ReturnsBodyOfSinglePythonBlock) {
    std::string response = "Here is the script:\n```python\n" + kScript + "```\nGood luck!";
    EXPECT_EQ(extract_single_code_block(response), kScript);
}

TEST(ExtractCodeBlockTest, AcceptsUntaggedAndPyTags) {
    EXPECT_EQ(extract_single_code_block("```\nprint(1)\n```"), "print(1)\n");
    EXPECT_EQ(extract_single_code_block("```py\nprint(1)\n```"), "print(1)\n");
    EXPECT_EQ(extract_single_code_block("```Python3\r\nprint(1)\r\n```\r\n"), "print(1)\n");
}

TEST(ExtractCodeBlockTest, RejectsMissingBlock) {
    EXPECT_EQ(extraction_error("print(1)"), ErrorKind::GenerationFailed);
    EXPECT_EQ(extraction_error(""), ErrorKind::GenerationFailed);
}

TEST(ExtractCodeBlockTest, RejectsMoreThanOneBlock) {
    std::string response = "```python\nprint(1)\n```\nor\n```python\nprint(2)\n```\n";
    EXPECT_EQ(extraction_error(response), ErrorKind::GenerationFailed);
}

TEST(ExtractCodeBlockTest, RejectsUnterminatedBlock) {
    EXPECT_EQ(extraction_error("```python\nprint(1)\n"), ErrorKind::GenerationFailed);
}

TEST(ExtractCodeBlockTest, RejectsNestedFence) {
    EXPECT_EQ(extraction_error("```python\nx = 1\n```bash\npip install x\n```\n"), ErrorKind::GenerationFailed);
}

TEST(ExtractCodeBlockTest, RejectsOtherLanguages) {
    EXPECT_EQ(extraction_error("```bash\npip install pandas\n```"), ErrorKind::GenerationFailed);
    EXPECT_EQ(extraction_error("```javascript\nconsole.log(1)\n```"), ErrorKind::GenerationFailed);
}

TEST(ExtractCodeBlockTest, RejectsBlankBody) {
    EXPECT_EQ(extraction_error("```python\n   \n```"), ErrorKind::GenerationFailed);
}

TEST_F(CodeGenerationClientTest, SendsChatCompletionPayload) {
    transport->replies.push_back(completion("```python\n" + kScript + "```"));

    GeneratedProgram program = client->generate(sample_prompt());
    EXPECT_EQ(program.source_text, kScript);
    EXPECT_EQ(program.language, "python");

    ASSERT_EQ(transport->payloads.size(), 1u);
    json sent = json::parse(transport->payloads[0]);
    EXPECT_EQ(sent["model"], test_config().model);
    ASSERT_EQ(sent["messages"].size(), 2u);
    EXPECT_EQ(sent["messages"][0]["role"], "system");
    EXPECT_EQ(sent["messages"][0]["content"], "system text");
    EXPECT_EQ(sent["messages"][1]["role"], "user");
    EXPECT_EQ(sent["messages"][1]["content"], "user text");
    EXPECT_EQ(sent["temperature"], 0.0);
    EXPECT_EQ(sent["max_tokens"], test_config().max_response_tokens);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(CodeGenerationClientTest, RetriesTransientFailuresWithExponentialBackoff) {
    transport->replies.push_back(TransportReply{429, "{\"error\":\"rate limited\"}", ""});
    transport->replies.push_back(TransportReply{0, "", "Connection refused"});
    transport->replies.push_back(TransportReply{503, "overloaded", ""});
    transport->replies.push_back(completion("```python\n" + kScript + "```"));

    GeneratedProgram program = client->generate(sample_prompt());
    EXPECT_EQ(program.source_text, kScript);
    EXPECT_EQ(transport->payloads.size(), 4u);

    std::vector<std::chrono::milliseconds> expected = {
        std::chrono::milliseconds(100), std::chrono::milliseconds(200), std::chrono::milliseconds(400)};
    EXPECT_EQ(sleeps, expected);
}

TEST_F(CodeGenerationClientTest, GivesUpAfterRetryBudget) {
    for (int i = 0; i < 10; ++i) transport->replies.push_back(TransportReply{500, "boom", ""});

    try {
        client->generate(sample_prompt());
        FAIL() << "expected GenerationFailed";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::GenerationFailed);
        EXPECT_NE(std::string(e.what()).find("4 attempts"), std::string::npos);
    }
    EXPECT_EQ(transport->payloads.size(), 4u);
    EXPECT_EQ(sleeps.size(), 3u);
}

TEST_F(CodeGenerationClientTest, ClientErrorsAreNotRetried) {
    transport->replies.push_back(TransportReply{401, "{\"error\":\"invalid api key\"}", ""});

    try {
        client->generate(sample_prompt());
        FAIL() << "expected GenerationFailed";
    } catch (const AnalysisError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::GenerationFailed);
        EXPECT_NE(std::string(e.what()).find("401"), std::string::npos);
        EXPECT_NE(e.diagnostic().find("invalid api key"), std::string::npos);
    }
    EXPECT_EQ(transport->payloads.size(), 1u);
    EXPECT_TRUE(sleeps.empty());
}

TEST_F(CodeGenerationClientTest, TruncatedCompletionFails) {
    transport->replies.push_back(completion("```python\nimport pandas as pd\n", "length"));
    EXPECT_THROW(client->generate(sample_prompt()), AnalysisError);
}

TEST_F(CodeGenerationClientTest, NonJsonBodyFails) {
    transport->replies.push_back(TransportReply{200, "<html>gateway</html>", ""});
    EXPECT_THROW(client->generate(sample_prompt()), AnalysisError);
}

TEST_F(CodeGenerationClientTest, MissingChoicesFails) {
    transport->replies.push_back(TransportReply{200, "{\"choices\":[]}", ""});
    EXPECT_THROW(client->generate(sample_prompt()), AnalysisError);
}

TEST_F(CodeGenerationClientTest, OversizedResponseFails) {
    AnalystConfig cfg = test_config();
    cfg.max_response_bytes = 64;
    CodeGenerationClient small(cfg, transport);
    transport->replies.push_back(completion("```python\n" + std::string(200, '#') + "\n```"));
    EXPECT_THROW(small.generate(sample_prompt()), AnalysisError);
}

TEST(TransientStatusTest, ClassifiesStatusCodes) {
    EXPECT_TRUE(CodeGenerationClient::is_transient_status(0));
    EXPECT_TRUE(CodeGenerationClient::is_transient_status(429));
    EXPECT_TRUE(CodeGenerationClient::is_transient_status(500));
    EXPECT_TRUE(CodeGenerationClient::is_transient_status(503));
    EXPECT_FALSE(CodeGenerationClient::is_transient_status(400));
    EXPECT_FALSE(CodeGenerationClient::is_transient_status(401));
    EXPECT_FALSE(CodeGenerationClient::is_transient_status(404));
}
