#include <catch2/catch_test_macros.hpp>

#include "voice_bridge/backend/client.hpp"
#include "voice_bridge/chat/chat_bridge.hpp"

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

using namespace voice_bridge::chat;

namespace {

class ScriptedBackend : public QueryBackend {
public:
    enum class Mode { Answer, Empty, BackendFailure, Crash };

    Mode mode = Mode::Answer;
    std::string answer = "42";
    std::vector<std::string> questions;

    std::optional<std::string> ask(const std::string& question) override {
        questions.push_back(question);
        switch (mode) {
        case Mode::Answer:
            return answer;
        case Mode::Empty:
            return std::nullopt;
        case Mode::BackendFailure:
            throw voice_bridge::BackendError("timed out");
        case Mode::Crash:
            throw std::logic_error("unexpected");
        }
        return std::nullopt;
    }
};

class RecordingSender : public ChatThreadSender {
public:
    bool fail = false;
    std::vector<std::pair<std::string, std::string>> sent;

    void send_message(const std::string& thread_id, const std::string& text) override {
        if (fail) {
            throw voice_bridge::BackendError("chat api unavailable");
        }
        sent.emplace_back(thread_id, text);
    }
};

struct Fixture {
    DedupStore store;
    ScriptedBackend backend;
    RecordingSender sender;
    ChatBridge bridge{store, backend, sender, "8:acs:bot"};
};

}

TEST_CASE("backend answer is relayed once to the thread") {
    Fixture f;
    REQUIRE(f.bridge.handle("thread-1", "m1", "8:acs:user", "What is the answer?"));
    REQUIRE(f.backend.questions == std::vector<std::string>{"What is the answer?"});
    REQUIRE(f.sender.sent.size() == 1);
    REQUIRE(f.sender.sent[0].first == "thread-1");
    REQUIRE(f.sender.sent[0].second == "42");
}

TEST_CASE("redelivered message id queries the backend once") {
    Fixture f;
    REQUIRE(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE_FALSE(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE(f.backend.questions.size() == 1);
    REQUIRE(f.sender.sent.size() == 1);
}

TEST_CASE("own and empty messages are dropped without a query") {
    Fixture f;
    REQUIRE_FALSE(f.bridge.handle("thread-1", "m1", "8:acs:bot", "echo"));
    REQUIRE_FALSE(f.bridge.handle("thread-1", "m2", "8:acs:user", ""));
    REQUIRE(f.backend.questions.empty());
    REQUIRE(f.sender.sent.empty());
}

TEST_CASE("missing answer relays the empty-answer fallback") {
    Fixture f;
    f.backend.mode = ScriptedBackend::Mode::Empty;
    REQUIRE(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE(f.sender.sent.at(0).second == kEmptyAnswerReply);
}

TEST_CASE("blank answer relays the empty-answer fallback") {
    Fixture f;
    f.backend.answer = "";
    REQUIRE(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE(f.sender.sent.size() == 1);
    REQUIRE(f.sender.sent[0].second == kEmptyAnswerReply);
}

TEST_CASE("backend failure relays the apology and does not throw") {
    Fixture f;
    f.backend.mode = ScriptedBackend::Mode::BackendFailure;
    REQUIRE_NOTHROW(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE(f.sender.sent.size() == 1);
    REQUIRE(f.sender.sent[0].second == kBackendFailureReply);
}

TEST_CASE("unexpected failures are contained by handle") {
    Fixture f;
    f.backend.mode = ScriptedBackend::Mode::Crash;
    REQUIRE_NOTHROW(f.bridge.handle("thread-1", "m1", "8:acs:user", "hi"));
    REQUIRE(f.sender.sent.empty());

    f.backend.mode = ScriptedBackend::Mode::Answer;
    f.sender.fail = true;
    bool replied = true;
    REQUIRE_NOTHROW(replied = f.bridge.handle("thread-1", "m2", "8:acs:user", "hi"));
    REQUIRE_FALSE(replied);
}
