#include <catch2/catch_test_macros.hpp>

#include "fake_channel.hpp"

#include "voice_bridge/codec/ai_codec.hpp"
#include "voice_bridge/codec/base64.hpp"
#include "voice_bridge/codec/telephony_codec.hpp"
#include "voice_bridge/relay/session.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using voice_bridge::MediaRelaySession;
using voice_bridge::SessionObserver;
using voice_bridge::SessionState;
using voice_bridge::testing::FakeChannel;
namespace ai = voice_bridge::ai;
namespace telephony = voice_bridge::telephony;

namespace {

class RecordingObserver : public SessionObserver {
public:
    void on_state_changed(const std::string&, SessionState state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states.push_back(state);
    }
    void on_transcript(const std::string&, const std::string& text) override {
        std::lock_guard<std::mutex> lock(mutex_);
        transcripts.push_back(text);
    }
    void on_ai_error(const std::string&, const std::string& raw) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ai_errors.push_back(raw);
    }
    void on_leg_failed(const std::string&, const std::string& leg, const std::string&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        failed_legs.push_back(leg);
    }

    std::vector<SessionState> states;
    std::vector<std::string> transcripts;
    std::vector<std::string> ai_errors;
    std::vector<std::string> failed_legs;

private:
    std::mutex mutex_;
};

struct SessionHarness {
    std::shared_ptr<FakeChannel> telephony_peer = std::make_shared<FakeChannel>();
    std::shared_ptr<FakeChannel> ai_peer = std::make_shared<FakeChannel>();
    std::shared_ptr<RecordingObserver> observer = std::make_shared<RecordingObserver>();
    std::unique_ptr<MediaRelaySession> session;
    std::thread runner;

    SessionHarness() {
        ai::SessionConfig config;
        config.instructions = "test instructions";
        auto ai_channel = ai_peer;
        session = std::make_unique<MediaRelaySession>(
            "call-1", telephony_peer, [ai_channel]() { return ai_channel; }, config, observer);
    }

    ~SessionHarness() {
        if (runner.joinable()) {
            session->close("test teardown");
            runner.join();
        }
    }

    void start() {
        runner = std::thread([this]() { session->run(); });
        REQUIRE(ai_peer->wait_for_sent(1));
    }

    void join() { runner.join(); }
};

std::string ai_delta(const std::string& pcm) {
    return R"({"type":"response.audio.delta","delta":")" +
           voice_bridge::codec::encode_base64(pcm) + R"("})";
}

}

TEST_CASE("session configures the AI endpoint on connect") {
    SessionHarness h;
    h.start();
    const auto first = ai::parse(h.ai_peer->sent().front().text);
    REQUIRE(std::get<ai::SessionUpdate>(first).session.instructions == "test instructions");
    REQUIRE(h.session->state() == SessionState::Streaming);
    h.telephony_peer->finish_inbound();
    h.join();
}

TEST_CASE("telephony audio is forwarded as one input_audio_buffer.append") {
    SessionHarness h;
    h.start();
    const std::string pcm(2000, '\x11');
    h.telephony_peer->push_inbound(telephony::serialize(telephony::AudioData{pcm}));
    h.telephony_peer->push_inbound(R"({"kind":"AudioData","audioData":{"data":""}})");
    REQUIRE(h.ai_peer->wait_for_sent(2));

    h.telephony_peer->finish_inbound();
    h.join();

    const auto sent = h.ai_peer->sent();
    REQUIRE(sent.size() == 2);
    REQUIRE(std::get<ai::InputAudioAppend>(ai::parse(sent[1].text)).payload == pcm);
    REQUIRE(h.session->state() == SessionState::Closed);
    REQUIRE(h.session->close_reason() == "telephony peer closed");
}

TEST_CASE("AI audio is paced back to telephony in 960 byte frames") {
    SessionHarness h;
    h.start();
    const std::string pcm(2500, '\x22');
    h.ai_peer->push_inbound(ai_delta(pcm));
    REQUIRE(h.telephony_peer->wait_for_sent(3));

    const auto frames = h.telephony_peer->sent();
    std::string joined;
    for (std::size_t i = 0; i < 3; ++i) {
        joined += std::get<telephony::AudioData>(telephony::parse(frames[i].text)).payload;
        if (i > 0) {
            REQUIRE(frames[i].at - frames[i - 1].at >= std::chrono::milliseconds(18));
        }
    }
    REQUIRE(joined == pcm);
    REQUIRE(std::get<telephony::AudioData>(telephony::parse(frames[2].text)).payload.size() ==
            580);

    h.telephony_peer->push_inbound(R"({"kind":"StopAudio"})");
    h.join();
    REQUIRE(h.session->close_reason() == "telephony stop audio");
}

TEST_CASE("telephony hang-up mid-burst discards the remaining frames") {
    SessionHarness h;
    h.start();
    h.ai_peer->push_inbound(ai_delta(std::string(960 * 200, '\x33')));
    REQUIRE(h.telephony_peer->wait_for_sent(3));

    h.telephony_peer->finish_inbound();
    h.join();

    REQUIRE(h.session->state() == SessionState::Closed);
    REQUIRE(h.telephony_peer->sent().size() < 200);
    REQUIRE_FALSE(h.ai_peer->is_open());
}

TEST_CASE("transcripts and AI errors reach the observer") {
    SessionHarness h;
    h.start();
    h.ai_peer->push_inbound(R"({"type":"response.audio_transcript.delta","delta":"Hi"})");
    h.ai_peer->push_inbound(R"({"type":"error","error":{"message":"quota"}})");
    h.ai_peer->push_inbound("not json");
    h.ai_peer->finish_inbound();
    h.join();

    REQUIRE(h.observer->transcripts == std::vector<std::string>{"Hi"});
    REQUIRE(h.observer->ai_errors.size() == 1);
    REQUIRE(h.session->close_reason() == "ai peer closed");
}

TEST_CASE("AI hang-up stops telephony playback") {
    SessionHarness h;
    h.start();
    h.ai_peer->finish_inbound();
    REQUIRE(h.telephony_peer->wait_for_closed());
    h.join();

    const auto sent = h.telephony_peer->sent();
    REQUIRE_FALSE(sent.empty());
    REQUIRE(std::holds_alternative<telephony::StopAudio>(telephony::parse(sent.back().text)));
}

TEST_CASE("AI connect failure closes the session") {
    auto telephony_peer = std::make_shared<FakeChannel>();
    auto observer = std::make_shared<RecordingObserver>();
    MediaRelaySession session(
        "call-2", telephony_peer,
        []() -> std::shared_ptr<voice_bridge::transport::MessageChannel> {
            throw voice_bridge::transport::TransportError("connection refused");
        },
        ai::SessionConfig{}, observer);

    session.run();

    REQUIRE(session.state() == SessionState::Closed);
    REQUIRE(session.close_reason() == "ai failure");
    REQUIRE(observer->failed_legs == std::vector<std::string>{"ai"});
    REQUIRE_FALSE(telephony_peer->is_open());
}

TEST_CASE("closing a session is idempotent") {
    auto telephony_peer = std::make_shared<FakeChannel>();
    auto observer = std::make_shared<RecordingObserver>();
    auto ai_peer = std::make_shared<FakeChannel>();
    MediaRelaySession session("call-3", telephony_peer, [ai_peer]() { return ai_peer; },
                              ai::SessionConfig{}, observer);

    session.close("owner");
    session.close("again");
    session.run();

    REQUIRE(session.state() == SessionState::Closed);
    REQUIRE(session.close_reason() == "owner");
    REQUIRE(observer->states ==
            std::vector<SessionState>{SessionState::Closing, SessionState::Closed});
    REQUIRE(ai_peer->sent().empty());
}

TEST_CASE("owner close unblocks a running session") {
    SessionHarness h;
    h.start();
    h.session->close("shutdown");
    h.join();
    REQUIRE(h.session->state() == SessionState::Closed);
    REQUIRE(h.session->close_reason() == "shutdown");
    REQUIRE_FALSE(h.telephony_peer->is_open());
}

TEST_CASE("caller audio waits until session.update is on the wire") {
    SessionHarness h;
    std::promise<void> entered;
    std::promise<void> release;
    auto release_future = release.get_future().share();
    std::atomic<bool> first{true};
    h.ai_peer->on_send([&, release_future](const std::string&) {
        if (first.exchange(false)) {
            entered.set_value();
            release_future.wait();
        }
    });
    auto entered_future = entered.get_future();

    h.runner = std::thread([&h]() { h.session->run(); });
    REQUIRE(entered_future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);

    const std::string early(320, '\x44');
    h.telephony_peer->push_inbound(telephony::serialize(telephony::AudioData{early}));
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    release.set_value();
    REQUIRE(h.ai_peer->wait_for_sent(1));

    const std::string later(640, '\x55');
    h.telephony_peer->push_inbound(telephony::serialize(telephony::AudioData{later}));
    REQUIRE(h.ai_peer->wait_for_sent(2));
    h.telephony_peer->finish_inbound();
    h.join();

    const auto sent = h.ai_peer->sent();
    REQUIRE(std::holds_alternative<ai::SessionUpdate>(ai::parse(sent.front().text)));
    for (std::size_t i = 1; i < sent.size(); ++i) {
        REQUIRE(std::holds_alternative<ai::InputAudioAppend>(ai::parse(sent[i].text)));
    }
    REQUIRE(std::get<ai::InputAudioAppend>(ai::parse(sent.back().text)).payload == later);
}
