#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio.hpp>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include "mocks.hpp"
#include "test_utils.hpp"
#include "transfer/transfer_engine.hpp"

using namespace codedrop::transfer;
using codedrop::test::HeldPrompt;
using codedrop::test::RecordingErrorSink;
using codedrop::test::RecordingSinks;
using codedrop::test::ScriptedPrompt;
using codedrop::test::wait_until;

class TransferEngineTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        codedrop::test::init_logging();
    }

    void TearDown() override {
        if (receiver) {
            receiver->stop();
        }
    }

    // Starts the receiving engine on a free loopback port with a known code
    void start_receiver(ConfirmationPrompt& prompt, bool rotate_on_text = false) {
        EngineConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.rotate_on_text = rotate_on_text;
        receiver = std::make_unique<TransferEngine>(config,
            Collaborators{receiver_errors, prompt, receiver_sinks, receiver_sinks}, "123456");
        ASSERT_TRUE(receiver->start());
        ASSERT_TRUE(receiver->listener().wait_for_state(ListenerState::State::LISTENING, std::chrono::seconds(5)));
        port = receiver->listener().local_port();
    }

    // Sending engine dialing the receiver. Its own listener is never started.
    std::unique_ptr<TransferEngine> make_sender() {
        EngineConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        config.remote_port = port;
        return std::make_unique<TransferEngine>(config,
            Collaborators{sender_errors, sender_prompt, sender_sinks, sender_sinks});
    }

    codedrop::test::TempDir temp_dir;
    RecordingErrorSink receiver_errors;
    RecordingSinks receiver_sinks;
    RecordingErrorSink sender_errors;
    RecordingSinks sender_sinks;
    ScriptedPrompt sender_prompt;
    std::unique_ptr<TransferEngine> receiver;
    uint16_t port{0};
};

TEST_F(TransferEngineTest, TextIsDeliveredWithoutRotation) {
    ScriptedPrompt prompt;
    start_receiver(prompt);
    auto sender = make_sender();

    EXPECT_TRUE(sender->send_text("127.0.0.1", "123456", "hello from the other desk"));

    ASSERT_TRUE(wait_until([this]() { return receiver_sinks.texts().size() == 1; }));
    EXPECT_EQ(receiver_sinks.texts()[0], "hello from the other desk");
    EXPECT_EQ(receiver->current_code(), "123456");
    EXPECT_EQ(receiver_errors.count(), 0u);
}

TEST_F(TransferEngineTest, TextRotatesWhenConfigured) {
    ScriptedPrompt prompt;
    start_receiver(prompt, true);
    auto sender = make_sender();

    EXPECT_TRUE(sender->send_text("127.0.0.1", "123456", "rotate"));
    ASSERT_TRUE(wait_until([this]() { return receiver->current_code() != "123456"; }));
}

TEST_F(TransferEngineTest, FileIsDeliveredAndCodeRotates) {
    auto destination = temp_dir.path() / "received.bin";
    ScriptedPrompt prompt(ConfirmationDecision{true, destination});
    start_receiver(prompt);

    std::vector<std::string> announced;
    receiver->code_authority().subscribe([&announced](const std::string& code) { announced.push_back(code); });

    const std::string payload = codedrop::test::make_payload(204800);
    auto source = temp_dir.path() / "source.bin";
    codedrop::test::write_file(source, payload);

    auto sender = make_sender();
    EXPECT_TRUE(sender->send_file("127.0.0.1", "123456", source));

    ASSERT_TRUE(wait_until([this]() { return receiver_sinks.completed_files().size() == 1; }));
    EXPECT_EQ(receiver_sinks.completed_files()[0], destination);
    EXPECT_EQ(codedrop::test::read_file(destination), payload);
    EXPECT_EQ(receiver_sinks.update_count(), 25u);
    EXPECT_NE(receiver->current_code(), "123456");
    ASSERT_EQ(announced.size(), 1u);
    EXPECT_EQ(announced[0], receiver->current_code());

    ASSERT_EQ(prompt.offers().size(), 1u);
    EXPECT_EQ(prompt.offers()[0].filename, "source.bin");
    EXPECT_EQ(prompt.offers()[0].size, payload.size());
}

TEST_F(TransferEngineTest, WrongCodeIsDroppedSilently) {
    auto destination = temp_dir.path() / "never.bin";
    ScriptedPrompt prompt(ConfirmationDecision{true, destination});
    start_receiver(prompt);
    auto sender = make_sender();

    // The sender cannot tell a mismatch from a delivery
    EXPECT_TRUE(sender->send_text("127.0.0.1", "654321", "should not arrive"));
    ASSERT_TRUE(wait_until([this]() { return receiver->listener().sessions_served() == 1; }));

    EXPECT_TRUE(receiver_sinks.texts().empty());
    EXPECT_TRUE(prompt.offers().empty());
    EXPECT_EQ(receiver_errors.count(), 0u);
    EXPECT_EQ(receiver->current_code(), "123456");
}

TEST_F(TransferEngineTest, RejectedFileLeavesNothingBehind) {
    auto destination = temp_dir.path() / "rejected.bin";
    ScriptedPrompt prompt(ConfirmationDecision{false, destination});
    start_receiver(prompt);

    auto source = temp_dir.path() / "offer.txt";
    codedrop::test::write_file(source, "not wanted");
    auto sender = make_sender();
    sender->send_file("127.0.0.1", "123456", source);

    ASSERT_TRUE(wait_until([this]() { return receiver->listener().sessions_served() == 1; }));
    EXPECT_FALSE(std::filesystem::exists(destination));
    EXPECT_EQ(receiver->current_code(), "123456");
}

TEST_F(TransferEngineTest, MissingFileIsReportedToSender) {
    ScriptedPrompt prompt;
    start_receiver(prompt);
    auto sender = make_sender();

    EXPECT_FALSE(sender->send_file("127.0.0.1", "123456", temp_dir.path() / "missing.bin"));

    auto errors = sender_errors.entries();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::FILE_NOT_FOUND);
    EXPECT_EQ(receiver->listener().sessions_served(), 0u);
}

TEST_F(TransferEngineTest, UnreachablePeerIsConnectError) {
    ScriptedPrompt prompt;
    start_receiver(prompt);
    auto sender = make_sender();
    receiver->stop();

    EXPECT_FALSE(sender->send_text("127.0.0.1", "123456", "anyone there?"));
    auto errors = sender_errors.entries();
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0].kind, ErrorKind::CONNECT);
}

TEST_F(TransferEngineTest, AsyncSendsCompleteInBackground) {
    ScriptedPrompt prompt;
    start_receiver(prompt);
    auto sender = make_sender();

    auto result = sender->send_text_async("127.0.0.1", "123456", "async hello");
    ASSERT_EQ(result.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(result.get());
    ASSERT_TRUE(wait_until([this]() { return receiver_sinks.texts().size() == 1; }));
}

TEST_F(TransferEngineTest, SecondConnectionWaitsForConfirmedSession) {
    HeldPrompt prompt;
    start_receiver(prompt);

    auto source = temp_dir.path() / "first.bin";
    codedrop::test::write_file(source, codedrop::test::make_payload(10000));
    auto first_sender = make_sender();
    auto second_sender = make_sender();

    auto file_sent = first_sender->send_file_async("127.0.0.1", "123456", source);
    ASSERT_TRUE(wait_until([&prompt]() { return prompt.offer_count() == 1; }));

    auto text_sent = second_sender->send_text_async("127.0.0.1", "123456", "queued");
    std::this_thread::sleep_for(std::chrono::milliseconds(300));
    EXPECT_TRUE(receiver_sinks.texts().empty());

    auto destination = temp_dir.path() / "first_copy.bin";
    ASSERT_TRUE(prompt.release(ConfirmationDecision{true, destination}));

    EXPECT_TRUE(file_sent.get());
    EXPECT_TRUE(text_sent.get());
    ASSERT_TRUE(wait_until([this]() { return receiver_sinks.texts().size() == 1; }));
    EXPECT_EQ(receiver_sinks.texts()[0], "queued");
    EXPECT_EQ(std::filesystem::file_size(destination), 10000u);
    EXPECT_EQ(receiver->listener().sessions_served(), 2u);
}

TEST_F(TransferEngineTest, StopAbandonsPendingConfirmation) {
    HeldPrompt prompt;
    start_receiver(prompt);

    auto source = temp_dir.path() / "pending.bin";
    codedrop::test::write_file(source, "pending");
    auto sender = make_sender();
    auto sent = sender->send_file_async("127.0.0.1", "123456", source);
    ASSERT_TRUE(wait_until([&prompt]() { return prompt.offer_count() == 1; }));

    auto start = std::chrono::steady_clock::now();
    receiver->stop();
    EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(2));
    EXPECT_EQ(receiver->listener().get_state(), ListenerState::State::STOPPED);
    EXPECT_EQ(receiver_errors.count(), 0u);
    sent.wait();
}

TEST_F(TransferEngineTest, OccupiedPortEndsInFatalBindError) {
    boost::asio::io_context io_context;
    boost::asio::ip::tcp::acceptor blocker(io_context,
        boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));

    EngineConfig config;
    config.bind_address = "127.0.0.1";
    config.port = blocker.local_endpoint().port();
    config.retry_policy.max_attempts = 2;
    config.retry_policy.initial_backoff = std::chrono::milliseconds(10);
    ScriptedPrompt prompt;
    receiver = std::make_unique<TransferEngine>(config,
        Collaborators{receiver_errors, prompt, receiver_sinks, receiver_sinks});

    ASSERT_TRUE(receiver->start());
    ASSERT_TRUE(receiver->listener().wait_for_state(ListenerState::State::STOPPED, std::chrono::seconds(5)));

    auto errors = receiver_errors.entries();
    ASSERT_EQ(errors.size(), 2u);
    EXPECT_FALSE(errors[0].fatal);
    EXPECT_TRUE(errors[1].fatal);
    EXPECT_EQ(errors[1].kind, ErrorKind::BIND);
}
