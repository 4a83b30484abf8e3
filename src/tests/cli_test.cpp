#include <gtest/gtest.h>
#include <chrono>
#include <sstream>
#include <string>
#include "cli/cli.hpp"
#include "test_utils.hpp"

using namespace codedrop::cli;
using namespace codedrop::transfer;

class CLITest : public ::testing::Test {
protected:
    void SetUp() override {
        EngineConfig config;
        config.bind_address = "127.0.0.1";
        config.port = 0;
        engine = std::make_unique<TransferEngine>(config, Collaborators{bridge, bridge, bridge, bridge}, "123456");
        cli = std::make_unique<CLI>(*engine, bridge, download_dir.path(), input, output);
    }

    void TearDown() override {
        cli.reset();
        engine.reset();
    }

    bool printed(const std::string& text) const {
        return output.str().find(text) != std::string::npos;
    }

    codedrop::test::TempDir download_dir;
    ConsoleBridge bridge;
    std::istringstream input;
    std::ostringstream output;
    std::unique_ptr<TransferEngine> engine;
    std::unique_ptr<CLI> cli;
};

TEST_F(CLITest, CodeCommand) {
    EXPECT_TRUE(cli->process_command("code"));
    EXPECT_TRUE(printed("Your code: 123456"));
}

TEST_F(CLITest, HelpAndUnknownCommands) {
    EXPECT_TRUE(cli->process_command("help"));
    EXPECT_TRUE(printed("send-file <host> <code> <path>"));

    EXPECT_TRUE(cli->process_command("dance"));
    EXPECT_TRUE(printed("Unknown command: dance"));
}

TEST_F(CLITest, QuitEndsTheLoop) {
    EXPECT_FALSE(cli->process_command("quit"));
    EXPECT_TRUE(cli->process_command(""));
}

TEST_F(CLITest, SendCommandsValidateArguments) {
    EXPECT_TRUE(cli->process_command("send-text 127.0.0.1"));
    EXPECT_TRUE(printed("Usage: send-text <host> <code> <text...>"));

    EXPECT_TRUE(cli->process_command("send-text 127.0.0.1 12ab56 hello"));
    EXPECT_TRUE(printed("The code must be exactly 6 digits"));

    EXPECT_TRUE(cli->process_command("send-file 127.0.0.1 123456"));
    EXPECT_TRUE(printed("Usage: send-file <host> <code> <path>"));
}

TEST_F(CLITest, AcceptWithoutOffer) {
    EXPECT_TRUE(cli->process_command("accept"));
    EXPECT_TRUE(printed("No file offer is waiting"));
}

TEST_F(CLITest, AcceptUsesDefaultDestination) {
    auto decision = bridge.ask(FileHeader{"../../photo.jpg", 3 * 1024 * 1024});
    cli->drain_events();
    EXPECT_TRUE(printed("Incoming file '../../photo.jpg' (3.0 MiB)"));

    EXPECT_TRUE(cli->process_command("accept"));
    ConfirmationDecision answer = decision.get();
    EXPECT_TRUE(answer.accept);
    ASSERT_TRUE(answer.destination.has_value());
    EXPECT_EQ(*answer.destination, download_dir.path() / "photo.jpg");
}

TEST_F(CLITest, AcceptIntoDirectoryKeepsName) {
    codedrop::test::TempDir other_dir;
    auto decision = bridge.ask(FileHeader{"notes.txt", 12});
    cli->drain_events();

    EXPECT_TRUE(cli->process_command("accept " + other_dir.path().string()));
    ConfirmationDecision answer = decision.get();
    ASSERT_TRUE(answer.destination.has_value());
    EXPECT_EQ(*answer.destination, other_dir.path() / "notes.txt");
}

TEST_F(CLITest, RejectAnswersOffer) {
    auto decision = bridge.ask(FileHeader{"spam.exe", 100});
    cli->drain_events();

    EXPECT_TRUE(cli->process_command("reject"));
    EXPECT_FALSE(decision.get().accept);
    EXPECT_TRUE(printed("File offer rejected"));
}

TEST_F(CLITest, CancelSetsFlag) {
    EXPECT_TRUE(cli->process_command("cancel"));
    EXPECT_TRUE(bridge.cancel_requested());
}

TEST_F(CLITest, EngineEventsArePrinted) {
    bridge.completed(download_dir.path() / "done.bin", std::chrono::duration<double>(2.5));
    bridge.display("hello there");
    bridge.report(FileNotFoundError("/nowhere.bin"));
    engine->code_authority().rotate();
    cli->drain_events();

    EXPECT_TRUE(printed("File has been saved to " + (download_dir.path() / "done.bin").string()));
    EXPECT_TRUE(printed("Time:  2.500 seconds"));
    EXPECT_TRUE(printed("Message received:\nhello there"));
    EXPECT_TRUE(printed("File not found: /nowhere.bin"));
    EXPECT_TRUE(printed("Your new code: " + engine->current_code()));
}

TEST_F(CLITest, RunReadsUntilQuit) {
    input.str("code\nquit\ncode\n");
    cli->run();
    EXPECT_TRUE(printed("codedrop> "));

    // Commands after quit are not executed
    std::string text = output.str();
    std::size_t first = text.find("Your code: 123456");
    ASSERT_NE(first, std::string::npos);
    std::size_t second = text.find("Your code: 123456", first + 1);
    EXPECT_NE(second, std::string::npos);  // greeting plus the code command
    EXPECT_EQ(text.find("Your code: 123456", second + 1), std::string::npos);
}
