#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <future>
#include <string>
#include <thread>
#include <vector>
#include "test_utils.hpp"
#include "transfer/protocol_framer.hpp"
#include "transfer/sender.hpp"
#include "transfer/transfer_error.hpp"

using namespace codedrop::transfer;
using namespace std::string_literals;

// Accepts one connection on a loopback port and collects everything the sender writes
class SenderTest : public ::testing::Test {
protected:
    void SetUp() override {
        acceptor = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context,
            boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0));
        port = acceptor->local_endpoint().port();
    }

    std::future<std::string> receive_one() {
        return std::async(std::launch::async, [this]() {
            boost::asio::ip::tcp::socket socket(io_context);
            acceptor->accept(socket);

            std::string data;
            std::vector<char> buffer(4096);
            boost::system::error_code ec;
            while (true) {
                std::size_t n = socket.read_some(boost::asio::buffer(buffer), ec);
                if (ec) {
                    break;
                }
                data.append(buffer.data(), n);
            }
            return data;
        });
    }

    boost::asio::io_context io_context;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor;
    uint16_t port{0};
    codedrop::test::TempDir temp_dir;
};

TEST_F(SenderTest, SendTextWritesHandshakeAndPayload) {
    auto received = receive_one();
    Sender sender(port);

    sender.send_text("127.0.0.1", "012345", "hello peer");
    EXPECT_EQ(received.get(), "012345\0TEXT\0hello peer"s);
}

TEST_F(SenderTest, TrailingNulInTextIsSentVerbatim) {
    auto received = receive_one();
    Sender sender(port);

    // Sent as is; the receiving framer drops this last 0x00
    sender.send_text("127.0.0.1", "012345", "ends\0"s);
    EXPECT_EQ(received.get(), "012345\0TEXT\0ends\0"s);
}

TEST_F(SenderTest, SendFileWritesHeaderAndExactBytes) {
    const std::string payload = codedrop::test::make_payload(3 * ProtocolFramer::CHUNK_SIZE + 17);
    auto path = temp_dir.path() / "data.bin";
    codedrop::test::write_file(path, payload);

    auto received = receive_one();
    Sender sender(port);
    std::vector<std::uint64_t> progress;
    std::uint64_t sent = sender.send_file("127.0.0.1", "654321", path,
        [&progress](std::uint64_t bytes_sent, std::uint64_t) { progress.push_back(bytes_sent); });

    EXPECT_EQ(sent, payload.size());
    EXPECT_EQ(received.get(), "654321\0FILE\0data.bin\0"s + std::to_string(payload.size()) + '\0' + payload);
    EXPECT_EQ(progress, (std::vector<std::uint64_t>{8192, 16384, 24576, payload.size()}));
}

TEST_F(SenderTest, SendEmptyFile) {
    auto path = temp_dir.path() / "empty.txt";
    codedrop::test::write_file(path, "");

    auto received = receive_one();
    Sender sender(port);
    EXPECT_EQ(sender.send_file("127.0.0.1", "000001", path), 0u);
    EXPECT_EQ(received.get(), "000001\0FILE\0empty.txt\0" "0\0"s);
}

TEST_F(SenderTest, FilenameIsBaseName) {
    std::filesystem::create_directories(temp_dir.path() / "nested");
    auto path = temp_dir.path() / "nested" / "inner.txt";
    codedrop::test::write_file(path, "x");

    auto received = receive_one();
    Sender sender(port);
    sender.send_file("127.0.0.1", "111111", path);
    EXPECT_EQ(received.get(), "111111\0FILE\0inner.txt\0" "1\0x"s);
}

TEST_F(SenderTest, MissingFileFailsBeforeConnecting) {
    Sender sender(port);
    EXPECT_THROW(sender.send_file("127.0.0.1", "123456", temp_dir.path() / "nope.bin"), FileNotFoundError);

    // Nothing connected to the acceptor
    acceptor->non_blocking(true);
    boost::asio::ip::tcp::socket socket(io_context);
    boost::system::error_code ec;
    acceptor->accept(socket, ec);
    EXPECT_EQ(ec, boost::asio::error::would_block);
}

TEST_F(SenderTest, DirectoryIsNotAFile) {
    Sender sender(port);
    EXPECT_THROW(sender.send_file("127.0.0.1", "123456", temp_dir.path()), FileNotFoundError);
}

TEST_F(SenderTest, MalformedCodeIsRejected) {
    Sender sender(port);
    EXPECT_THROW(sender.send_text("127.0.0.1", "12345", "hi"), ProtocolError);
    EXPECT_THROW(sender.send_text("127.0.0.1", "abcdef", "hi"), ProtocolError);
}

TEST_F(SenderTest, RefusedConnectionIsConnectError) {
    acceptor->close();
    Sender sender(port);
    try {
        sender.send_text("127.0.0.1", "123456", "hi");
        FAIL() << "Expected ConnectError";
    } catch (const ConnectError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::CONNECT);
    }
}
