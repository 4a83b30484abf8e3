#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include "test_utils.hpp"
#include "transfer/protocol_framer.hpp"
#include "transfer/transfer_error.hpp"

using namespace codedrop::transfer;
using namespace std::string_literals;

class ProtocolFramerTest : public ::testing::Test {
protected:
    std::stringstream stream{std::ios::in | std::ios::out | std::ios::binary};
};

TEST_F(ProtocolFramerTest, TextHandshakeBytes) {
    std::size_t written = ProtocolFramer::write_text_handshake(stream, "012345");
    EXPECT_EQ(stream.str(), "012345\0TEXT\0"s);
    EXPECT_EQ(written, stream.str().size());
}

TEST_F(ProtocolFramerTest, FileHandshakeBytes) {
    FileHeader header{"report.pdf", 1048576};
    std::size_t written = ProtocolFramer::write_file_handshake(stream, "999999", header);
    EXPECT_EQ(stream.str(), "999999\0FILE\0report.pdf\0" "1048576\0"s);
    EXPECT_EQ(written, stream.str().size());
}

TEST_F(ProtocolFramerTest, ReadTokenConsumesOnlyUpToDelimiter) {
    stream << "123456"s << '\0' << "TEXT"s << '\0' << "rest";
    EXPECT_EQ(ProtocolFramer::read_token(stream), "123456");
    EXPECT_EQ(ProtocolFramer::read_token(stream), "TEXT");
    EXPECT_EQ(stream.get(), 'r');
}

TEST_F(ProtocolFramerTest, ReadTokenStopsAtEndOfStream) {
    stream << "partial";
    EXPECT_EQ(ProtocolFramer::read_token(stream), "partial");
    EXPECT_EQ(ProtocolFramer::read_token(stream), "");
}

TEST_F(ProtocolFramerTest, OversizedTokenIsProtocolError) {
    stream << std::string(ProtocolFramer::MAX_TOKEN_LENGTH + 1, 'x') << '\0';
    EXPECT_THROW(ProtocolFramer::read_token(stream), ProtocolError);
}

TEST_F(ProtocolFramerTest, TokenAtLimitIsAccepted) {
    std::string token(ProtocolFramer::MAX_TOKEN_LENGTH, 'y');
    stream << token << '\0';
    EXPECT_EQ(ProtocolFramer::read_token(stream), token);
}

TEST_F(ProtocolFramerTest, WriteRejectsBadTokens) {
    FileHeader header{"bad\0name"s, 1};
    EXPECT_THROW(ProtocolFramer::write_file_handshake(stream, "123456", header), ProtocolError);

    header.filename = std::string(ProtocolFramer::MAX_TOKEN_LENGTH + 1, 'n');
    EXPECT_THROW(ProtocolFramer::write_file_handshake(stream, "123456", header), ProtocolError);
}

TEST_F(ProtocolFramerTest, ReadFileHeader) {
    stream << "photo.jpg"s << '\0' << "2048"s << '\0' << "payload";
    FileHeader header = ProtocolFramer::read_file_header(stream);
    EXPECT_EQ(header.filename, "photo.jpg");
    EXPECT_EQ(header.size, 2048u);
    EXPECT_EQ(stream.get(), 'p');
}

TEST_F(ProtocolFramerTest, ResetBeforeSizeIsIoError) {
    codedrop::test::ResetConnection connection("photo.jpg\0"s);
    EXPECT_THROW(ProtocolFramer::read_file_header(connection.stream()), IOError);
}

TEST_F(ProtocolFramerTest, CleanEndOfStreamIsNotTransportError) {
    stream << "tail";
    EXPECT_EQ(ProtocolFramer::read_text(stream), "tail");
    EXPECT_NO_THROW(ProtocolFramer::check_transport(stream, "text payload"));
}

TEST_F(ProtocolFramerTest, ReadTypeKeepsRawToken) {
    stream << "PING"s << '\0';
    std::string raw;
    EXPECT_EQ(ProtocolFramer::read_type(stream, raw), TransferType::UNKNOWN);
    EXPECT_EQ(raw, "PING");
}

TEST_F(ProtocolFramerTest, ParseType) {
    EXPECT_EQ(ProtocolFramer::parse_type("FILE"), TransferType::FILE);
    EXPECT_EQ(ProtocolFramer::parse_type("TEXT"), TransferType::TEXT);
    EXPECT_EQ(ProtocolFramer::parse_type("text"), TransferType::UNKNOWN);
    EXPECT_EQ(ProtocolFramer::parse_type(""), TransferType::UNKNOWN);
    EXPECT_STREQ(ProtocolFramer::type_to_string(TransferType::FILE), "FILE");
}

TEST_F(ProtocolFramerTest, ParseSize) {
    EXPECT_EQ(ProtocolFramer::parse_size("0"), 0u);
    EXPECT_EQ(ProtocolFramer::parse_size("18446744073709551615"), UINT64_MAX);
    EXPECT_THROW(ProtocolFramer::parse_size(""), ProtocolError);
    EXPECT_THROW(ProtocolFramer::parse_size("12a"), ProtocolError);
    EXPECT_THROW(ProtocolFramer::parse_size("-1"), ProtocolError);
    EXPECT_THROW(ProtocolFramer::parse_size("18446744073709551616"), ProtocolError);
}

TEST_F(ProtocolFramerTest, ReadTextToEndOfStream) {
    stream << "hello\nworld";
    EXPECT_EQ(ProtocolFramer::read_text(stream), "hello\nworld");
}

TEST_F(ProtocolFramerTest, ReadTextStripsOneTrailingDelimiter) {
    stream << "hello"s << '\0';
    EXPECT_EQ(ProtocolFramer::read_text(stream), "hello");

    std::stringstream doubled;
    doubled << "hi"s << '\0' << '\0';
    EXPECT_EQ(ProtocolFramer::read_text(doubled), "hi\0"s);
}

TEST_F(ProtocolFramerTest, ReadTextEmpty) {
    EXPECT_EQ(ProtocolFramer::read_text(stream), "");
}

TEST_F(ProtocolFramerTest, SanitizeFilename) {
    EXPECT_EQ(ProtocolFramer::sanitize_filename("notes.txt"), "notes.txt");
    EXPECT_EQ(ProtocolFramer::sanitize_filename("../../etc/passwd"), "passwd");
    EXPECT_EQ(ProtocolFramer::sanitize_filename("/abs/path/file.bin"), "file.bin");
    EXPECT_EQ(ProtocolFramer::sanitize_filename("C:\\Users\\me\\doc.txt"), "doc.txt");
    EXPECT_EQ(ProtocolFramer::sanitize_filename(""), "received_file");
    EXPECT_EQ(ProtocolFramer::sanitize_filename(".."), "received_file");
    EXPECT_EQ(ProtocolFramer::sanitize_filename("dir/"), "received_file");
}
