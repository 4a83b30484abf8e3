#include "transfer/protocol_framer.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/asio/ip/tcp.hpp>
#include <boost/log/trivial.hpp>
#include <cctype>
#include <filesystem>
#include <iterator>
#include <limits>

namespace codedrop {
namespace transfer {

//==============================================
// ENCODING
//==============================================

std::size_t ProtocolFramer::write_text_handshake(std::ostream& output, const std::string& code) {
  std::size_t total_bytes = 0;
  total_bytes += write_token(output, code);
  total_bytes += write_token(output, TEXT_TOKEN);
  BOOST_LOG_TRIVIAL(debug) << "Protocol framer: Wrote TEXT handshake, " << total_bytes << " bytes";
  return total_bytes;
}

std::size_t ProtocolFramer::write_file_handshake(std::ostream& output, const std::string& code,
                                                 const FileHeader& header) {
  std::size_t total_bytes = 0;
  total_bytes += write_token(output, code);
  total_bytes += write_token(output, FILE_TOKEN);
  total_bytes += write_token(output, header.filename);
  total_bytes += write_token(output, std::to_string(header.size));
  BOOST_LOG_TRIVIAL(debug) << "Protocol framer: Wrote FILE handshake for " << header.filename
                           << " (" << header.size << " bytes), " << total_bytes << " bytes";
  return total_bytes;
}

std::size_t ProtocolFramer::write_token(std::ostream& output, const std::string& token) {
  if (token.find(DELIMITER) != std::string::npos) {
    BOOST_LOG_TRIVIAL(error) << "Protocol framer: Token contains a delimiter byte";
    throw ProtocolError("Token must not contain a 0x00 byte");
  }
  if (token.size() > MAX_TOKEN_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Protocol framer: Token of " << token.size() << " bytes exceeds limit";
    throw ProtocolError("Token exceeds " + std::to_string(MAX_TOKEN_LENGTH) + " bytes");
  }

  output.write(token.data(), static_cast<std::streamsize>(token.size()));
  output.put(DELIMITER);
  if (!output) {
    BOOST_LOG_TRIVIAL(error) << "Protocol framer: Failed to write token to output stream";
    throw IOError("Failed to write handshake token");
  }
  return token.size() + 1;
}


//==============================================
// DECODING
//==============================================

std::string ProtocolFramer::read_token(std::istream& input) {
  std::string token;
  char c;

  // One byte at a time so nothing past the delimiter is consumed
  while (input.get(c)) {
    if (c == DELIMITER) {
      BOOST_LOG_TRIVIAL(trace) << "Protocol framer: Read token of " << token.size() << " bytes";
      return token;
    }
    if (token.size() == MAX_TOKEN_LENGTH) {
      BOOST_LOG_TRIVIAL(error) << "Protocol framer: Token exceeds " << MAX_TOKEN_LENGTH << " bytes";
      throw ProtocolError("Token exceeds " + std::to_string(MAX_TOKEN_LENGTH) + " bytes");
    }
    token.push_back(c);
  }

  if (input.bad()) {
    BOOST_LOG_TRIVIAL(error) << "Protocol framer: Stream failure while reading token";
    throw IOError("Stream failure while reading token");
  }
  check_transport(input, "handshake token");

  BOOST_LOG_TRIVIAL(trace) << "Protocol framer: Token ended by end-of-stream after " << token.size() << " bytes";
  return token;
}

TransferType ProtocolFramer::read_type(std::istream& input, std::string& raw_token) {
  raw_token = read_token(input);
  return parse_type(raw_token);
}

FileHeader ProtocolFramer::read_file_header(std::istream& input) {
  FileHeader header;
  header.filename = read_token(input);
  header.size = parse_size(read_token(input));
  BOOST_LOG_TRIVIAL(debug) << "Protocol framer: Read file header " << header.filename
                           << " (" << header.size << " bytes)";
  return header;
}

std::string ProtocolFramer::read_text(std::istream& input) {
  std::string text((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
  check_transport(input, "text payload");

  // Tolerate senders that terminate the payload with a delimiter
  if (!text.empty() && text.back() == DELIMITER) {
    text.pop_back();
  }

  BOOST_LOG_TRIVIAL(debug) << "Protocol framer: Read text payload of " << text.size() << " bytes";
  return text;
}


//==============================================
// UTILITY METHODS
//==============================================

TransferType ProtocolFramer::parse_type(const std::string& token) {
  if (token == FILE_TOKEN) {
    return TransferType::FILE;
  }
  if (token == TEXT_TOKEN) {
    return TransferType::TEXT;
  }
  return TransferType::UNKNOWN;
}

const char* ProtocolFramer::type_to_string(TransferType type) {
  switch (type) {
    case TransferType::FILE: return FILE_TOKEN;
    case TransferType::TEXT: return TEXT_TOKEN;
    default: return "UNKNOWN";
  }
}

std::uint64_t ProtocolFramer::parse_size(const std::string& token) {
  if (token.empty()) {
    throw ProtocolError("Empty size token");
  }

  std::uint64_t size = 0;
  for (char c : token) {
    if (!std::isdigit(static_cast<unsigned char>(c))) {
      throw ProtocolError("Size token is not a decimal number: " + token);
    }
    std::uint64_t digit = static_cast<std::uint64_t>(c - '0');
    if (size > (std::numeric_limits<std::uint64_t>::max() - digit) / 10) {
      throw ProtocolError("Size token overflows: " + token);
    }
    size = size * 10 + digit;
  }
  return size;
}

void ProtocolFramer::check_transport(std::istream& input, const std::string& context) {
  // A socket stream reports a failed receive as end-of-stream and keeps the cause in error()
  auto* socket_stream = dynamic_cast<boost::asio::ip::tcp::iostream*>(&input);
  if (!socket_stream) {
    return;
  }
  const boost::system::error_code& ec = socket_stream->error();
  if (ec && ec != boost::asio::error::eof) {
    BOOST_LOG_TRIVIAL(error) << "Protocol framer: Connection failed while reading " << context << ": " << ec.message();
    throw IOError("Connection failed while reading " + context + ": " + ec.message());
  }
}

std::string ProtocolFramer::sanitize_filename(const std::string& filename) {
  std::string normalized = filename;
  for (char& c : normalized) {
    if (c == '\\') {
      c = '/';
    }
  }

  std::string name = std::filesystem::path(normalized).filename().string();
  if (name.empty() || name == "." || name == "..") {
    return "received_file";
  }
  return name;
}

} // namespace transfer
} // namespace codedrop
