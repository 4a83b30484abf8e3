#include "transfer/sender.hpp"
#include "transfer/code_authority.hpp"
#include "transfer/protocol_framer.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <fstream>
#include <sstream>
#include <vector>

namespace codedrop {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Sender::Sender(uint16_t remote_port)
  : remote_port_(remote_port) {
  BOOST_LOG_TRIVIAL(debug) << "Sender: Initialized for remote port " << remote_port_;
}


//==============================================
// OUTGOING TRANSFERS
//==============================================

void Sender::send_text(const std::string& host, const std::string& code, const std::string& text) {
  validate_code(code);

  std::ostringstream message;
  ProtocolFramer::write_text_handshake(message, code);
  message.write(text.data(), static_cast<std::streamsize>(text.size()));
  const std::string bytes = message.str();

  auto socket = connect(host);
  write_all(socket, bytes.data(), bytes.size());
  close(socket);

  BOOST_LOG_TRIVIAL(info) << "Sender: Written " << text.size() << " bytes of text to " << host;
}

std::uint64_t Sender::send_file(const std::string& host, const std::string& code,
                                const std::filesystem::path& path, ProgressCallback on_progress) {
  validate_code(code);

  // Open the file before touching the network so a missing file is reported on its own
  std::error_code fs_error;
  if (!std::filesystem::is_regular_file(path, fs_error)) {
    BOOST_LOG_TRIVIAL(error) << "Sender: File not found: " << path.string();
    throw FileNotFoundError(path.string());
  }
  std::uint64_t size = std::filesystem::file_size(path, fs_error);
  if (fs_error) {
    throw FileNotFoundError(path.string() + ": " + fs_error.message());
  }
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Cannot open file: " << path.string();
    throw FileNotFoundError(path.string());
  }

  FileHeader header;
  header.filename = path.filename().string();
  header.size = size;

  std::ostringstream handshake;
  ProtocolFramer::write_file_handshake(handshake, code, header);
  const std::string handshake_bytes = handshake.str();

  auto socket = connect(host);
  write_all(socket, handshake_bytes.data(), handshake_bytes.size());
  std::uint64_t bytes_sent = send_stream(socket, input, size, on_progress);
  close(socket);

  BOOST_LOG_TRIVIAL(info) << "Sender: Written " << bytes_sent << " bytes of " << header.filename << " to " << host;
  return bytes_sent;
}


//==============================================
// CONNECTION INITIATION
//==============================================

boost::asio::ip::tcp::socket Sender::connect(const std::string& host) {
  boost::asio::ip::tcp::socket socket(io_context_);

  try {
    BOOST_LOG_TRIVIAL(info) << "Sender: Connecting to " << host << ":" << remote_port_;

    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(host, std::to_string(remote_port_));

    boost::asio::connect(socket, endpoints);
  }
  catch (const boost::system::system_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Connection failed: " << e.what();
    throw ConnectError(host + ":" + std::to_string(remote_port_) + ": " + e.code().message());
  }

  BOOST_LOG_TRIVIAL(debug) << "Sender: Connected to " << host << ":" << remote_port_;
  return socket;
}


//==============================================
// OUTGOING DATA STREAM PROCESSING
//==============================================

void Sender::write_all(boost::asio::ip::tcp::socket& socket, const char* data, std::size_t size) {
  boost::system::error_code ec;
  std::size_t bytes_written = boost::asio::write(socket, boost::asio::buffer(data, size),
                                                 boost::asio::transfer_exactly(size), ec);
  if (ec || bytes_written != size) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Write error: " << ec.message();
    throw IOError("Failed to write to socket: " + ec.message());
  }
}

std::uint64_t Sender::send_stream(boost::asio::ip::tcp::socket& socket, std::istream& input,
                                  std::uint64_t total_size, const ProgressCallback& on_progress) {
  std::vector<char> buffer(ProtocolFramer::CHUNK_SIZE);
  std::uint64_t total_bytes_sent = 0;

  while (total_bytes_sent < total_size) {
    std::uint64_t remaining = total_size - total_bytes_sent;
    std::size_t chunk_size = static_cast<std::size_t>(
      std::min<std::uint64_t>(ProtocolFramer::CHUNK_SIZE, remaining));

    input.read(buffer.data(), static_cast<std::streamsize>(chunk_size));
    std::size_t bytes_read = static_cast<std::size_t>(input.gcount());
    if (bytes_read == 0) {
      break;
    }

    write_all(socket, buffer.data(), bytes_read);
    total_bytes_sent += bytes_read;
    BOOST_LOG_TRIVIAL(trace) << "Sender: Sent " << total_bytes_sent << " / " << total_size;

    if (on_progress) {
      on_progress(total_bytes_sent, total_size);
    }
  }

  if (total_bytes_sent != total_size) {
    // The file shrank while it was being sent
    BOOST_LOG_TRIVIAL(error) << "Sender: Sent " << total_bytes_sent << " of " << total_size << " bytes";
    throw IOError("File ended after " + std::to_string(total_bytes_sent) + " of " +
                  std::to_string(total_size) + " bytes");
  }

  return total_bytes_sent;
}

void Sender::close(boost::asio::ip::tcp::socket& socket) {
  boost::system::error_code ec;
  socket.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Sender: Socket shutdown: " << ec.message();
  }
  socket.close(ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Socket close error: " << ec.message();
  }
}

void Sender::validate_code(const std::string& code) {
  if (!CodeAuthority::is_valid_code(code)) {
    BOOST_LOG_TRIVIAL(error) << "Sender: Refusing to send with malformed code";
    throw ProtocolError("The verification code is 6 digits long");
  }
}

} // namespace transfer
} // namespace codedrop
