#ifndef CODEDROP_TRANSFER_SENDER_HPP
#define CODEDROP_TRANSFER_SENDER_HPP

#include <boost/asio.hpp>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include "transfer/engine_config.hpp"

namespace codedrop {
namespace transfer {

class Sender {
public:
  // Called after every chunk with (bytes_sent, total_size)
  using ProgressCallback = std::function<void(std::uint64_t, std::uint64_t)>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Sender(uint16_t remote_port = DEFAULT_PORT);


  // ---- OUTGOING TRANSFERS ----
  // Each call opens a fresh connection. Throws TransferError subclasses.
  // The receiver strips one trailing 0x00, so text that ends in 0x00 arrives one byte shorter
  void send_text(const std::string& host, const std::string& code, const std::string& text);
  // Returns the number of payload bytes written
  std::uint64_t send_file(const std::string& host, const std::string& code,
                          const std::filesystem::path& path, ProgressCallback on_progress = nullptr);

private:
  // ---- PARAMETERS ----
  const uint16_t remote_port_;
  boost::asio::io_context io_context_;


  // ---- CONNECTION INITIATION ----
  // Resolves and connects, throws ConnectError
  boost::asio::ip::tcp::socket connect(const std::string& host);


  // ---- OUTGOING DATA STREAM PROCESSING ----
  void write_all(boost::asio::ip::tcp::socket& socket, const char* data, std::size_t size);
  // Streams exactly total_size bytes in CHUNK_SIZE pieces
  std::uint64_t send_stream(boost::asio::ip::tcp::socket& socket, std::istream& input,
                            std::uint64_t total_size, const ProgressCallback& on_progress);
  void close(boost::asio::ip::tcp::socket& socket);
  static void validate_code(const std::string& code);
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_SENDER_HPP
