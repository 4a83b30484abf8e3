#ifndef CODEDROP_TRANSFER_PROTOCOL_FRAMER_HPP
#define CODEDROP_TRANSFER_PROTOCOL_FRAMER_HPP

#include <cstdint>
#include <iostream>
#include <string>

namespace codedrop {
namespace transfer {

// Type token following the code in every handshake
enum class TransferType : uint8_t {
    FILE = 0,
    TEXT = 1,
    UNKNOWN = 2
};

// Header of a FILE handshake, consumed once by the file receiver
struct FileHeader {
    std::string filename;
    std::uint64_t size{0};
};

/*
 * Wire format, tokens separated by a single 0x00 byte:
 *   CODE\0TYPE\0
 *   TYPE == FILE: FILENAME\0SIZE\0 followed by exactly SIZE raw bytes
 *   TYPE == TEXT: raw UTF-8 payload up to end-of-stream
 */
class ProtocolFramer {
public:
  static constexpr char DELIMITER = '\0';
  static constexpr std::size_t MAX_TOKEN_LENGTH = 4096;
  static constexpr std::size_t CHUNK_SIZE = 8192;
  static constexpr const char* FILE_TOKEN = "FILE";
  static constexpr const char* TEXT_TOKEN = "TEXT";


  // ---- ENCODING ----
  // Writes CODE\0TEXT\0, returns bytes written
  static std::size_t write_text_handshake(std::ostream& output, const std::string& code);
  // Writes CODE\0FILE\0FILENAME\0SIZE\0, returns bytes written
  static std::size_t write_file_handshake(std::ostream& output, const std::string& code,
                                          const FileHeader& header);


  // ---- DECODING ----
  // Blocks until a delimiter or end-of-stream. The delimiter is consumed, nothing after it is.
  static std::string read_token(std::istream& input);
  static TransferType read_type(std::istream& input, std::string& raw_token);
  static FileHeader read_file_header(std::istream& input);
  // Reads the remainder of the stream as a TEXT payload
  static std::string read_text(std::istream& input);


  // ---- UTILITY METHODS ----
  static TransferType parse_type(const std::string& token);
  static const char* type_to_string(TransferType type);
  static std::uint64_t parse_size(const std::string& token);
  // Strips directory components so a received name can't escape the target directory
  static std::string sanitize_filename(const std::string& filename);
  // Throws IOError when a socket stream ended on a transport error rather than a clean close
  static void check_transport(std::istream& input, const std::string& context);

private:
  // ---- STREAM OPERATIONS ----
  static std::size_t write_token(std::ostream& output, const std::string& token);
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_PROTOCOL_FRAMER_HPP
