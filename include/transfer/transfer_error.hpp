#ifndef CODEDROP_TRANSFER_ERROR_HPP
#define CODEDROP_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace codedrop {
namespace transfer {

enum class ErrorKind {
    BIND,
    CONNECT,
    PROTOCOL,
    AUTH,
    IO,
    FILE_NOT_FOUND
};

inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::BIND: return "Bind error";
        case ErrorKind::CONNECT: return "Connect error";
        case ErrorKind::PROTOCOL: return "Protocol error";
        case ErrorKind::AUTH: return "Authorization error";
        case ErrorKind::IO: return "I/O error";
        case ErrorKind::FILE_NOT_FOUND: return "File not found";
        default: return "Undefined error";
    }
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(std::string(error_kind_to_string(kind)) + ": " + message)
        , kind_(kind) {}

    ErrorKind kind() const { return kind_; }

private:
    ErrorKind kind_;
};

// Port unavailable or not permitted. Fatal once the listener gave up retrying.
class BindError : public TransferError {
public:
    explicit BindError(const std::string& message, bool fatal = false)
        : TransferError(ErrorKind::BIND, message)
        , fatal_(fatal) {}

    bool is_fatal() const { return fatal_; }

private:
    bool fatal_;
};

class ConnectError : public TransferError {
public:
    explicit ConnectError(const std::string& message)
        : TransferError(ErrorKind::CONNECT, message) {}
};

class ProtocolError : public TransferError {
public:
    explicit ProtocolError(const std::string& message)
        : TransferError(ErrorKind::PROTOCOL, message) {}
};

// Code mismatch. Never reaches an ErrorSink.
class AuthError : public TransferError {
public:
    explicit AuthError(const std::string& message)
        : TransferError(ErrorKind::AUTH, message) {}
};

class IOError : public TransferError {
public:
    explicit IOError(const std::string& message)
        : TransferError(ErrorKind::IO, message) {}
};

class FileNotFoundError : public TransferError {
public:
    explicit FileNotFoundError(const std::string& message)
        : TransferError(ErrorKind::FILE_NOT_FOUND, message) {}
};

} // namespace transfer
} // namespace codedrop

#endif // CODEDROP_TRANSFER_ERROR_HPP
