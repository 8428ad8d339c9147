#pragma once
#include <stdexcept>
#include <string>

namespace zxtap {

enum class ErrorKind {
    InvalidName,      // Name is not plain printable ASCII or does not fit
    SourceReadError,  // Input payload could not be read completely
    AddressOverflow,  // Load address + payload length runs past 0xFFFF
    BlockTooLarge,    // Block content would exceed MAX_BLOCK_CONTENT
    SinkWriteError    // Output stream rejected a write
};

// Every conversion failure is reported through this exception.
class Error : public std::runtime_error {
    ErrorKind errorKind;

public:
    Error(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), errorKind(kind) {}

    ErrorKind kind() const noexcept { return errorKind; }
};

const char* to_string(ErrorKind kind) noexcept;

} // namespace zxtap
