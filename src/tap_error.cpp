#include "tap_error.hpp"

namespace zxtap {

const char* to_string(ErrorKind kind) noexcept
{
    switch (kind) {
        case ErrorKind::InvalidName:     return "invalid name";
        case ErrorKind::SourceReadError: return "source read error";
        case ErrorKind::AddressOverflow: return "address overflow";
        case ErrorKind::BlockTooLarge:   return "block too large";
        case ErrorKind::SinkWriteError:  return "sink write error";
    }
    return "unknown error";
}

} // namespace zxtap
