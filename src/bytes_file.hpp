#pragma once

#include "tap.hpp"
#include "tap_error.hpp"
#include "block_writer.hpp"
#include <array>
#include <cstdint>
#include <istream>
#include <string_view>
#include <utility>
#include <vector>

namespace zxtap {

// What to do with a name longer than the 10 byte header field
enum class NamePolicy {
    Strict,   // Reject with InvalidName
    Truncate  // Keep the first NAME_LENGTH bytes
};

using TapeName = std::array<uint8_t, NAME_LENGTH>;

/**
 * @brief True if quoting the name as an ASCII string literal would leave it unchanged
 *
 * Accepts printable ASCII (0x20-0x7E) except the quote and backslash characters.
 */
bool isPlainAscii(std::string_view name) noexcept;

/**
 * Validate a name and lay it out in the space padded header field
 * @throws Error(InvalidName)
 */
TapeName encodeName(std::string_view name, NamePolicy policy = NamePolicy::Strict);

/**
 * @brief A machine code file: one bytes header block followed by one data block
 *
 * Instances only come out of build(), so every BytesFile holds a valid name,
 * payload and load address. An instance is written once.
 */
class BytesFile
{
public:
    enum class State {
        Validated,
        Written,
        Failed
    };

    /**
     * Read the payload and validate all parameters
     * @param name Tape name shown by the loader
     * @param source Stream read to its end for the payload
     * @param loadAddress Address the payload is loaded to
     * @throws Error(SourceReadError, InvalidName, AddressOverflow)
     */
    static BytesFile build(std::string_view name, std::istream& source, uint16_t loadAddress,
                           NamePolicy policy = NamePolicy::Strict);

    /**
     * Emit the header block and the data block
     * @throws Error(BlockTooLarge, SinkWriteError) from the writer; the instance is unusable afterwards
     * @throws std::logic_error if the file was already written or a previous write failed
     */
    void writeTo(BlockWriter& writer);

    const TapeName& name() const { return tapeName; }
    const std::vector<uint8_t>& payload() const { return data; }
    uint16_t loadAddress() const { return address; }
    State state() const { return currentState; }

private:
    BytesFile(const TapeName& name, std::vector<uint8_t> payload, uint16_t loadAddress)
        : tapeName(name), data(std::move(payload)), address(loadAddress) {}

    void writeHeader(BlockWriter& writer) const;
    void writeData(BlockWriter& writer) const;

    TapeName tapeName;
    std::vector<uint8_t> data;
    uint16_t address;
    State currentState = State::Validated;
};

} // namespace zxtap
