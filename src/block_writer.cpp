#include "block_writer.hpp"
#include <array>
#include <string>

namespace zxtap {

namespace {

// Empties the block buffer when completeBlock() leaves, on any path.
struct BufferReset {
    std::vector<uint8_t>& buffer;
    ~BufferReset() { buffer.clear(); }
};

void put(std::ostream& sink, const uint8_t* data, size_t size, const char* what)
{
    try {
        sink.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    } catch (const std::ios_base::failure& e) {
        throw Error(ErrorKind::SinkWriteError, std::string("Could not write block ") + what + ": " + e.what());
    }
    if (!sink) {
        throw Error(ErrorKind::SinkWriteError, std::string("Could not write block ") + what);
    }
}

} // namespace

void BlockWriter::write(const uint8_t* data, size_t size)
{
    if (size > MAX_BLOCK_CONTENT - buffer.size()) {
        throw Error(ErrorKind::BlockTooLarge,
                    "TAP block would grow to " + std::to_string(buffer.size() + size) +
                    " bytes, the maximum is " + std::to_string(MAX_BLOCK_CONTENT));
    }
    buffer.insert(buffer.end(), data, data + size);
}

void BlockWriter::writeWord(uint16_t word)
{
    const std::array<uint8_t, 2> bytes = {low_byte(word), high_byte(word)};
    write(bytes.data(), bytes.size());
}

void BlockWriter::completeBlock()
{
    BufferReset reset{buffer};

    // write() keeps the buffer at or below MAX_BLOCK_CONTENT, so the length fits
    const auto length = static_cast<uint16_t>(buffer.size() + 1);
    const std::array<uint8_t, 2> prefix = {low_byte(length), high_byte(length)};
    const uint8_t checksum = xor_checksum(buffer.data(), buffer.size());

    put(sink, prefix.data(), prefix.size(), "length");
    put(sink, buffer.data(), buffer.size(), "content");
    put(sink, &checksum, 1, "checksum");
}

} // namespace zxtap
