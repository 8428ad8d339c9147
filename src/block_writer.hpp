#pragma once

#include "tap.hpp"
#include "tap_error.hpp"
#include <cstdint>
#include <ostream>
#include <vector>

namespace zxtap {

/**
 * @brief Wraps buffered content into TAP blocks
 *
 * Content is collected with write() and flushed to the sink by
 * completeBlock(), preceded by its length and followed by its checksum.
 * The same writer is reused for every block of a file, so a block has to be
 * completed before the next one is started.
 */
class BlockWriter
{
    std::ostream& sink;
    std::vector<uint8_t> buffer;

public:
    explicit BlockWriter(std::ostream& out) : sink(out) {}

    BlockWriter(const BlockWriter&) = delete;
    BlockWriter& operator=(const BlockWriter&) = delete;

    /**
     * Append content to the current block
     * @throws Error(BlockTooLarge) if the block would exceed MAX_BLOCK_CONTENT,
     *         in which case nothing is appended
     */
    void write(const uint8_t* data, size_t size);
    void write(const std::vector<uint8_t>& data) { write(data.data(), data.size()); }
    void write(uint8_t byte) { write(&byte, 1); }
    void writeWord(uint16_t word);

    /**
     * Emit length, buffered content and checksum to the sink.
     * The buffer is empty afterwards, whether the sink accepted the block or not.
     * @throws Error(SinkWriteError) if the sink fails; bytes already written stay written
     */
    void completeBlock();

    size_t pending() const { return buffer.size(); }
};

} // namespace zxtap
