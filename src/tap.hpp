/**
 * @file tap.hpp
 * @brief Layout definitions for the ZX Spectrum TAP tape container
 *
 * A TAP file is a plain sequence of blocks. Every block is stored as
 *
 *     [u16 length][length - 1 bytes of content][u8 checksum]
 *
 * where the length counts the content and the trailing checksum byte, and the
 * checksum is all content bytes XORed together. The first content byte of a
 * block is its flag byte: 0x00 for a ROM loader header, 0xFF for a data block.
 *
 * A machine code file ("CODE" in Spectrum BASIC) is stored as two blocks:
 *
 *     Block_Length   = 19
 *     Block_Header   flag, type=3, name[10], data length, start address, 0x8000
 *     Block_Length   = data length + 2
 *     Block_Data     flag=0xFF, data
 *
 * See: https://faqwiki.zxnet.co.uk/wiki/TAP_format
 */

#pragma once

#include <cstdint>
#include <cstddef>

// =============================================================================
// BYTE ORDER: ALL MULTI-BYTE VALUES ARE LITTLE-ENDIAN
//
// The value 0x8000 is stored as bytes [0x00, 0x80].
// =============================================================================

namespace zxtap {

/**
 * @brief Flag byte, first content byte of every block
 */
enum class BlockFlag : uint8_t {
    Header = 0x00,  // Standard ROM loading header
    Data   = 0xFF   // Standard ROM loading data block
};

/**
 * @brief Header type byte, second content byte of a header block
 *
 * Only machine code headers are produced. The ROM also knows program and
 * array headers (type bytes 0, 1 and 2), which this tool never writes.
 */
enum class HeaderKind : uint8_t {
    Bytes = 3
};

/** @brief Width of the header name field, padded with spaces (CHR$ 32) */
constexpr size_t NAME_LENGTH = 10;

/** @brief Padding byte for the name field */
constexpr uint8_t NAME_PADDING = 0x20;

/**
 * @brief Value of the last header word of a bytes header
 *
 * Unused by the loader for CODE files, always written as 32768.
 */
constexpr uint16_t BYTES_HEADER_RESERVED = 0x8000;

/**
 * @brief Number of content bytes of a header block (flag through reserved word)
 *
 * flag(1) + type(1) + name(10) + length(2) + address(2) + reserved(2)
 */
constexpr size_t HEADER_CONTENT_LENGTH = 18;

/** @brief Length prefix of every header block (content plus checksum) */
constexpr uint16_t HEADER_BLOCK_LENGTH = HEADER_CONTENT_LENGTH + 1;

/** @brief Highest address of the Z80 address space */
constexpr uint32_t ADDRESS_SPACE_TOP = 0xFFFF;

/**
 * @brief Largest number of content bytes a single block may buffer
 *
 * The u16 length prefix has to hold content + 1. Two bytes below 65535 are
 * kept free, so the largest block holds 65533 content bytes including its flag.
 */
constexpr size_t MAX_BLOCK_CONTENT = 0xFFFF - 2;

/**
 * @brief XOR of all bytes in a range
 */
constexpr inline uint8_t xor_checksum(const uint8_t* data, size_t size) noexcept {
    uint8_t checksum = 0;
    for (size_t i = 0; i < size; ++i) {
        checksum ^= data[i];
    }
    return checksum;
}

constexpr inline uint8_t low_byte(uint16_t word) noexcept {
    return static_cast<uint8_t>(word & 0x00FF);
}

constexpr inline uint8_t high_byte(uint16_t word) noexcept {
    return static_cast<uint8_t>((word & 0xFF00) >> 8);
}

} // namespace zxtap
