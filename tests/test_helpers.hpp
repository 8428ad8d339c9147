#pragma once
#include <gtest/gtest.h>
#include "../src/block_writer.hpp"
#include "../src/bytes_file.hpp"
#include "../src/tap.hpp"
#include "../src/tap_error.hpp"
#include <algorithm>
#include <cstdint>
#include <iomanip>
#include <sstream>
#include <streambuf>
#include <string>
#include <vector>

// ============================================================================
// UTILITY FUNCTIONS
// ============================================================================

/**
 * @brief Compare byte vectors with detailed error messages
 */
inline void expectBytes(const std::vector<uint8_t>& actual,
                        const std::vector<uint8_t>& expected,
                        const std::string& msg = "") {
    ASSERT_EQ(actual.size(), expected.size())
        << msg << " size mismatch: expected " << expected.size()
        << " bytes, got " << actual.size();
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(actual[i], expected[i])
            << msg << " byte mismatch at index " << i
            << ": expected 0x" << std::hex << static_cast<int>(expected[i])
            << ", got 0x" << static_cast<int>(actual[i]);
    }
}

/**
 * @brief Create a hex dump string for debugging
 */
inline std::string hexDump(const std::vector<uint8_t>& data, size_t maxBytes = 64) {
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    size_t count = std::min(data.size(), maxBytes);
    for (size_t i = 0; i < count; ++i) {
        if (i > 0 && i % 16 == 0) oss << "\n";
        else if (i > 0) oss << " ";
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    if (data.size() > maxBytes) {
        oss << "... (" << (data.size() - maxBytes) << " more bytes)";
    }
    return oss.str();
}

/**
 * @brief Extract a range of bytes from a vector
 */
inline std::vector<uint8_t> extractBytes(const std::vector<uint8_t>& data,
                                         size_t start, size_t length) {
    if (start >= data.size()) return {};
    size_t end = std::min(start + length, data.size());
    return std::vector<uint8_t>(data.begin() + start, data.begin() + end);
}

/**
 * @brief Read a 16-bit little-endian word from a byte vector
 */
inline uint16_t readWord(const std::vector<uint8_t>& data, size_t offset) {
    if (offset + 1 >= data.size()) return 0;
    return static_cast<uint16_t>(data[offset]) |
           (static_cast<uint16_t>(data[offset + 1]) << 8);
}

inline uint8_t xorOf(const std::vector<uint8_t>& data) {
    uint8_t cs = 0;
    for (uint8_t b : data) cs ^= b;
    return cs;
}

inline std::vector<uint8_t> bytesOf(const std::string& s) {
    return std::vector<uint8_t>(s.begin(), s.end());
}

// ============================================================================
// TAP LAYOUT OFFSETS FOR TESTING
// ============================================================================
namespace TapOffsets {
    constexpr size_t HEADER_LENGTH   = 0;
    constexpr size_t HEADER_FLAG     = 2;
    constexpr size_t HEADER_TYPE     = 3;
    constexpr size_t HEADER_NAME     = 4;
    constexpr size_t HEADER_DATA_LEN = 14;
    constexpr size_t HEADER_ADDRESS  = 16;
    constexpr size_t HEADER_RESERVED = 18;
    constexpr size_t HEADER_CHECKSUM = 20;
    constexpr size_t DATA_LENGTH     = 21;
    constexpr size_t DATA_FLAG       = 23;
    constexpr size_t DATA_PAYLOAD    = 24;
}

// ============================================================================
// SINKS
// ============================================================================

/**
 * @brief Stream buffer that accepts a fixed number of bytes and then fails
 */
class LimitedBuffer : public std::streambuf {
    size_t remaining;

protected:
    int_type overflow(int_type ch) override {
        if (traits_type::eq_int_type(ch, traits_type::eof())) {
            return traits_type::not_eof(ch);
        }
        if (remaining == 0) {
            return traits_type::eof();
        }
        --remaining;
        written.push_back(static_cast<uint8_t>(ch));
        return ch;
    }

    std::streamsize xsputn(const char* s, std::streamsize n) override {
        std::streamsize accepted = std::min<std::streamsize>(n, static_cast<std::streamsize>(remaining));
        written.insert(written.end(), s, s + accepted);
        remaining -= static_cast<size_t>(accepted);
        return accepted;
    }

public:
    explicit LimitedBuffer(size_t limit) : remaining(limit) {}
    std::vector<uint8_t> written;
};

// ============================================================================
// BASE TEST FIXTURE
// ============================================================================

class TapTestBase : public ::testing::Test {
protected:
    std::ostringstream sink{std::ios::binary};

    std::vector<uint8_t> output() const {
        return bytesOf(sink.str());
    }

    zxtap::BytesFile buildFile(const std::string& name,
                               const std::vector<uint8_t>& payload,
                               uint16_t address,
                               zxtap::NamePolicy policy = zxtap::NamePolicy::Strict) {
        std::istringstream source(std::string(payload.begin(), payload.end()), std::ios::binary);
        return zxtap::BytesFile::build(name, source, address, policy);
    }

    std::vector<uint8_t> convert(const std::string& name,
                                 const std::vector<uint8_t>& payload,
                                 uint16_t address) {
        auto file = buildFile(name, payload, address);
        zxtap::BlockWriter writer(sink);
        file.writeTo(writer);
        return output();
    }
};

/**
 * @brief Check that an action throws zxtap::Error of the given kind
 */
template <typename Action>
void expectTapError(Action action, zxtap::ErrorKind expectedKind) {
    try {
        action();
        ADD_FAILURE() << "Expected zxtap::Error (" << zxtap::to_string(expectedKind) << ")";
    } catch (const zxtap::Error& e) {
        EXPECT_EQ(e.kind(), expectedKind) << e.what();
    }
}
