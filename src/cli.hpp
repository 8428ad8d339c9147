#pragma once
#include "bytes_file.hpp"
#include <cstdint>
#include <string>
#include <string_view>

namespace zxtap {

// Input path with its extension replaced by (or extended with) ".tap"
std::string defaultOutputPath(const std::string& input);

// File name of the input without directory and extension, cut to the header name width
std::string defaultTapeName(const std::string& input);

/**
 * Parse a load address given on the command line
 * Accepts decimal ("32768"), C hex ("0x8000") and assembler hex ("$8000").
 * @throws std::invalid_argument if the text is not a number in 0..65535
 */
uint16_t parseLoadAddress(std::string_view text);

/**
 * Convert a binary file into a TAP file
 * An output file left incomplete by a failed write is removed before the error is rethrown.
 * @return The written file, for reporting
 * @throws Error(SourceReadError) if the input cannot be opened, Error(SinkWriteError) if the output cannot be created,
 *         and every error of BytesFile::build and BytesFile::writeTo
 */
BytesFile convertFile(const std::string& input, const std::string& output, std::string_view name,
                      uint16_t loadAddress, NamePolicy policy = NamePolicy::Strict);

} // namespace zxtap
