#include "bytes_file.hpp"
#include <algorithm>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>

namespace zxtap {

namespace {

std::vector<uint8_t> readAll(std::istream& source)
{
    if (!source) {
        throw Error(ErrorKind::SourceReadError, "Input stream is not readable");
    }

    std::vector<uint8_t> bytes;
    try {
        bytes.assign(std::istreambuf_iterator<char>(source), std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        throw Error(ErrorKind::SourceReadError, std::string("Could not read input: ") + e.what());
    }

    if (source.bad()) {
        throw Error(ErrorKind::SourceReadError, "Could not read input");
    }
    return bytes;
}

} // namespace

bool isPlainAscii(std::string_view name) noexcept
{
    return std::all_of(name.begin(), name.end(), [](char c) {
        const auto byte = static_cast<unsigned char>(c);
        return byte >= 0x20 && byte <= 0x7E && c != '"' && c != '\\';
    });
}

TapeName encodeName(std::string_view name, NamePolicy policy)
{
    if (!isPlainAscii(name)) {
        throw Error(ErrorKind::InvalidName, "Illegal characters in tap file name: " + std::string(name));
    }
    if (name.size() > NAME_LENGTH) {
        if (policy == NamePolicy::Strict) {
            throw Error(ErrorKind::InvalidName,
                        "Tap file name '" + std::string(name) + "' is longer than " +
                        std::to_string(NAME_LENGTH) + " characters");
        }
        name = name.substr(0, NAME_LENGTH);
    }

    TapeName field;
    field.fill(NAME_PADDING);
    std::copy(name.begin(), name.end(), field.begin());
    return field;
}

BytesFile BytesFile::build(std::string_view name, std::istream& source, uint16_t loadAddress,
                           NamePolicy policy)
{
    const TapeName field = encodeName(name, policy);
    std::vector<uint8_t> payload = readAll(source);

    if (loadAddress + payload.size() > ADDRESS_SPACE_TOP) {
        throw Error(ErrorKind::AddressOverflow,
                    "Start address too high, code will roll over 64K-boundary. Address: " +
                    std::to_string(loadAddress) + ", Length: " + std::to_string(payload.size()));
    }

    return BytesFile(field, std::move(payload), loadAddress);
}

void BytesFile::writeHeader(BlockWriter& writer) const
{
    writer.write(static_cast<uint8_t>(BlockFlag::Header));
    writer.write(static_cast<uint8_t>(HeaderKind::Bytes));
    writer.write(tapeName.data(), tapeName.size());
    // build() bounded address + size by 0xFFFF, so the size fits a word
    writer.writeWord(static_cast<uint16_t>(data.size()));
    writer.writeWord(address);
    writer.writeWord(BYTES_HEADER_RESERVED);
    writer.completeBlock();
}

void BytesFile::writeData(BlockWriter& writer) const
{
    writer.write(static_cast<uint8_t>(BlockFlag::Data));
    writer.write(data);
    writer.completeBlock();
}

void BytesFile::writeTo(BlockWriter& writer)
{
    if (currentState != State::Validated) {
        throw std::logic_error("BytesFile can only be written once");
    }

    currentState = State::Failed;
    writeHeader(writer);
    writeData(writer);
    currentState = State::Written;
}

} // namespace zxtap
