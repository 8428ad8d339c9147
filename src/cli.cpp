#include "cli.hpp"
#include "tap.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>

namespace zxtap {

namespace {

void removePartialOutput(const std::string& path)
{
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        std::cerr << "Could not remove incomplete output " << path << ": " << ec.message() << "\n";
    }
}

} // namespace

std::string defaultOutputPath(const std::string& input)
{
    std::filesystem::path path(input);
    path.replace_extension(".tap");
    return path.string();
}

std::string defaultTapeName(const std::string& input)
{
    std::string stem = std::filesystem::path(input).stem().string();
    if (stem.size() > NAME_LENGTH) {
        stem.resize(NAME_LENGTH);
    }
    return stem;
}

uint16_t parseLoadAddress(std::string_view text)
{
    int base = 10;
    std::size_t start = 0;

    if (text.starts_with("$")) {
        base = 16;
        start = 1;
    } else if (text.starts_with("0x") || text.starts_with("0X")) {
        base = 16;
        start = 2;
    }

    const std::string digits(text.substr(start));
    const bool hexDigitsOnly = std::all_of(digits.begin(), digits.end(), [](char c) {
        return std::isxdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (digits.empty() || !hexDigitsOnly) {
        throw std::invalid_argument("Invalid load address: " + std::string(text));
    }

    std::size_t pos = 0;
    unsigned long value = 0;
    try {
        value = std::stoul(digits, &pos, base);
    } catch (const std::logic_error&) {
        throw std::invalid_argument("Invalid load address: " + std::string(text));
    }
    if (pos != digits.size()) {
        throw std::invalid_argument("Invalid load address: " + std::string(text));
    }
    if (value > ADDRESS_SPACE_TOP) {
        throw std::invalid_argument("Load address out of range 0..65535: " + std::string(text));
    }
    return static_cast<uint16_t>(value);
}

BytesFile convertFile(const std::string& input, const std::string& output, std::string_view name,
                      uint16_t loadAddress, NamePolicy policy)
{
    std::ifstream infile(input, std::ios::binary);
    if (!infile.is_open()) {
        throw Error(ErrorKind::SourceReadError, "Could not open file: " + input);
    }

    auto file = BytesFile::build(name, infile, loadAddress, policy);

    std::ofstream outfile(output, std::ios::binary);
    if (!outfile.is_open()) {
        throw Error(ErrorKind::SinkWriteError, "Could not open output file: " + output);
    }

    try {
        BlockWriter writer(outfile);
        file.writeTo(writer);
        outfile.close();
        if (!outfile) {
            throw Error(ErrorKind::SinkWriteError, "Could not finish writing " + output);
        }
    } catch (const std::exception&) {
        outfile.close();
        removePartialOutput(output);
        throw;
    }

    return file;
}

} // namespace zxtap
