#include "cli.hpp"
#include <argparse/argparse.hpp>
#include <iostream>
#include <string>

int main(int argc, char* argv[]) {
    argparse::ArgumentParser program("zxtap", "0.1.0", argparse::default_arguments::all);

    program.add_argument("filename")
        .help("The binary file to convert")
        .required();

    program.add_argument("-o", "--output")
        .help("The output filename (default: input file with .tap extension)")
        .default_value(std::string(""));

    program.add_argument("-n", "--name")
        .help("The tape name shown by the loader, up to 10 characters (default: input file name)")
        .default_value(std::string(""));

    program.add_argument("-a", "--address")
        .help("The load address of the code, decimal, 0x or $ hex")
        .default_value(std::string("32768"));

    program.add_argument("--truncate-name")
        .help("Cut names longer than 10 characters instead of failing")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-v", "--verbose")
        .help("Print details about the written blocks")
        .default_value(false)
        .implicit_value(true);

    uint16_t address = 0;
    try {
        program.parse_args(argc, argv);
        address = zxtap::parseLoadAddress(program.get<std::string>("--address"));
    }
    catch (const std::exception& err) {
        std::cerr << err.what() << std::endl;
        std::cerr << program;
        return 1;
    }

    std::string filename = program.get<std::string>("filename");
    std::string output = program.get<std::string>("--output");
    std::string name = program.get<std::string>("--name");
    bool verbose = program.get<bool>("--verbose");
    auto policy = program.get<bool>("--truncate-name") ? zxtap::NamePolicy::Truncate
                                                        : zxtap::NamePolicy::Strict;

    auto out_filename = output.empty() ? zxtap::defaultOutputPath(filename) : output;
    if (name.empty()) {
        name = zxtap::defaultTapeName(filename);
    }

    std::cout << "Converting " << filename << "...\n";

    try {
        auto file = zxtap::convertFile(filename, out_filename, name, address, policy);

        if (verbose) {
            const auto& field = file.name();
            std::cout << "Number of bytes read: " << file.payload().size() << "\n"
                      << "Tape name: \"" << std::string(field.begin(), field.end()) << "\"\n"
                      << "Load address: " << file.loadAddress() << "\n"
                      << "Header block: " << zxtap::HEADER_BLOCK_LENGTH << " bytes\n"
                      << "Data block: " << file.payload().size() + 2 << " bytes\n";
        }
        std::cout << "Conversion successful! Output written to " << out_filename << "\n";

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
