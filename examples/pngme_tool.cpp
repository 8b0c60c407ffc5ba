/**
 * @file pngme_tool.cpp
 * @brief Hide, read and remove text messages in PNG files
 *
 * This example shows how to use the command layer of libpngme. The
 * program only reads and writes files; everything else is done on
 * in-memory buffers by the library.
 */

#include <pngme/commands.hh>
#include <pngme/exceptions.hh>
#include <pngme/parse_options.hh>
#include <cstdint>
#include <iostream>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "tool_args.hh"

namespace {
    std::vector<std::byte> read_file(const std::string& filename) {
        std::ifstream file(filename, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + filename);
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)),
                              std::istreambuf_iterator<char>());
        auto p = reinterpret_cast<const std::byte*>(raw.data());
        return {p, p + raw.size()};
    }

    void write_file(const std::string& filename, const std::vector<std::byte>& data) {
        std::ofstream file(filename, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to create file: " + filename);
        }
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write file: " + filename);
        }
    }

    void usage(const char* prog) {
        std::cout << "Usage: " << prog << " <command> <file> [arguments]\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <type> <message> [output]\n";
        std::cout << "    Append a chunk of <type> holding <message>\n";
        std::cout << "  decode <file> <type>\n";
        std::cout << "    Print the message in the first chunk of <type>\n";
        std::cout << "  remove <file> <type>\n";
        std::cout << "    Remove the first chunk of <type>\n";
        std::cout << "  print <file>\n";
        std::cout << "    List all chunks\n";
        std::cout << "\n";
        std::cout << "Options:\n";
        std::cout << "  --lenient   Ignore data after IEND and report it as a warning\n";
    }
}

int main(int argc, char* argv[]) {
    auto parsed = pngme_tool::split_args(argc, argv);
    if (!pngme_tool::has_command(parsed)) {
        usage(argv[0]);
        return 1;
    }

    const std::vector<std::string>& args = parsed.positional;
    pngme::parse_options options;
    options.strict = !parsed.lenient;
    options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
        std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
    };

    const std::string& command = args[0];

    try {
        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            auto updated = pngme::encode(read_file(args[1]), args[2], args[3], options);
            write_file(args.size() == 5 ? args[4] : args[1], updated);
        } else if (command == "decode" && args.size() == 3) {
            auto message = pngme::decode(read_file(args[1]), args[2], options);
            if (!message) {
                std::cerr << "No chunk of type '" << args[2] << "' in " << args[1] << "\n";
                return 2;
            }
            std::cout << *message << "\n";
        } else if (command == "remove" && args.size() == 3) {
            write_file(args[1], pngme::remove(read_file(args[1]), args[2], options));
        } else if (command == "print" && args.size() == 2) {
            pngme::print_chunks(read_file(args[1]), std::cout, options);
        } else {
            usage(argv[0]);
            return 1;
        }
    } catch (const pngme::pngme_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }

    return 0;
}
