/**
 * @file pngme.cpp
 * @brief Hide, reveal, remove and list messages stored in PNG chunks
 *
 * Usage:
 *   pngme [--verbose] encode <file> <type> <message> [output]
 *   pngme [--verbose] decode <file> <type>
 *   pngme [--verbose] remove <file> <type>
 *   pngme [--verbose] print  <file>
 *
 * The library works on byte buffers only; this program owns all file
 * access and all output.
 */

#include <pngme/png.hh>
#include <pngme/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <string>
#include <vector>

namespace {

    std::vector<std::byte> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        THROW_IO_UNLESS(file, "Cannot open file '", path, "'");

        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        THROW_IO_IF(file.bad(), "Failed to read file '", path, "'");

        const auto* p = reinterpret_cast<const std::byte*>(raw.data());
        return {p, p + raw.size()};
    }

    void write_file(const std::string& path, const std::vector<std::byte>& bytes) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        THROW_IO_UNLESS(file, "Cannot open file '", path, "' for writing");

        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        THROW_IO_UNLESS(file, "Failed to write ", bytes.size(), " bytes to '", path, "'");
    }

    void print_usage(const char* prog) {
        std::cout << "Usage: " << prog << " [--verbose] <command> <args>\n";
        std::cout << "\n";
        std::cout << "Commands:\n";
        std::cout << "  encode <file> <type> <message> [output]  Hide a message in a new chunk\n";
        std::cout << "  decode <file> <type>                     Print the message of a chunk\n";
        std::cout << "  remove <file> <type>                     Remove the first chunk of a type\n";
        std::cout << "  print  <file>                            List all chunks\n";
        std::cout << "\n";
        std::cout << "Chunk types are 4 ASCII letters with the third one uppercase, e.g. ruSt.\n";
    }

    pngme::decode_options make_options(bool verbose) {
        pngme::decode_options options;
        if (verbose) {
            options.on_warning = [](std::uint64_t offset, std::string_view category, std::string_view message) {
                std::cerr << "Warning [" << category << "] at offset " << offset << ": " << message << "\n";
            };
        }
        return options;
    }

    // New chunks must carry a valid type so other tools keep them
    pngme::chunk_type parse_type(const std::string& text) {
        auto type = pngme::chunk_type::parse(text);
        THROW_FORMAT_UNLESS(type.is_valid(),
                            "Chunk type '", text, "' is not valid: the third letter must be uppercase");
        return type;
    }

    int cmd_encode(const std::vector<std::string>& args, const pngme::decode_options& options) {
        const std::string& path = args[0];
        const std::string& output = args.size() > 3 ? args[3] : path;

        auto image = pngme::png::decode(read_file(path), options);
        image.append_chunk(pngme::chunk(parse_type(args[1]), args[2]));
        write_file(output, image.serialize());

        std::cout << "Stored " << args[2].size() << " bytes in chunk '" << args[1]
                  << "' of " << output << "\n";
        return 0;
    }

    int cmd_decode(const std::vector<std::string>& args, const pngme::decode_options& options) {
        auto image = pngme::png::decode(read_file(args[0]), options);

        const pngme::chunk* c = image.chunk_by_type(args[1]);
        if (!c) {
            std::cerr << "No chunk of type '" << args[1] << "' in " << args[0] << "\n";
            return 1;
        }
        std::cout << c->data_as_text() << "\n";
        return 0;
    }

    int cmd_remove(const std::vector<std::string>& args, const pngme::decode_options& options) {
        const std::string& path = args[0];

        auto image = pngme::png::decode(read_file(path), options);
        pngme::chunk removed = image.remove_first_chunk_by_type(args[1]);
        write_file(path, image.serialize());

        std::cout << "Removed chunk '" << removed.type() << "' (" << removed.length()
                  << " bytes) from " << path << "\n";
        return 0;
    }

    int cmd_print(const std::vector<std::string>& args, const pngme::decode_options& options) {
        auto image = pngme::png::decode(read_file(args[0]), options);

        std::cout << "File: " << args[0] << "\n";
        std::cout << "Chunks: " << image.size() << "\n";
        std::cout << "=========================================\n";

        std::uint64_t offset = pngme::png::signature.size();
        for (const auto& c : image.chunks()) {
            const auto& type = c.type();
            std::cout << std::setw(8) << offset << "  " << type
                      << "  length " << std::setw(10) << c.length()
                      << "  crc 0x" << std::hex << std::setfill('0') << std::setw(8) << c.crc()
                      << std::dec << std::setfill(' ')
                      << "  " << (type.is_critical() ? "critical " : "ancillary")
                      << " " << (type.is_public() ? "public " : "private")
                      << " " << (type.is_safe_to_copy() ? "safe-to-copy  " : "unsafe-to-copy")
                      << (type.is_valid() ? "" : "  INVALID")
                      << "\n";
            offset += c.encoded_size();
        }
        return 0;
    }

    struct command {
        const char* name;
        std::size_t min_args;
        std::size_t max_args;
        int (*run)(const std::vector<std::string>&, const pngme::decode_options&);
    };

    const command commands[] = {
        {"encode", 3, 4, cmd_encode},
        {"decode", 2, 2, cmd_decode},
        {"remove", 2, 2, cmd_remove},
        {"print",  1, 1, cmd_print},
    };
}

int main(int argc, char* argv[]) {
    std::vector<std::string> args(argv + 1, argv + argc);

    bool verbose = false;
    if (!args.empty() && (args[0] == "--verbose" || args[0] == "-v")) {
        verbose = true;
        args.erase(args.begin());
    }

    if (args.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    const std::string name = args[0];
    args.erase(args.begin());

    for (const auto& cmd : commands) {
        if (name != cmd.name) {
            continue;
        }
        if (args.size() < cmd.min_args || args.size() > cmd.max_args) {
            std::cerr << "Error: wrong number of arguments for '" << name << "'\n\n";
            print_usage(argv[0]);
            return 1;
        }

        try {
            return cmd.run(args, make_options(verbose));
        } catch (const std::exception& e) {
            std::cerr << "Error: " << e.what() << "\n";
            return 1;
        }
    }

    std::cerr << "Error: unknown command '" << name << "'\n\n";
    print_usage(argv[0]);
    return 1;
}
