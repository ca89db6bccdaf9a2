/**
 * @file pngmsg_tool.cpp
 * @brief Command line front end for hiding messages in PNG files
 *
 * Usage:
 *   pngmsg_tool encode <file> <code> <message> [output]
 *   pngmsg_tool decode <file> <code>
 *   pngmsg_tool remove <file> <code>
 *   pngmsg_tool print <file>
 *
 * Exit codes: 0 success, 1 missing message or invalid PNG data,
 * 2 usage error, 3 file or other runtime failure.
 */

#include <pngmsg/messages.hh>
#include <pngmsg/exceptions.hh>
#include <iostream>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

    std::vector<std::byte> read_file(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            throw std::runtime_error("Failed to open file: " + path);
        }
        std::vector<char> raw((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
        if (file.bad()) {
            throw std::runtime_error("Failed to read file: " + path);
        }
        auto* first = reinterpret_cast<const std::byte*>(raw.data());
        return std::vector<std::byte>(first, first + raw.size());
    }

    void write_file(const std::string& path, const std::vector<std::byte>& data) {
        std::ofstream file(path, std::ios::binary | std::ios::trunc);
        if (!file) {
            throw std::runtime_error("Failed to open file for writing: " + path);
        }
        file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
        if (!file) {
            throw std::runtime_error("Failed to write file: " + path);
        }
    }

    void print_usage(const char* prog) {
        std::cerr << "Usage:\n"
                  << "  " << prog << " encode <file> <code> <message> [output]\n"
                  << "  " << prog << " decode <file> <code>\n"
                  << "  " << prog << " remove <file> <code>\n"
                  << "  " << prog << " print <file>\n";
    }

    int run(const std::vector<std::string>& args) {
        const std::string& command = args[0];

        if (command == "encode" && (args.size() == 4 || args.size() == 5)) {
            auto out = pngmsg::encode_message(read_file(args[1]), args[2], args[3]);
            write_file(args.size() == 5 ? args[4] : args[1], out);
            return 0;
        }

        if (command == "decode" && args.size() == 3) {
            auto message = pngmsg::decode_message(read_file(args[1]), args[2]);
            if (!message) {
                std::cerr << "Could not find message encoded with code " << args[2] << "\n";
                return 1;
            }
            std::cout << "The encoded message with code " << args[2] << " is " << *message << "\n";
            return 0;
        }

        if (command == "remove" && args.size() == 3) {
            auto removed = pngmsg::remove_message(read_file(args[1]), args[2]);
            write_file(args[1], removed.file);
            if (removed.message) {
                std::cout << "Removed message encoded with code " << args[2]
                          << ", it was " << *removed.message << "\n";
            } else {
                std::cout << "Removed chunk with code " << args[2]
                          << ", its data is not text\n";
            }
            return 0;
        }

        if (command == "print" && args.size() == 2) {
            std::cout << "List of possible messages\n";
            std::cout << pngmsg::list_chunks(read_file(args[1]));
            return 0;
        }

        return -1;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 2;
    }

    std::vector<std::string> args(argv + 1, argv + argc);
    try {
        int rc = run(args);
        if (rc < 0) {
            print_usage(argv[0]);
            return 2;
        }
        return rc;
    } catch (const pngmsg::pngmsg_error& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 3;
    }
}
