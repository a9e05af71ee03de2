#include "pngstash/cli_colors.hpp"
#include "pngstash/commands.hpp"
#include "pngstash/constants.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

void PrintUsage() {
    std::cout << "Usage:\n";
    std::cout << "  pngstash encode <file.png> <chunk_type> <message> [--out <path>] [-p <password>]\n";
    std::cout << "  pngstash decode <file.png> <chunk_type> [-p <password>]\n";
    std::cout << "  pngstash remove <file.png> <chunk_type> [--out <path>]\n";
    std::cout << "  pngstash print <file.png>\n";
    std::cout << "  pngstash version\n";
    std::cout << "Global flags: --no-color\n";
}

struct ParsedArgs {
    std::vector<std::string> positional;
    std::string output;
    std::string password;
};

// Flags may appear anywhere after the subcommand; "--" ends flag parsing.
ParsedArgs ParseArgs(const std::vector<std::string>& args, bool allow_out, bool allow_password) {
    ParsedArgs parsed;
    std::size_t idx = 0;
    bool positional_only = false;
    while (idx < args.size()) {
        const std::string& flag = args[idx];
        if (positional_only) {
            parsed.positional.push_back(flag);
            idx += 1;
        } else if (flag == "--") {
            positional_only = true;
            idx += 1;
        } else if (allow_out && (flag == "--out" || flag == "-o")) {
            if (idx + 1 >= args.size()) {
                throw std::runtime_error("Missing output path");
            }
            parsed.output = args[idx + 1];
            idx += 2;
        } else if (allow_password && (flag == "-p" || flag == "--password")) {
            if (idx + 1 >= args.size()) {
                throw std::runtime_error("Missing password value");
            }
            parsed.password = args[idx + 1];
            idx += 2;
        } else if (flag.size() > 1 && flag[0] == '-') {
            throw std::runtime_error("Unknown flag: " + flag);
        } else {
            parsed.positional.push_back(flag);
            idx += 1;
        }
    }
    return parsed;
}

}  // namespace

int main(int argc, char** argv) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        if (arg == "--no-color") {
            pngstash::cli::SetColorsEnabled(false);
            continue;
        }
        args.push_back(arg);
    }
    if (args.empty()) {
        PrintUsage();
        return 2;
    }
    std::string command = args.front();
    args.erase(args.begin());
    try {
        if (command == "encode") {
            ParsedArgs parsed = ParseArgs(args, true, true);
            if (parsed.positional.size() != 3) {
                PrintUsage();
                return 2;
            }
            pngstash::commands::EncodeOptions opts;
            opts.output = parsed.output;
            opts.password = parsed.password;
            std::string written = pngstash::commands::Encode(parsed.positional[0], parsed.positional[1],
                                                             parsed.positional[2], opts);
            std::cout << pngstash::cli::Green("[+] ") << "Message stored in chunk `" << parsed.positional[1]
                      << "` of " << written << "\n";
            return 0;
        }
        if (command == "decode") {
            ParsedArgs parsed = ParseArgs(args, false, true);
            if (parsed.positional.size() != 2) {
                PrintUsage();
                return 2;
            }
            const std::string& chunk_type = parsed.positional[1];
            auto result = pngstash::commands::Decode(parsed.positional[0], chunk_type, parsed.password);
            if (!result.found) {
                std::cout << pngstash::cli::Yellow("Chunk type: `" + chunk_type + "` not found.") << "\n";
                return 0;
            }
            std::cout << pngstash::cli::Cyan("[i] ") << "Chunk found: " << result.description << "\n";
            if (result.sealed && parsed.password.empty()) {
                std::cout << pngstash::cli::Yellow("[i] ") << "Secret message is sealed; pass -p <password> to open it.\n";
                return 0;
            }
            std::cout << pngstash::cli::Cyan("[i] ") << "Secret message: "
                      << pngstash::cli::BoldGreen(result.message) << ".\n";
            return 0;
        }
        if (command == "remove") {
            ParsedArgs parsed = ParseArgs(args, true, false);
            if (parsed.positional.size() != 2) {
                PrintUsage();
                return 2;
            }
            pngstash::commands::RemoveOptions opts;
            opts.output = parsed.output;
            auto removed = pngstash::commands::Remove(parsed.positional[0], parsed.positional[1], opts);
            std::cout << pngstash::cli::Green("[-] ") << "Removed " << pngstash::commands::DescribeChunk(removed)
                      << "\n";
            return 0;
        }
        if (command == "print") {
            ParsedArgs parsed = ParseArgs(args, false, false);
            if (parsed.positional.size() != 1) {
                PrintUsage();
                return 2;
            }
            pngstash::commands::Print(parsed.positional[0], std::cout);
            return 0;
        }
        if (command == "version" || command == "--version") {
            std::cout << "pngstash " << pngstash::constants::kVersion << "\n";
            return 0;
        }
        PrintUsage();
        return 2;
    } catch (const std::exception& exc) {
        std::cerr << pngstash::cli::BoldRed("Error: ") << exc.what() << "\n";
        return 1;
    }
}
