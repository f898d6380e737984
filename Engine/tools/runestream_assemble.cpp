#include <ingestion/text_assembler.hpp>
#include <unicode/utf8_error.hpp>
#include <utils/logger.hpp>
#include <charconv>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <unistd.h>

using namespace Runestream;

static void print_usage(const char* argv0) {
    std::cerr << "Usage: " << argv0 << " [-c <chunk_size>] [-o <output>] [file ...]\n";
    std::cerr << "\nReads each file (or stdin when none is given) in chunks, validates it as UTF-8\n"
              << "and writes the assembled text to <output> (default: stdout).\n";
    std::cerr << "\nEnvironment:\n"
              << "  RUNESTREAM_CHUNK_SIZE     bytes per read (default 4096)\n"
              << "  RUNESTREAM_RESERVE_BYTES  initial buffer capacity\n";
}

static std::string describe(const AssemblyStats& stats) {
    std::ostringstream ss;
    ss << stats.bytes_read << " bytes, " << stats.codepoints << " codepoints, "
       << stats.chunks << " chunks in " << stats.elapsed_ms << " ms";
    return ss.str();
}

int main(int argc, char** argv) {
    Logger::set_colors(isatty(STDERR_FILENO) != 0);

    AssemblyConfig config;
    std::string output_path;
    std::vector<std::string> inputs;

    try {
        config = AssemblyConfig::load_from_env();
    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 2;
    }

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" && i + 1 < argc) {
            const char* value = argv[++i];
            const char* end = value + std::strlen(value);
            auto [ptr, ec] = std::from_chars(value, end, config.chunk_size);
            if (ec != std::errc() || ptr != end || config.chunk_size == 0) {
                Logger::error("Invalid chunk size: " + std::string(value));
                return 2;
            }
        } else if (arg == "-o" && i + 1 < argc) {
            output_path = argv[++i];
        } else if (!arg.empty() && arg[0] == '-' && arg != "-") {
            print_usage(argv[0]);
            return 2;
        } else {
            inputs.push_back(arg);
        }
    }
    if (inputs.empty()) inputs.push_back("-");

    std::ofstream output_file;
    if (!output_path.empty()) {
        output_file.open(output_path, std::ios::binary);
        if (!output_file) {
            Logger::error("Cannot open output: " + output_path);
            return 2;
        }
    }
    std::ostream& out = output_path.empty() ? std::cout : output_file;

    TextAssembler assembler(config);
    bool all_valid = true;
    Logger::info("Chunk size " + std::to_string(config.chunk_size) + " bytes, " +
                 std::to_string(inputs.size()) + " input(s)");

    for (const auto& input : inputs) {
        const std::string name = (input == "-") ? "<stdin>" : input;
        Logger::step("Assembling " + name);
        try {
            AssemblyResult result = (input == "-") ? assembler.assemble(std::cin)
                                                   : assembler.assemble_file(input);
            if (result.stats.bytes_read == 0) Logger::warn(name + " is empty");
            out.write(result.text.data(), static_cast<std::streamsize>(result.text.size()));
            Logger::success(name + ": " + describe(result.stats));
        } catch (const Utf8Error& e) {
            Logger::error(name + ": rejected, " + e.what());
            all_valid = false;
        } catch (const std::exception& e) {
            Logger::error(name + ": " + e.what());
            all_valid = false;
        }
    }

    out.flush();
    if (!out) {
        Logger::error("Write failed");
        return 1;
    }
    return all_valid ? 0 : 1;
}
