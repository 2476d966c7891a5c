/*
 * Copyright 2025 TierOne Software
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include <tarsplit/command_line.hpp>
#include <charconv>
#include <format>
#include <getopt.h>

namespace tarsplit {

namespace {

// ':' first makes getopt report a missing argument as ':'
constexpr const char* short_options = ":c:n:p:hV";

const option long_options[] = {
    {"chunk-size", required_argument, nullptr, 'c'},
    {"num-chunks", required_argument, nullptr, 'n'},
    {"prefix", required_argument, nullptr, 'p'},
    {"help", no_argument, nullptr, 'h'},
    {"version", no_argument, nullptr, 'V'},
    {nullptr, 0, nullptr, 0}
};

std::unexpected<error> usage_error(std::string message) {
    return std::unexpected(error{error_code::invalid_configuration, std::move(message)});
}

// Unsigned decimal without sign, whitespace or suffix
template<typename T>
std::expected<T, error> parse_count(std::string_view option_name, std::string_view text) {
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || ptr != text.data() + text.size()) {
        return usage_error(std::format("Invalid value for {}: '{}'", option_name, text));
    }
    if (value == 0) {
        return usage_error(std::format("{} must be greater than zero", option_name));
    }
    return value;
}

// Name of the option getopt just rejected
std::string option_name(char* argv[]) {
    if (optopt != 0) {
        return std::format("-{}", static_cast<char>(optopt));
    }
    return argv[optind - 1];
}

} // namespace

auto parse_command_line(int argc, char* argv[]) -> std::expected<command_line, error> {
    command_line result;
    
    // Reset getopt so the parser can run more than once per process
    optind = 0;
    opterr = 0;
    
    while (true) {
        const int opt = getopt_long(argc, argv, short_options, long_options, nullptr);
        if (opt == -1) {
            break;
        }
        
        switch (opt) {
            case 'c': {
                auto size = parse_count<uint64_t>("chunk size", optarg);
                if (!size) {
                    return std::unexpected(size.error());
                }
                result.request.chunk_size = *size;
                break;
            }
            case 'n': {
                auto count = parse_count<uint32_t>("number of chunks", optarg);
                if (!count) {
                    return std::unexpected(count.error());
                }
                result.request.num_chunks = *count;
                break;
            }
            case 'p':
                result.request.prefix = optarg;
                break;
            case 'h':
                result.show_help = true;
                return result;
            case 'V':
                result.show_version = true;
                return result;
            case ':':
                return usage_error(std::format("Option '{}' requires a value", option_name(argv)));
            default:
                return usage_error(std::format("Unknown option '{}'", option_name(argv)));
        }
    }
    
    if (result.request.chunk_size && result.request.num_chunks) {
        return usage_error("Chunk size and number of chunks are mutually exclusive");
    }
    if (!result.request.chunk_size && !result.request.num_chunks) {
        return usage_error("Must provide either chunk size or number of chunks");
    }
    if (result.request.prefix.empty() || result.request.prefix.find('/') != std::string::npos) {
        return usage_error(std::format("Invalid prefix '{}'", result.request.prefix));
    }
    
    if (argc - optind != 2) {
        return usage_error("Expected SOURCE and TARGET arguments");
    }
    result.request.source = argv[optind];
    result.request.target = argv[optind + 1];
    
    return result;
}

std::string usage(std::string_view program) {
    return std::format(
        "Usage: {0} [-c SIZE | -n COUNT] [-p PREFIX] SOURCE TARGET\n"
        "\n"
        "Split a tar archive into smaller archives along file boundaries.\n"
        "\n"
        "Options:\n"
        "  -c, --chunk-size SIZE    maximum size of each output chunk in bytes\n"
        "  -n, --num-chunks COUNT   number of output chunks (incompatible with -c)\n"
        "  -p, --prefix PREFIX      prefix of each output file name (default: {1})\n"
        "  -h, --help               show this help\n"
        "  -V, --version            show version\n"
        "\n"
        "Chunks are written to TARGET as PREFIX_STEM_INDEX.tar, where STEM is the\n"
        "source file name without extension. TARGET must be an existing directory.\n",
        program, DEFAULT_PREFIX);
}

} // namespace tarsplit
