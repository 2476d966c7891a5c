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

#include <tarsplit/pax_parser.hpp>
#include <charconv>
#include <algorithm>
#include <format>

namespace tarsplit::pax {

namespace {

// Timestamps may carry a fractional part; only whole seconds are kept
template<typename T>
std::expected<T, error> parse_decimal(const std::string& key, const std::string& value, 
                                      const bool allow_fraction = false) {
    T parsed{};
    const char* end = value.data() + value.size();
    const auto [ptr, ec] = std::from_chars(value.data(), end, parsed);
    const bool complete = ptr == end || (allow_fraction && *ptr == '.');
    if (ec != std::errc{} || ptr == value.data() || !complete) {
        return std::unexpected(error{error_code::invalid_header, 
            std::format("Invalid PAX value for '{}': '{}'", key, value)});
    }
    return parsed;
}

} // namespace

auto parse_pax_headers(
    const std::span<const std::byte> data) -> std::expected<pax_headers, error> {
    pax_headers result;

    const auto start = reinterpret_cast<const char*>(data.data());
    const char* end = start + data.size();
    const char* pos = start;
    
    while (pos < end && *pos != '\0') {
        // Parse length field
        const char* length_start = pos;
        while (pos < end && *pos >= '0' && *pos <= '9') {
            ++pos;
        }
        
        if (pos == length_start || pos >= end || *pos != ' ') {
            const std::string debug_str(length_start, std::min(pos, end));
            return std::unexpected(error{error_code::invalid_header, 
                std::format("Invalid PAX header length field, found: '{}'", debug_str)});
        }
        
        size_t length;
        auto result_code = std::from_chars(length_start, pos, length);
        if (result_code.ec != std::errc{}) {
            return std::unexpected(error{error_code::invalid_header, "Failed to parse PAX header length"});
        }
        
        if (length == 0) {
            return std::unexpected(error{error_code::invalid_header, "PAX header record length cannot be zero"});
        }
        
        ++pos; // Skip space
        
        const char* record_start = length_start;
        if (length > static_cast<size_t>(end - record_start)) {
            return std::unexpected(error{error_code::corrupt_archive, "PAX header record extends beyond data"});
        }
        const char* record_end = record_start + length;
        
        const char* key_start = pos;
        
        // Skip the newline at the end when looking for '='
        const char* value_end = record_end;
        if (value_end > key_start && *(value_end - 1) == '\n') {
            --value_end;
        }
        
        const char* equals_pos = std::find(key_start, value_end, '=');
        
        if (equals_pos == value_end) {
            return std::unexpected(error{error_code::invalid_header, "PAX header missing '=' separator"});
        }
        
        const std::string key(key_start, equals_pos);
        const std::string value(equals_pos + 1, value_end);
        
        result[key] = value;
        
        pos = record_end;
    }
    
    return result;
}

auto apply_pax_headers(file_metadata& metadata, const pax_headers& headers) -> std::expected<void, error> {
    for (const auto& [key, value] : headers) {
        if (key == "path") {
            metadata.path = value;
        } else if (key == "linkpath") {
            metadata.link_target = value;
        } else if (key == "uname") {
            metadata.owner_name = value;
        } else if (key == "gname") {
            metadata.group_name = value;
        } else if (key == "size") {
            auto size = parse_decimal<uint64_t>(key, value);
            if (!size) {
                return std::unexpected(size.error());
            }
            metadata.size = *size;
        } else if (key == "mtime") {
            auto mtime = parse_decimal<int64_t>(key, value, true);
            if (!mtime) {
                return std::unexpected(mtime.error());
            }
            metadata.modification_time = std::chrono::system_clock::from_time_t(static_cast<std::time_t>(*mtime));
        }
    }
    return {};
}

} // namespace tarsplit::pax
