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

#pragma once

#include <tarsplit/error.hpp>
#include <tarsplit/metadata.hpp>
#include <expected>
#include <span>
#include <bit>
#include <algorithm>
#include <ranges>
#include <string_view>

namespace tarsplit::detail {

constexpr size_t BLOCK_SIZE = 512;

// Size of n data bytes once padded to the block boundary
[[nodiscard]] constexpr uint64_t padded_size(const uint64_t n) noexcept {
    return (n + BLOCK_SIZE - 1) / BLOCK_SIZE * BLOCK_SIZE;
}

// Parse octal field with proper error handling
template<size_t N>
constexpr std::expected<uint64_t, error> parse_octal(std::span<const char, N> field) {
    uint64_t result = 0;
    bool found_digit = false;
    
    for (char c : field) {
        if (c == '\0' || c == ' ') {
            if (!found_digit) continue;
            break;
        }
        if (c < '0' || c > '7') {
            return std::unexpected(error{error_code::invalid_header, "Invalid octal digit"});
        }
        found_digit = true;
        
        // Check for overflow
        if (result > (UINT64_MAX >> 3)) {
            return std::unexpected(error{error_code::invalid_header, "Octal value overflow"});
        }
        
        result = (result << 3) | static_cast<uint64_t>(c - '0');
    }
    
    return found_digit ? result : 0;
}

// Parse a numeric field that is either octal or GNU base-256.
// Base-256 is flagged by the high bit of the first byte and is how GNU tar
// stores sizes of 8 GiB and above.
template<size_t N>
constexpr std::expected<uint64_t, error> parse_numeric(std::span<const char, N> field) {
    if (field.empty() || (static_cast<unsigned char>(field[0]) & 0x80) == 0) {
        return parse_octal(field);
    }
    
    if (static_cast<unsigned char>(field[0]) & 0x40) {
        return std::unexpected(error{error_code::invalid_header, "Negative base-256 value"});
    }
    
    uint64_t result = static_cast<unsigned char>(field[0]) & 0x3F;
    for (size_t i = 1; i < field.size(); ++i) {
        if (result > (UINT64_MAX >> 8)) {
            return std::unexpected(error{error_code::invalid_header, "Base-256 value overflow"});
        }
        result = (result << 8) | static_cast<unsigned char>(field[i]);
    }
    return result;
}

// Calculate checksum for header validation
[[nodiscard]] uint32_t calculate_checksum(std::span<const std::byte, BLOCK_SIZE> block);

// Parse a complete tar header block
[[nodiscard]] std::expected<file_metadata, error> parse_header(std::span<const std::byte, BLOCK_SIZE> block);

// Check if block is all zeros (end-of-archive marker)
[[nodiscard]] bool is_zero_block(std::span<const std::byte, BLOCK_SIZE> block);

// Helper to safely extract null-terminated string from a fixed-size field
[[nodiscard]] std::string_view extract_string(std::span<const char> field);

} // namespace tarsplit::detail
