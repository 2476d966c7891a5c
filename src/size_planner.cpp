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

#include <tarsplit/size_planner.hpp>
#include <format>

namespace tarsplit {

namespace {

std::unexpected<error> configuration_error(std::string message) {
    return std::unexpected(error{error_code::invalid_configuration, std::move(message)});
}

// Nearest-integer division, halves rounded up
constexpr uint64_t divide_rounded(const uint64_t dividend, const uint64_t divisor) {
    const uint64_t quotient = dividend / divisor;
    const uint64_t remainder = dividend % divisor;
    return remainder >= divisor - remainder ? quotient + 1 : quotient;
}

} // namespace

auto plan_chunk_size(
    const std::optional<uint64_t> explicit_size,
    const std::optional<uint32_t> chunk_count,
    const uint64_t source_size,
    const size_limits& limits) -> std::expected<uint64_t, error> {
    if (explicit_size && chunk_count) {
        return configuration_error("Chunk size and number of chunks are mutually exclusive");
    }
    if (!explicit_size && !chunk_count) {
        return configuration_error("Must provide either chunk size or number of chunks");
    }
    
    if (source_size < limits.min_archive_size) {
        return configuration_error(std::format(
            "Source archive is less than {} bytes ({} bytes)", limits.min_archive_size, source_size));
    }
    
    if (chunk_count) {
        if (*chunk_count <= limits.min_chunk_count) {
            return configuration_error(std::format(
                "Number of chunks must be greater than {}", limits.min_chunk_count));
        }
        
        const uint64_t max_chunk_size = divide_rounded(source_size, *chunk_count);
        if (max_chunk_size < limits.min_archive_size) {
            return configuration_error(std::format(
                "Calculated chunk size must be at least {} bytes, try providing "
                "a lower number of chunks (<{})", limits.min_archive_size, *chunk_count));
        }
        return max_chunk_size;
    }
    
    if (*explicit_size < limits.min_archive_size) {
        return configuration_error(std::format(
            "Chunk size must be at least {} bytes", limits.min_archive_size));
    }
    if (*explicit_size >= source_size) {
        return configuration_error(std::format(
            "Chunk size must be less than source archive size ({} >= {})", *explicit_size, source_size));
    }
    
    return *explicit_size;
}

} // namespace tarsplit
