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
#include <cstdint>
#include <expected>
#include <optional>

namespace tarsplit {

// Limits applied when planning a split
struct size_limits {
    // Smallest accepted source archive and chunk size, in bytes
    uint64_t min_archive_size = 1024;
    // Chunk counts at or below this value are rejected
    uint32_t min_chunk_count = 2;
};

inline constexpr size_limits default_limits{};

// Turn either an explicit maximum chunk size or a desired chunk count into
// the maximum chunk size used for splitting a source of source_size bytes.
//
// With a chunk count the result is source_size / chunk_count rounded to the
// nearest byte. The value is a ceiling per chunk, not an average, so the
// number of chunks produced may differ slightly from the count asked for.
[[nodiscard]] std::expected<uint64_t, error> plan_chunk_size(
    std::optional<uint64_t> explicit_size,
    std::optional<uint32_t> chunk_count,
    uint64_t source_size,
    const size_limits& limits = default_limits);

} // namespace tarsplit
