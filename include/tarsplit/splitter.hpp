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
#include <tarsplit/size_planner.hpp>
#include <tarsplit/chunk_writer.hpp>
#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tarsplit {

constexpr std::string_view DEFAULT_PREFIX = "split";

// A validated request to split one archive. Exactly one of chunk_size and
// num_chunks is expected to be set.
struct split_request {
    size_limits limits = default_limits;
    std::optional<uint64_t> chunk_size;
    std::optional<uint32_t> num_chunks;
    std::string prefix{DEFAULT_PREFIX};
    std::filesystem::path source;
    std::filesystem::path target;
};

struct split_summary {
    uint64_t source_size = 0;
    uint64_t max_chunk_size = 0;
    std::vector<chunk_info> chunks;
};

// Check the source and target paths, plan the chunk size and split the
// source archive into target. Progress is reported through on_event.
[[nodiscard]] std::expected<split_summary, error> split_archive(
    const split_request& request,
    const split_event_fn& on_event = {});

} // namespace tarsplit
