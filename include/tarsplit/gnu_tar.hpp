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

#include <tarsplit/metadata.hpp>
#include <tarsplit/header_parser.hpp>
#include <string>
#include <string_view>
#include <span>

namespace tarsplit::gnu {

// Offset of the "isextended" flag in an old GNU sparse header
constexpr size_t SPARSE_HEADER_EXTENDED_OFFSET = 482;
// Offset of the "isextended" flag in a sparse continuation block
constexpr size_t SPARSE_CONTINUATION_EXTENDED_OFFSET = 504;

// GNU tar extension data
struct gnu_extension_data {
    std::string longname;     // From 'L' type entries
    std::string longlink;     // From 'K' type entries
    
    [[nodiscard]] bool has_longname() const noexcept { return !longname.empty(); }
    [[nodiscard]] bool has_longlink() const noexcept { return !longlink.empty(); }
    
    void clear() {
        longname.clear();
        longlink.clear();
    }
};

// Decode the payload of an 'L' or 'K' record (NUL padded)
[[nodiscard]] std::string extension_string(std::span<const std::byte> data);

// Apply GNU extensions to metadata
void apply_gnu_extensions(file_metadata& metadata, const gnu_extension_data& extensions);

// Check if magic indicates GNU tar format
[[nodiscard]] bool is_gnu_tar_magic(std::string_view magic);

// True when an old GNU sparse header is followed by another map block
[[nodiscard]] bool has_sparse_continuation(std::span<const std::byte, detail::BLOCK_SIZE> header_block);

// True when a sparse continuation block is followed by another one
[[nodiscard]] bool continuation_is_extended(std::span<const std::byte, detail::BLOCK_SIZE> block);

} // namespace tarsplit::gnu
