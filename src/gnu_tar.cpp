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

#include <tarsplit/gnu_tar.hpp>
#include <algorithm>

namespace tarsplit::gnu {

std::string extension_string(std::span<const std::byte> data) {
    std::string result;
    result.reserve(data.size());
    for (auto b : data) {
        result.push_back(static_cast<char>(b));
    }
    
    // GNU extensions are null-terminated, so remove trailing nulls
    while (!result.empty() && result.back() == '\0') {
        result.pop_back();
    }
    
    return result;
}

void apply_gnu_extensions(file_metadata& metadata, const gnu_extension_data& extensions) {
    if (extensions.has_longname()) {
        metadata.path = std::filesystem::path{extensions.longname};
    }
    
    if (extensions.has_longlink()) {
        metadata.link_target = extensions.longlink;
    }
}

bool is_gnu_tar_magic(std::string_view magic) {
    // GNU tar uses "ustar  " (with spaces) or "ustar\0" 
    return magic == "ustar " || magic == "ustar";
}

bool has_sparse_continuation(std::span<const std::byte, detail::BLOCK_SIZE> header_block) {
    return header_block[SPARSE_HEADER_EXTENDED_OFFSET] != std::byte{0};
}

bool continuation_is_extended(std::span<const std::byte, detail::BLOCK_SIZE> block) {
    return block[SPARSE_CONTINUATION_EXTENDED_OFFSET] != std::byte{0};
}

} // namespace tarsplit::gnu
