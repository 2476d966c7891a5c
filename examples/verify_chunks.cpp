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

/**
 * verify_chunks - Checks that a set of chunk archives holds exactly the members
 * of the source archive, in order, with identical headers and data.
 * 
 * Usage: ./verify_chunks <source_tar> <chunk_tar>...
 *
 * Chunks must be listed in index order.
 */

#include <tarsplit/tarsplit.hpp>
#include <algorithm>
#include <print>
#include <vector>

namespace {

// Compare the remaining data of two entries block by block
std::expected<bool, tarsplit::error> same_data(const tarsplit::archive_entry& a, 
                                               const tarsplit::archive_entry& b) {
    std::vector<std::byte> buffer_a(tarsplit::COPY_BUFFER_SIZE);
    std::vector<std::byte> buffer_b(tarsplit::COPY_BUFFER_SIZE);
    
    while (true) {
        auto read_a = a.read_data(buffer_a);
        if (!read_a) return std::unexpected(read_a.error());
        if (*read_a == 0) {
            auto read_b = b.read_data(buffer_b);
            if (!read_b) return std::unexpected(read_b.error());
            return *read_b == 0;
        }
        
        // Fill the same number of bytes from b
        size_t filled = 0;
        while (filled < *read_a) {
            auto read_b = b.read_data(std::span{buffer_b.data() + filled, *read_a - filled});
            if (!read_b) return std::unexpected(read_b.error());
            if (*read_b == 0) return false;
            filled += *read_b;
        }
        
        if (!std::equal(buffer_a.begin(), buffer_a.begin() + static_cast<std::ptrdiff_t>(*read_a), buffer_b.begin())) {
            return false;
        }
    }
}

} // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::println(stderr, "Usage: {} <source_tar> <chunk_tar>...", argv[0]);
        return 1;
    }
    
    auto source = tarsplit::open_archive(argv[1]);
    if (!source) {
        std::println(stderr, "Failed to open source: {}", source.error().message());
        return 1;
    }
    
    size_t checked = 0;
    for (int i = 2; i < argc; ++i) {
        auto chunk = tarsplit::open_archive(argv[i]);
        if (!chunk) {
            std::println(stderr, "Failed to open {}: {}", argv[i], chunk.error().message());
            return 1;
        }
        
        while (true) {
            auto chunk_entry = chunk->next_entry();
            if (!chunk_entry) {
                std::println(stderr, "{}: {}", argv[i], chunk_entry.error().message());
                return 1;
            }
            if (!*chunk_entry) {
                break;
            }
            
            auto source_entry = source->next_entry();
            if (!source_entry || !*source_entry) {
                std::println(stderr, "{}: extra entry {}", argv[i], (*chunk_entry)->path().string());
                return 1;
            }
            
            const auto& expected = **source_entry;
            const auto& actual = **chunk_entry;
            if (!std::ranges::equal(expected.raw_header(), actual.raw_header())) {
                std::println(stderr, "{}: header of {} differs", argv[i], actual.path().string());
                return 1;
            }
            
            auto data_matches = same_data(expected, actual);
            if (!data_matches) {
                std::println(stderr, "{}: {}", argv[i], data_matches.error().message());
                return 1;
            }
            if (!*data_matches) {
                std::println(stderr, "{}: data of {} differs", argv[i], actual.path().string());
                return 1;
            }
            ++checked;
        }
        
        std::println("{}: ok", argv[i]);
    }
    
    auto leftover = source->next_entry();
    if (!leftover) {
        std::println(stderr, "Source: {}", leftover.error().message());
        return 1;
    }
    if (*leftover) {
        std::println(stderr, "Missing entry {} and any that follow", (*leftover)->path().string());
        return 1;
    }
    
    std::println("All {} entries match", checked);
    return 0;
}
