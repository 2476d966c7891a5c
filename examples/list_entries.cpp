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
 * list_entries - Lists the members of a tar archive with the footprint each one
 * counts for when the archive is split.
 * 
 * Usage: ./list_entries <tar_file>
 */

#include <tarsplit/tarsplit.hpp>
#include <format>
#include <print>
#include <string>

int main(int argc, char* argv[]) {
    if (argc != 2) {
        std::println(stderr, "Usage: {} <tar_file>", argv[0]);
        return 1;
    }
    
    auto reader = tarsplit::open_archive(argv[1]);
    if (!reader) {
        std::println(stderr, "Failed to open archive: {}", reader.error().message());
        return 1;
    }
    
    std::println("{:>1} {:<17} {:>12} {:>12} {:>16} {}", "t", "owner", "size", "footprint", "modified", "path");
    
    uint64_t total_footprint = 0;
    while (true) {
        auto entry = reader->next_entry();
        if (!entry) {
            std::println(stderr, "Failed to read entry: {}", entry.error().message());
            return 1;
        }
        if (!*entry) {
            break;
        }
        
        const auto& e = **entry;
        char type_char = e.is_regular_file() ? 'f' : '?';
        if (e.is_directory()) type_char = 'd';
        else if (e.is_symbolic_link()) type_char = 'l';
        else if (e.is_hard_link()) type_char = 'h';
        else if (e.is_sparse()) type_char = 's';
        
        auto time_t = std::chrono::system_clock::to_time_t(e.modification_time());
        
        std::string target;
        if (e.link_target()) {
            target = " -> " + *e.link_target();
        }
        
        std::println("{} {:<17} {:>12} {:>12} {} {}{}",
            type_char,
            std::format("{}/{}", e.owner_name(), e.group_name()),
            e.size(),
            e.footprint(),
            std::format("{:%Y-%m-%d %H:%M}", 
                std::chrono::system_clock::from_time_t(time_t)),
            e.path().string(),
            target);
        
        total_footprint += e.footprint();
    }
    
    std::println("\n{} entries, {} bytes of footprint", reader->entries_read(), total_footprint);
    return 0;
}
