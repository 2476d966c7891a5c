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
 * tarsplit - Splits a tar archive into smaller tar archives along entry boundaries.
 * 
 * Usage: ./tarsplit [-c SIZE | -n COUNT] [-p PREFIX] SOURCE TARGET
 */

#include <tarsplit/tarsplit.hpp>
#include <tarsplit/command_line.hpp>
#include <filesystem>
#include <print>

namespace {

void report(const tarsplit::split_event& event) {
    using tarsplit::split_event_kind;
    
    switch (event.kind) {
        case split_event_kind::planned:
            std::println("::: INFO: Source archive is {} bytes", event.source_size);
            std::println("::: INFO: Maximum chunk size will be {} bytes", event.max_chunk_size);
            break;
        case split_event_kind::chunk_opened:
            std::println("::: INFO: Started chunk {} ({})", event.chunk.index, event.chunk.path.string());
            break;
        case split_event_kind::chunk_sealed:
            if (event.final_chunk) {
                std::println("::: INFO: Writing final chunk {}", event.chunk.index);
            } else {
                std::println("::: INFO: Reached chunk boundary, writing chunk {}", event.chunk.index);
            }
            std::println("::: INFO:   {} entries, {} bytes of entries, {} bytes on disk",
                event.chunk.entry_count, event.chunk.footprint, event.chunk.bytes_written);
            if (event.chunk.footprint > event.max_chunk_size) {
                std::println("::: WARN: Chunk {} exceeds the maximum chunk size because of an oversized entry",
                    event.chunk.index);
            }
            break;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    const std::string program = std::filesystem::path{argv[0]}.filename().string();
    
    auto command = tarsplit::parse_command_line(argc, argv);
    if (!command) {
        std::println(stderr, "::: ERROR: {}", command.error().message());
        std::print(stderr, "\n{}", tarsplit::usage(program));
        return 1;
    }
    
    if (command->show_help) {
        std::print("{}", tarsplit::usage(program));
        return 0;
    }
    if (command->show_version) {
        std::println("{} {}", program, tarsplit::VERSION);
        return 0;
    }
    
    auto summary = tarsplit::split_archive(command->request, report);
    if (!summary) {
        std::println(stderr, "::: ERROR: {}: {}", 
            tarsplit::to_string(summary.error().code()), summary.error().message());
        return 1;
    }
    
    std::println("::: INFO: Wrote {} chunks to {}", summary->chunks.size(), command->request.target.string());
    return 0;
}
