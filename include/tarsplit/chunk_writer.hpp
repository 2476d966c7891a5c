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
#include <tarsplit/archive_entry.hpp>
#include <tarsplit/archive_reader.hpp>
#include <tarsplit/archive_writer.hpp>
#include <expected>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace tarsplit {

// A sealed output archive
struct chunk_info {
    std::filesystem::path path;
    uint32_t index = 0;
    size_t entry_count = 0;
    uint64_t footprint = 0;       // Accumulated entry footprints
    uint64_t bytes_written = 0;   // File size including the trailer
};

enum class split_event_kind {
    planned,        // Source measured and maximum chunk size known
    chunk_opened,
    chunk_sealed    // Boundary crossed or end of source reached
};

struct split_event {
    split_event_kind kind = split_event_kind::planned;
    chunk_info chunk;
    // Set on the chunk_sealed event emitted at end of source
    bool final_chunk = false;
    uint64_t source_size = 0;
    uint64_t max_chunk_size = 0;
};

using split_event_fn = std::function<void(const split_event&)>;

// "{prefix}_{stem}_{index}.tar"
[[nodiscard]] std::string chunk_filename(std::string_view prefix, std::string_view stem, uint32_t index);

struct chunk_writer_options {
    std::filesystem::path target_directory;
    std::string prefix = "split";
    std::string stem;
    uint64_t max_chunk_size = 0;
    split_event_fn on_event;
};

// Distributes source entries over a sequence of output archives.
//
// Entries are appended in the order given. Before an entry is appended the
// writer seals the open chunk if the entry's footprint would take the
// chunk past max_chunk_size, unless the chunk is still empty. Output files
// are created when the first entry for them arrives; finish() seals the last
// one, creating an empty archive if no entry was ever added.
//
// Any failure is final: the chunk being written is removed, chunks sealed
// earlier stay on disk, and further calls return invalid_operation.
class chunk_writer {
private:
    chunk_writer_options options_;
    std::optional<archive_writer> active_;
    uint32_t chunk_index_ = 0;
    uint64_t accumulated_size_ = 0;
    std::vector<chunk_info> sealed_;
    bool failed_ = false;
    bool finished_ = false;

    [[nodiscard]] std::expected<void, error> open_chunk();
    [[nodiscard]] std::expected<void, error> seal_chunk(bool final_chunk);
    [[nodiscard]] std::expected<void, error> append_to_active(const archive_entry& entry);
    [[nodiscard]] std::expected<void, error> fail(error err);
    void notify(split_event_kind kind, const chunk_info& chunk, bool final_chunk = false) const;

public:
    explicit chunk_writer(chunk_writer_options options)
        : options_(std::move(options)) {}

    // Place one entry, crossing a chunk boundary first if needed
    [[nodiscard]] std::expected<void, error> add(const archive_entry& entry);

    // Seal the open chunk and return every chunk written
    [[nodiscard]] std::expected<std::vector<chunk_info>, error> finish();

    // Index of the chunk the next entry would go to
    [[nodiscard]] uint32_t chunk_index() const noexcept { return chunk_index_; }

    // Footprint accumulated in the open chunk
    [[nodiscard]] uint64_t accumulated_size() const noexcept { return accumulated_size_; }

    [[nodiscard]] const std::vector<chunk_info>& sealed_chunks() const noexcept { return sealed_; }
};

// Feed every entry of reader through a chunk_writer
[[nodiscard]] std::expected<std::vector<chunk_info>, error> split_entries(
    archive_reader& reader, chunk_writer_options options);

} // namespace tarsplit
