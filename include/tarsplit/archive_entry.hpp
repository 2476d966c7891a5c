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
#include <tarsplit/header_parser.hpp>
#include <tarsplit/stream.hpp>
#include <expected>
#include <span>
#include <functional>
#include <filesystem>
#include <algorithm>
#include <vector>

namespace tarsplit {

// Reads the next slice of an entry's stored data into buffer.
// Returns the number of bytes read, 0 once the data is exhausted.
using data_reader_fn = std::function<std::expected<size_t, error>(std::span<std::byte> buffer)>;

// Buffer size used when streaming entry data between archives
constexpr size_t COPY_BUFFER_SIZE = 64 * 1024;

// One member of a source archive.
//
// The raw header holds every block that precedes the member's data: any
// PAX or GNU extension records that belong to it, the ustar header itself
// and old GNU sparse continuation blocks. The data reader is a view into
// the source stream and stays valid until the reader moves to the next entry.
class archive_entry {
private:
    file_metadata metadata_;
    std::vector<std::byte> raw_header_;
    uint64_t stored_size_ = 0;
    data_reader_fn reader_;

public:
    archive_entry(file_metadata metadata, std::vector<std::byte> raw_header,
                  const uint64_t stored_size, data_reader_fn reader)
        : metadata_(std::move(metadata))
        , raw_header_(std::move(raw_header))
        , stored_size_(stored_size)
        , reader_(std::move(reader)) {}

    // Metadata accessors
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return metadata_.path; }
    [[nodiscard]] entry_type type() const noexcept { return metadata_.type; }
    [[nodiscard]] uint64_t size() const noexcept { return metadata_.size; }
    [[nodiscard]] const std::chrono::system_clock::time_point& modification_time() const noexcept { 
        return metadata_.modification_time; 
    }
    [[nodiscard]] const std::string& owner_name() const noexcept { return metadata_.owner_name; }
    [[nodiscard]] const std::string& group_name() const noexcept { return metadata_.group_name; }
    [[nodiscard]] const std::optional<std::string>& link_target() const noexcept { return metadata_.link_target; }

    [[nodiscard]] bool is_regular_file() const noexcept { return metadata_.is_regular_file(); }
    [[nodiscard]] bool is_directory() const noexcept { return metadata_.is_directory(); }
    [[nodiscard]] bool is_symbolic_link() const noexcept { return metadata_.is_symbolic_link(); }
    [[nodiscard]] bool is_hard_link() const noexcept { return metadata_.is_hard_link(); }
    [[nodiscard]] bool is_sparse() const noexcept { return metadata_.is_sparse(); }

    // Raw header blocks exactly as they appear in the source archive
    [[nodiscard]] std::span<const std::byte> raw_header() const noexcept { return raw_header_; }

    // Number of data bytes that follow the header in the archive
    [[nodiscard]] uint64_t stored_size() const noexcept { return stored_size_; }

    // Bytes an archive writer emits for this entry: header blocks plus the
    // data padded to the block boundary
    [[nodiscard]] uint64_t archived_size() const noexcept {
        return raw_header_.size() + detail::padded_size(stored_size_);
    }

    // Cost of the entry when accounting chunk sizes. The data part never
    // counts for less than one block.
    [[nodiscard]] uint64_t footprint() const noexcept {
        return raw_header_.size() + std::max<uint64_t>(detail::BLOCK_SIZE, detail::padded_size(stored_size_));
    }

    // Read the next slice of stored data
    [[nodiscard]] std::expected<size_t, error> read_data(std::span<std::byte> buffer) const {
        return reader_(buffer);
    }

    // Stream all remaining stored data to output through a bounded buffer.
    // Fails if the source ends before stored_size() bytes were delivered.
    [[nodiscard]] std::expected<uint64_t, error> copy_data_to(output_stream& output) const;
};

} // namespace tarsplit
