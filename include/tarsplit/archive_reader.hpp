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
#include <tarsplit/stream.hpp>
#include <tarsplit/archive_entry.hpp>
#include <tarsplit/header_parser.hpp>
#include <tarsplit/gnu_tar.hpp>
#include <tarsplit/pax_parser.hpp>
#include <array>
#include <expected>
#include <memory>
#include <optional>
#include <vector>

namespace tarsplit {

// Upper bound for the payload of a single PAX or GNU long name record
constexpr size_t MAX_EXTENSION_RECORD_SIZE = 16 * 1024 * 1024;

// Sequential reader over a tar stream. Extension records are folded into
// the member they describe, so every entry returned is a real member.
class archive_reader {
private:
    std::unique_ptr<input_stream> stream_;
    uint64_t current_entry_stored_size_ = 0;
    uint64_t current_entry_data_remaining_ = 0;  // Data remaining for the current entry
    bool finished_ = false;
    size_t entries_read_ = 0;

    // Read exactly one 512-byte block
    [[nodiscard]] std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> read_block();

    // Read size bytes plus padding and append them to raw
    [[nodiscard]] std::expected<void, error> read_padded(std::vector<std::byte>& raw, size_t size);

    // Skip padding to the next 512-byte boundary
    [[nodiscard]] std::expected<void, error> skip_padding(uint64_t data_size);

    // Skip remaining data from the current entry
    [[nodiscard]] std::expected<void, error> skip_current_entry_data();

public:
    explicit archive_reader(std::unique_ptr<input_stream> stream)
        : stream_(std::move(stream)) {}

    // Factory methods
    [[nodiscard]] static std::expected<archive_reader, error> from_file(const std::filesystem::path& path);
    [[nodiscard]] static std::expected<archive_reader, error> from_stream(std::unique_ptr<input_stream> stream);

    // Get next entry in archive. Unread data of the previous entry is skipped.
    [[nodiscard]] std::expected<std::optional<archive_entry>, error> next_entry();

    // Check if archive processing is complete
    [[nodiscard]] bool finished() const noexcept { return finished_; }

    // Members returned so far
    [[nodiscard]] size_t entries_read() const noexcept { return entries_read_; }
};

} // namespace tarsplit
