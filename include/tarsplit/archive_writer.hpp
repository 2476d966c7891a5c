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
#include <expected>
#include <filesystem>
#include <memory>

namespace tarsplit {

// Size of the end-of-archive marker: two zero blocks
constexpr size_t TRAILER_SIZE = 2 * detail::BLOCK_SIZE;

// Writes one output archive.
//
// Entries are copied byte-for-byte from their source archive. seal() writes
// the end-of-archive trailer and closes the output, after which the writer
// accepts nothing more. A writer destroyed before seal() closes its file and
// removes it, so an interrupted run never leaves a truncated archive behind.
class archive_writer {
private:
    std::filesystem::path path_;
    std::unique_ptr<output_stream> stream_;
    size_t entry_count_ = 0;
    bool sealed_ = false;

    archive_writer(std::filesystem::path path, std::unique_ptr<output_stream> stream)
        : path_(std::move(path)), stream_(std::move(stream)) {}

    // Close and delete an unsealed output
    void discard() noexcept;

public:
    // Create (or truncate) the archive file at path
    [[nodiscard]] static std::expected<archive_writer, error> create(const std::filesystem::path& path);

    // Write into a caller-supplied stream; nothing is deleted on discard
    [[nodiscard]] static std::expected<archive_writer, error> from_stream(std::unique_ptr<output_stream> stream);

    archive_writer(archive_writer&& other) noexcept;
    archive_writer& operator=(archive_writer&& other) noexcept;
    archive_writer(const archive_writer&) = delete;
    archive_writer& operator=(const archive_writer&) = delete;
    ~archive_writer();

    // Copy header blocks, data and padding of entry
    [[nodiscard]] std::expected<void, error> append(const archive_entry& entry);

    // Write the trailer and close the output
    [[nodiscard]] std::expected<void, error> seal();

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }
    [[nodiscard]] size_t entry_count() const noexcept { return entry_count_; }
    [[nodiscard]] bool is_sealed() const noexcept { return sealed_; }
    [[nodiscard]] uint64_t bytes_written() const noexcept { return stream_ ? stream_->bytes_written() : 0; }
};

} // namespace tarsplit
