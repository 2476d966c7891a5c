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

#include <tarsplit/archive_writer.hpp>
#include <tarsplit/header_parser.hpp>
#include <array>
#include <format>
#include <utility>

namespace tarsplit {

namespace {

constexpr std::array<std::byte, detail::BLOCK_SIZE> zero_block{};

} // namespace

auto archive_writer::create(const std::filesystem::path &path) -> std::expected<archive_writer, error> {
    auto stream = file_output_stream::create(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    
    return archive_writer{path, std::make_unique<file_output_stream>(std::move(*stream))};
}

auto archive_writer::from_stream(std::unique_ptr<output_stream> stream) -> std::expected<archive_writer, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }
    
    return archive_writer{std::filesystem::path{}, std::move(stream)};
}

archive_writer::archive_writer(archive_writer &&other) noexcept
    : path_(std::exchange(other.path_, {}))
    , stream_(std::move(other.stream_))
    , entry_count_(std::exchange(other.entry_count_, 0))
    , sealed_(std::exchange(other.sealed_, false)) {}

archive_writer &archive_writer::operator=(archive_writer &&other) noexcept {
    if (this != &other) {
        discard();
        path_ = std::exchange(other.path_, {});
        stream_ = std::move(other.stream_);
        entry_count_ = std::exchange(other.entry_count_, 0);
        sealed_ = std::exchange(other.sealed_, false);
    }
    return *this;
}

archive_writer::~archive_writer() {
    discard();
}

void archive_writer::discard() noexcept {
    if (sealed_ || !stream_) {
        return;
    }
    
    // Dropping the stream closes the file without a trailer
    stream_.reset();
    if (!path_.empty()) {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }
}

auto archive_writer::append(const archive_entry &entry) -> std::expected<void, error> {
    if (sealed_ || !stream_) {
        return std::unexpected(error{error_code::invalid_operation, "Append to a sealed archive"});
    }
    
    if (auto written = stream_->write(entry.raw_header()); !written) {
        return std::unexpected(written.error());
    }
    
    auto copied = entry.copy_data_to(*stream_);
    if (!copied) {
        return std::unexpected(copied.error());
    }
    
    if (const uint64_t padding = detail::padded_size(*copied) - *copied; padding > 0) {
        if (auto written = stream_->write(std::span{zero_block.data(), static_cast<size_t>(padding)}); !written) {
            return std::unexpected(written.error());
        }
    }
    
    ++entry_count_;
    return {};
}

auto archive_writer::seal() -> std::expected<void, error> {
    if (sealed_ || !stream_) {
        return std::unexpected(error{error_code::invalid_operation, "Archive already sealed"});
    }
    
    for (size_t i = 0; i < TRAILER_SIZE / detail::BLOCK_SIZE; ++i) {
        if (auto written = stream_->write(zero_block); !written) {
            return std::unexpected(written.error());
        }
    }
    
    if (auto closed = stream_->close(); !closed) {
        return std::unexpected(error{closed.error().code(), 
            std::format("Failed to seal {}: {}", path_.string(), closed.error().message())});
    }
    
    sealed_ = true;
    return {};
}

} // namespace tarsplit
