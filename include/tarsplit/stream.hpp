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
#include <expected>
#include <span>
#include <memory>
#include <filesystem>
#include <algorithm>
#include <optional>
#include <ranges>
#include <cstdio>

namespace tarsplit {

// Base interface for reading data streams
class input_stream {
public:
    virtual ~input_stream() = default;

    // Read up to buffer.size() bytes into buffer, returns actual bytes read
    [[nodiscard]] virtual std::expected<size_t, error> read(std::span<std::byte> buffer) = 0;

    // Skip n bytes in the stream
    [[nodiscard]] virtual std::expected<void, error> skip(size_t bytes) = 0;

    // Check if at end of stream
    [[nodiscard]] virtual bool at_end() const = 0;
};

// Read-only view over a caller-owned buffer
class memory_mapped_stream : public input_stream {
private:
    std::span<const std::byte> data_;
    size_t position_ = 0;

public:
    explicit memory_mapped_stream(std::span<const std::byte> data) 
        : data_(data) {}

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        size_t available = data_.size() - position_;
        size_t to_read = std::min(buffer.size(), available);
        
        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), 
                           static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;
        
        return to_read;
    }

    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override {
        if (position_ + bytes > data_.size()) {
            return std::unexpected(error{error_code::corrupt_archive, "Skip past end of stream"});
        }
        position_ += bytes;
        return {};
    }

    [[nodiscard]] bool at_end() const override { 
        return position_ >= data_.size(); 
    }
};

namespace detail {

struct file_deleter {
    void operator()(std::FILE* f) const {
        if (f) std::fclose(f);
    }
};

} // namespace detail

// File-based stream. When the file size is known, skipping past it fails
// instead of leaving the position beyond the end.
class file_stream : public input_stream {
private:
    std::unique_ptr<std::FILE, detail::file_deleter> file_;
    std::optional<size_t> file_size_;

public:
    [[nodiscard]] static std::expected<file_stream, error> open(const std::filesystem::path& path);

    [[nodiscard]] std::expected<size_t, error> read(std::span<std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> skip(size_t bytes) override;
    [[nodiscard]] bool at_end() const override;

private:
    explicit file_stream(std::FILE* file, std::optional<size_t> size);
};

// Base interface for writing data streams
class output_stream {
public:
    virtual ~output_stream() = default;

    // Write the whole buffer or fail
    [[nodiscard]] virtual std::expected<void, error> write(std::span<const std::byte> buffer) = 0;

    // Push buffered bytes to the underlying device
    [[nodiscard]] virtual std::expected<void, error> flush() = 0;

    // Flush and release the underlying device
    [[nodiscard]] virtual std::expected<void, error> close() = 0;

    // Total bytes accepted by write() so far
    [[nodiscard]] virtual size_t bytes_written() const = 0;
};

// File-based output stream, created or truncated on open
class file_output_stream : public output_stream {
private:
    std::unique_ptr<std::FILE, detail::file_deleter> file_;
    size_t bytes_written_ = 0;

public:
    [[nodiscard]] static std::expected<file_output_stream, error> create(const std::filesystem::path& path);

    [[nodiscard]] std::expected<void, error> write(std::span<const std::byte> buffer) override;
    [[nodiscard]] std::expected<void, error> flush() override;
    // Reports errors fclose would otherwise swallow
    [[nodiscard]] std::expected<void, error> close() override;
    [[nodiscard]] size_t bytes_written() const override { return bytes_written_; }

    [[nodiscard]] bool is_open() const noexcept { return file_ != nullptr; }

private:
    explicit file_output_stream(std::FILE* file);
};

} // namespace tarsplit
