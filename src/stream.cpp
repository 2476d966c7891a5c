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

#include <tarsplit/stream.hpp>
#include <algorithm>
#include <cstdio>
#include <cerrno>
#include <cstring>
#include <format>

namespace tarsplit {

// file_stream implementation
file_stream::file_stream(std::FILE* file, const std::optional<size_t> size)
    : file_(file), file_size_(size) {}

auto file_stream::open(const std::filesystem::path &path) -> std::expected<file_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "rb");
    if (!file) {
        return std::unexpected(error{error_code::io_error, 
            "Failed to open file: " + std::string{std::strerror(errno)}});
    }
    
    // Try to get file size
    std::optional<size_t> file_size;
    if (std::fseek(file, 0, SEEK_END) == 0) {
        if (const long pos = std::ftell(file); pos >= 0) {
            file_size = static_cast<size_t>(pos);
        }
        if (std::fseek(file, 0, SEEK_SET) != 0) {
            std::fclose(file);
            return std::unexpected(error{error_code::io_error, 
                "File seek error: " + std::string{std::strerror(errno)}});
        }
    }
    
    return file_stream{file, file_size};
}

auto file_stream::read(std::span<std::byte> buffer) -> std::expected<size_t, error> {
    size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), file_.get());
    
    if (bytes_read == 0 && std::ferror(file_.get())) {
        return std::unexpected(error{error_code::io_error, 
            "File read error: " + std::string{std::strerror(errno)}});
    }
    
    return bytes_read;
}

auto file_stream::skip(size_t bytes) -> std::expected<void, error> {
    if (file_size_.has_value()) {
        const long pos = std::ftell(file_.get());
        if (pos < 0) {
            return std::unexpected(error{error_code::io_error, 
                "File tell error: " + std::string{std::strerror(errno)}});
        }
        if (bytes > file_size_.value() - std::min(static_cast<size_t>(pos), file_size_.value())) {
            return std::unexpected(error{error_code::corrupt_archive, 
                std::format("Skip of {} bytes at offset {} runs past end of file", bytes, pos)});
        }
    }
    
    if (std::fseek(file_.get(), static_cast<long>(bytes), SEEK_CUR) != 0) {
        return std::unexpected(error{error_code::io_error, 
            "File seek error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

bool file_stream::at_end() const {
    // If we know the file size, check if position equals size
    if (file_size_.has_value()) {
        long pos = std::ftell(file_.get());
        if (pos >= 0) {
            return static_cast<size_t>(pos) >= file_size_.value();
        }
    }
    
    // Fall back to checking EOF flag
    return std::feof(file_.get()) != 0;
}

// file_output_stream implementation
file_output_stream::file_output_stream(std::FILE* file)
    : file_(file) {}

auto file_output_stream::create(const std::filesystem::path &path) -> std::expected<file_output_stream, error> {
    std::FILE* file = std::fopen(path.c_str(), "wb");
    if (!file) {
        return std::unexpected(error{error_code::io_error, 
            "Failed to create file " + path.string() + ": " + std::string{std::strerror(errno)}});
    }
    return file_output_stream{file};
}

auto file_output_stream::write(std::span<const std::byte> buffer) -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Write to closed stream"});
    }
    if (buffer.empty()) {
        return {};
    }
    
    const size_t written = std::fwrite(buffer.data(), 1, buffer.size(), file_.get());
    bytes_written_ += written;
    if (written != buffer.size()) {
        return std::unexpected(error{error_code::io_error, 
            "File write error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

auto file_output_stream::flush() -> std::expected<void, error> {
    if (!file_) {
        return std::unexpected(error{error_code::invalid_operation, "Flush of closed stream"});
    }
    if (std::fflush(file_.get()) != 0) {
        return std::unexpected(error{error_code::io_error, 
            "File flush error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

auto file_output_stream::close() -> std::expected<void, error> {
    if (!file_) {
        return {};
    }
    
    // Release before fclose so a failing close never closes twice
    std::FILE* file = file_.release();
    if (std::fclose(file) != 0) {
        return std::unexpected(error{error_code::io_error, 
            "File close error: " + std::string{std::strerror(errno)}});
    }
    return {};
}

} // namespace tarsplit
