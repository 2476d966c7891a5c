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

#include <tarsplit/archive_reader.hpp>
#include <tarsplit/stream.hpp>
#include <algorithm>
#include <format>

namespace tarsplit {

namespace {

// Member types whose size field never describes data blocks
bool carries_no_data(const entry_type type) {
    switch (type) {
        case entry_type::hard_link:
        case entry_type::symbolic_link:
        case entry_type::character_device:
        case entry_type::block_device:
        case entry_type::directory:
        case entry_type::fifo:
            return true;
        default:
            return false;
    }
}

void append_block(std::vector<std::byte>& raw, std::span<const std::byte, detail::BLOCK_SIZE> block) {
    raw.insert(raw.end(), block.begin(), block.end());
}

} // namespace

auto archive_reader::from_file(const std::filesystem::path &path) -> std::expected<archive_reader, error> {
    auto stream = file_stream::open(path);
    if (!stream) {
        return std::unexpected(stream.error());
    }
    
    return archive_reader{std::make_unique<file_stream>(std::move(*stream))};
}

auto archive_reader::from_stream(std::unique_ptr<input_stream> stream) -> std::expected<archive_reader, error> {
    if (!stream) {
        return std::unexpected(error{error_code::invalid_operation, "Null stream provided"});
    }
    
    return archive_reader{std::move(stream)};
}

auto archive_reader::read_block() -> std::expected<std::array<std::byte, detail::BLOCK_SIZE>, error> {
    std::array<std::byte, detail::BLOCK_SIZE> block{};
    auto result = stream_->read(block);
    if (!result) {
        return std::unexpected(result.error());
    }
    
    if (*result != detail::BLOCK_SIZE) {
        if (*result == 0 && stream_->at_end()) {
            return std::unexpected(error{error_code::end_of_archive, "Unexpected end of archive"});
        }
        return std::unexpected(error{error_code::corrupt_archive, "Incomplete block read"});
    }
    
    return block;
}

auto archive_reader::read_padded(std::vector<std::byte> &raw, const size_t size) -> std::expected<void, error> {
    const size_t padded = static_cast<size_t>(detail::padded_size(size));
    const size_t offset = raw.size();
    raw.resize(offset + padded);
    
    size_t filled = 0;
    while (filled < padded) {
        auto result = stream_->read(std::span{raw.data() + offset + filled, padded - filled});
        if (!result) {
            return std::unexpected(result.error());
        }
        if (*result == 0) {
            return std::unexpected(error{error_code::corrupt_archive, 
                "Unexpected end of archive in extension record"});
        }
        filled += *result;
    }
    return {};
}

auto archive_reader::skip_padding(const uint64_t data_size) -> std::expected<void, error> {
    const uint64_t padding = detail::padded_size(data_size) - data_size;
    if (padding > 0) {
        return stream_->skip(static_cast<size_t>(padding));
    }
    return {};
}

auto archive_reader::skip_current_entry_data() -> std::expected<void, error> {
    if (current_entry_data_remaining_ > 0) {
        auto skip_result = stream_->skip(static_cast<size_t>(current_entry_data_remaining_));
        if (!skip_result) {
            return std::unexpected(skip_result.error());
        }
    }
    
    // Padding follows the data even when the caller consumed all of it
    if (current_entry_stored_size_ > 0) {
        auto padding_result = skip_padding(current_entry_stored_size_);
        if (!padding_result) {
            return std::unexpected(padding_result.error());
        }
    }
    
    current_entry_stored_size_ = 0;
    current_entry_data_remaining_ = 0;
    
    return {};
}

auto archive_reader::next_entry() -> std::expected<std::optional<archive_entry>, error> {
    if (finished_) {
        return std::nullopt;
    }
    
    if (auto skip_result = skip_current_entry_data(); !skip_result) {
        return std::unexpected(skip_result.error());
    }
    
    std::vector<std::byte> raw_header;
    gnu::gnu_extension_data pending_gnu_extensions;
    std::optional<pax::pax_headers> pending_pax_headers;
    
    // Collect extension records until the member header they describe
    while (true) {
        auto block_result = read_block();
        if (!block_result) {
            if (block_result.error().code() == error_code::end_of_archive) {
                if (!raw_header.empty()) {
                    return std::unexpected(error{error_code::corrupt_archive, 
                        "Archive ends after an extension record"});
                }
                finished_ = true;
                return std::nullopt;
            }
            return std::unexpected(block_result.error());
        }
        
        // Check for end-of-archive (two zero blocks)
        if (detail::is_zero_block(*block_result)) {
            if (!raw_header.empty()) {
                return std::unexpected(error{error_code::corrupt_archive, 
                    "End-of-archive marker after an extension record"});
            }
            auto second_block = read_block();
            if (!second_block) {
                if (second_block.error().code() != error_code::end_of_archive) {
                    return std::unexpected(second_block.error());
                }
                finished_ = true;
                return std::nullopt;  // Single zero block at end of file
            }
            if (detail::is_zero_block(*second_block)) {
                finished_ = true;
                return std::nullopt;  // Normal end of archive
            }
            return std::unexpected(error{error_code::corrupt_archive, "Single zero block in archive"});
        }
        
        auto metadata_result = detail::parse_header(*block_result);
        if (!metadata_result) {
            return std::unexpected(metadata_result.error());
        }
        
        append_block(raw_header, *block_result);
        
        if (!metadata_result->is_extension_record()) {
            // Old GNU sparse maps may continue in extra blocks before the data
            if (metadata_result->is_sparse() && gnu::has_sparse_continuation(*block_result)) {
                while (true) {
                    auto continuation = read_block();
                    if (!continuation) {
                        return std::unexpected(error{error_code::corrupt_archive, 
                            "Truncated sparse map continuation: " + continuation.error().message()});
                    }
                    append_block(raw_header, *continuation);
                    if (!gnu::continuation_is_extended(*continuation)) {
                        break;
                    }
                }
            }
            
            auto final_metadata = std::move(*metadata_result);
            gnu::apply_gnu_extensions(final_metadata, pending_gnu_extensions);
            if (pending_pax_headers) {
                if (auto applied = pax::apply_pax_headers(final_metadata, *pending_pax_headers); !applied) {
                    return std::unexpected(applied.error());
                }
            }
            
            current_entry_stored_size_ = carries_no_data(final_metadata.type) ? 0 : final_metadata.size;
            current_entry_data_remaining_ = current_entry_stored_size_;
            
            auto* stream_ptr = stream_.get();
            auto* remaining_ptr = &current_entry_data_remaining_;
            
            data_reader_fn reader = [stream_ptr, remaining_ptr](std::span<std::byte> buffer)
                -> std::expected<size_t, error> {
                const size_t to_read = static_cast<size_t>(
                    std::min<uint64_t>(buffer.size(), *remaining_ptr));
                if (to_read == 0) {
                    return size_t{0};
                }
                
                auto result = stream_ptr->read(buffer.first(to_read));
                if (!result) {
                    return std::unexpected(result.error());
                }
                if (*result == 0) {
                    return std::unexpected(error{error_code::corrupt_archive, 
                        "Unexpected end of archive in entry data"});
                }
                
                *remaining_ptr -= *result;
                return *result;
            };
            
            ++entries_read_;
            return archive_entry{std::move(final_metadata), std::move(raw_header), 
                                 current_entry_stored_size_, std::move(reader)};
        }
        
        // Extension record: keep its payload with the header bytes
        const auto& meta = *metadata_result;
        if (meta.size > MAX_EXTENSION_RECORD_SIZE) {
            return std::unexpected(error{error_code::corrupt_archive, 
                std::format("Extension record of {} bytes exceeds limit", meta.size)});
        }
        
        const size_t payload_offset = raw_header.size();
        if (auto read_result = read_padded(raw_header, static_cast<size_t>(meta.size)); !read_result) {
            return std::unexpected(read_result.error());
        }
        const std::span<const std::byte> payload{raw_header.data() + payload_offset, 
                                                 static_cast<size_t>(meta.size)};
        
        switch (meta.type) {
            case entry_type::gnu_longname:
                pending_gnu_extensions.longname = gnu::extension_string(payload);
                break;
            case entry_type::gnu_longlink:
                pending_gnu_extensions.longlink = gnu::extension_string(payload);
                break;
            case entry_type::pax_extended_header: {
                auto parsed = pax::parse_pax_headers(payload);
                if (!parsed) {
                    return std::unexpected(parsed.error());
                }
                pending_pax_headers = std::move(*parsed);
                break;
            }
            default:
                // Global PAX headers apply to the whole archive; they travel
                // with the next member but change none of its metadata
                break;
        }
    }
}

} // namespace tarsplit
