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

#include <tarsplit/chunk_writer.hpp>
#include <format>

namespace tarsplit {

std::string chunk_filename(std::string_view prefix, std::string_view stem, const uint32_t index) {
    return std::format("{}_{}_{}.tar", prefix, stem, index);
}

void chunk_writer::notify(const split_event_kind kind, const chunk_info &chunk, const bool final_chunk) const {
    if (!options_.on_event) {
        return;
    }
    
    split_event event;
    event.kind = kind;
    event.chunk = chunk;
    event.final_chunk = final_chunk;
    event.max_chunk_size = options_.max_chunk_size;
    options_.on_event(event);
}

auto chunk_writer::fail(error err) -> std::expected<void, error> {
    failed_ = true;
    active_.reset();  // Removes the unsealed chunk file
    return std::unexpected(std::move(err));
}

auto chunk_writer::open_chunk() -> std::expected<void, error> {
    const auto path = options_.target_directory / chunk_filename(options_.prefix, options_.stem, chunk_index_);
    
    auto writer = archive_writer::create(path);
    if (!writer) {
        return fail(writer.error());
    }
    
    active_.emplace(std::move(*writer));
    accumulated_size_ = 0;
    notify(split_event_kind::chunk_opened, chunk_info{path, chunk_index_, 0, 0, 0});
    return {};
}

auto chunk_writer::seal_chunk(const bool final_chunk) -> std::expected<void, error> {
    if (auto sealed = active_->seal(); !sealed) {
        return fail(sealed.error());
    }
    
    chunk_info info{active_->path(), chunk_index_, active_->entry_count(), 
                    accumulated_size_, active_->bytes_written()};
    active_.reset();
    sealed_.push_back(info);
    notify(split_event_kind::chunk_sealed, info, final_chunk);
    
    ++chunk_index_;
    accumulated_size_ = 0;
    return {};
}

auto chunk_writer::append_to_active(const archive_entry &entry) -> std::expected<void, error> {
    if (!active_) {
        if (auto opened = open_chunk(); !opened) {
            return opened;
        }
    }
    
    if (auto appended = active_->append(entry); !appended) {
        return fail(error{appended.error().code(), 
            std::format("Failed to append {} to chunk {}: {}", 
                        entry.path().string(), chunk_index_, appended.error().message())});
    }
    
    accumulated_size_ += entry.footprint();
    return {};
}

auto chunk_writer::add(const archive_entry &entry) -> std::expected<void, error> {
    if (failed_ || finished_) {
        return std::unexpected(error{error_code::invalid_operation, 
            "Chunk writer no longer accepts entries"});
    }
    
    const uint64_t footprint = entry.footprint();
    const bool chunk_has_entries = active_ && active_->entry_count() > 0;
    
    // An empty chunk takes any entry, even one larger than max_chunk_size
    if (chunk_has_entries && accumulated_size_ + footprint > options_.max_chunk_size) {
        if (auto sealed = seal_chunk(false); !sealed) {
            return sealed;
        }
    }
    
    return append_to_active(entry);
}

auto chunk_writer::finish() -> std::expected<std::vector<chunk_info>, error> {
    if (failed_ || finished_) {
        return std::unexpected(error{error_code::invalid_operation, 
            "Chunk writer already finished or failed"});
    }
    
    // A source without entries still yields one valid, empty archive
    if (!active_ && sealed_.empty()) {
        if (auto opened = open_chunk(); !opened) {
            return std::unexpected(opened.error());
        }
    }
    
    if (active_) {
        if (auto sealed = seal_chunk(true); !sealed) {
            return std::unexpected(sealed.error());
        }
    }
    
    finished_ = true;
    return sealed_;
}

auto split_entries(archive_reader &reader, chunk_writer_options options) 
    -> std::expected<std::vector<chunk_info>, error> {
    chunk_writer writer{std::move(options)};
    
    while (true) {
        auto entry = reader.next_entry();
        if (!entry) {
            return std::unexpected(entry.error());
        }
        if (!*entry) {
            break;
        }
        
        if (auto added = writer.add(**entry); !added) {
            return std::unexpected(added.error());
        }
    }
    
    return writer.finish();
}

} // namespace tarsplit
