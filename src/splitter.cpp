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

#include <tarsplit/splitter.hpp>
#include <tarsplit/archive_reader.hpp>
#include <format>

namespace tarsplit {

namespace {

auto check_paths(const split_request &request) -> std::expected<void, error> {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(request.source, ec)) {
        return std::unexpected(error{error_code::path_error, 
            std::format("Source must point to an existing archive: {}", request.source.string())});
    }
    if (!std::filesystem::is_directory(request.target, ec)) {
        return std::unexpected(error{error_code::path_error, 
            std::format("Target must point to an existing directory: {}", request.target.string())});
    }
    if (request.source.stem().empty()) {
        return std::unexpected(error{error_code::path_error, 
            std::format("Cannot derive chunk names from {}", request.source.string())});
    }
    return {};
}

} // namespace

auto split_archive(const split_request &request, const split_event_fn &on_event) 
    -> std::expected<split_summary, error> {
    if (auto checked = check_paths(request); !checked) {
        return std::unexpected(checked.error());
    }
    
    std::error_code ec;
    const uint64_t source_size = std::filesystem::file_size(request.source, ec);
    if (ec) {
        return std::unexpected(error{error_code::io_error, 
            std::format("Failed to read size of {}: {}", request.source.string(), ec.message())});
    }
    
    auto max_chunk_size = plan_chunk_size(request.chunk_size, request.num_chunks, source_size, request.limits);
    if (!max_chunk_size) {
        return std::unexpected(max_chunk_size.error());
    }
    
    if (on_event) {
        split_event event;
        event.kind = split_event_kind::planned;
        event.source_size = source_size;
        event.max_chunk_size = *max_chunk_size;
        on_event(event);
    }
    
    auto reader = archive_reader::from_file(request.source);
    if (!reader) {
        return std::unexpected(reader.error());
    }
    
    chunk_writer_options options;
    options.target_directory = request.target;
    options.prefix = request.prefix;
    options.stem = request.source.stem().string();
    options.max_chunk_size = *max_chunk_size;
    options.on_event = [&on_event, source_size](const split_event& event) {
        if (on_event) {
            split_event with_source = event;
            with_source.source_size = source_size;
            on_event(with_source);
        }
    };
    
    auto chunks = split_entries(*reader, std::move(options));
    if (!chunks) {
        return std::unexpected(chunks.error());
    }
    
    return split_summary{source_size, *max_chunk_size, std::move(*chunks)};
}

} // namespace tarsplit
