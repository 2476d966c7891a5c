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

#include <tarsplit/archive_entry.hpp>
#include <format>
#include <vector>

namespace tarsplit {

auto archive_entry::copy_data_to(output_stream &output) const -> std::expected<uint64_t, error> {
    std::vector<std::byte> buffer(COPY_BUFFER_SIZE);
    uint64_t copied = 0;
    
    while (copied < stored_size_) {
        auto count = read_data(buffer);
        if (!count) {
            return std::unexpected(count.error());
        }
        if (*count == 0) {
            return std::unexpected(error{error_code::corrupt_archive, 
                std::format("Entry data for {} ended after {} of {} bytes", 
                            path().string(), copied, stored_size_)});
        }
        
        if (auto written = output.write(std::span{buffer.data(), *count}); !written) {
            return std::unexpected(written.error());
        }
        copied += *count;
    }
    
    return copied;
}

} // namespace tarsplit
