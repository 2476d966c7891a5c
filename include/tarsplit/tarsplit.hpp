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
#include <tarsplit/stream.hpp>
#include <tarsplit/archive_reader.hpp>
#include <tarsplit/archive_entry.hpp>
#include <tarsplit/archive_writer.hpp>
#include <tarsplit/size_planner.hpp>
#include <tarsplit/chunk_writer.hpp>
#include <tarsplit/splitter.hpp>

namespace tarsplit {

// Main convenience API
[[nodiscard]] std::expected<archive_reader, error> open_archive(const std::filesystem::path& path);
[[nodiscard]] std::expected<archive_reader, error> open_archive(std::unique_ptr<input_stream> stream);

} // namespace tarsplit
