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
#include <map>
#include <string>
#include <expected>
#include <span>

namespace tarsplit::pax {

using pax_headers = std::map<std::string, std::string>;

// Parse PAX extended header format
// : "length key=value\n"
// Example: "25 path=long/file/name.txt\n"
[[nodiscard]] std::expected<pax_headers, error> parse_pax_headers(std::span<const std::byte> data);

// Apply the standard overrides (path, linkpath, size, uname, gname, mtime)
// to the metadata of the member that follows the record
[[nodiscard]] std::expected<void, error> apply_pax_headers(file_metadata& metadata, const pax_headers& headers);

} // namespace tarsplit::pax
