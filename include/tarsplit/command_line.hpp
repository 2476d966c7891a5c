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
#include <tarsplit/splitter.hpp>
#include <expected>
#include <string>
#include <string_view>

namespace tarsplit {

constexpr std::string_view VERSION = "1.0.0";

struct command_line {
    split_request request;
    bool show_help = false;
    bool show_version = false;
};

// Parse the tarsplit command line:
//   tarsplit [-c SIZE | -n COUNT] [-p PREFIX] SOURCE TARGET
// Fails with invalid_configuration on unknown options, malformed numbers,
// a missing or duplicated size/count choice, or a wrong number of operands.
[[nodiscard]] std::expected<command_line, error> parse_command_line(int argc, char* argv[]);

[[nodiscard]] std::string usage(std::string_view program);

} // namespace tarsplit
