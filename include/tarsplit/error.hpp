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

#include <expected>
#include <string>
#include <string_view>
#include <system_error>

namespace tarsplit {

enum class error_code {
    invalid_header,
    corrupt_archive,
    io_error,
    invalid_operation,
    end_of_archive,
    // Rejected before any I/O: bad chunk size/count or source too small
    invalid_configuration,
    // Source is not a regular file or target is not a directory
    path_error
};

class error {
public:
    error(const error_code code, std::string message)
        : code_(code), message_(std::move(message)) {}

    [[nodiscard]] error_code code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }

private:
    error_code code_;
    std::string message_;
};

// Short name of an error category, used when reporting failures
[[nodiscard]] constexpr std::string_view to_string(const error_code code) noexcept {
    switch (code) {
        case error_code::invalid_header: return "invalid header";
        case error_code::corrupt_archive: return "corrupt archive";
        case error_code::io_error: return "I/O error";
        case error_code::invalid_operation: return "invalid operation";
        case error_code::end_of_archive: return "end of archive";
        case error_code::invalid_configuration: return "configuration error";
        case error_code::path_error: return "path error";
    }
    return "unknown error";
}

} // namespace tarsplit
