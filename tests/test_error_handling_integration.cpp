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

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>
#include <tarsplit/tarsplit.hpp>
#include "test_archives.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <optional>
#include <vector>

using namespace tarsplit;
using test_support::tar_builder;
using Catch::Matchers::ContainsSubstring;
namespace fs = std::filesystem;

namespace {

// First failure while reading every member and its data
std::optional<error> first_error(std::vector<std::byte> archive) {
    auto reader = open_archive(std::make_unique<memory_mapped_stream>(archive));
    REQUIRE(reader.has_value());
    
    while (true) {
        auto entry = reader->next_entry();
        if (!entry) {
            return entry.error();
        }
        if (!*entry) {
            return std::nullopt;
        }
        
        std::vector<std::byte> sink;
        test_support::memory_output_stream output{sink};
        if (auto copied = (*entry)->copy_data_to(output); !copied) {
            return copied.error();
        }
    }
}

} // anonymous namespace

TEST_CASE("Error handling in archive opening", "[integration][error_handling]") {
    test_support::TempDir dir;
    
    SECTION("Non-existent file") {
        auto result = open_archive(dir / "missing.tar");
        
        REQUIRE_FALSE(result.has_value());
        CHECK(result.error().code() == error_code::io_error);
        CHECK_THAT(result.error().message(), ContainsSubstring("Failed to open"));
    }
    
    SECTION("Directory instead of file") {
        auto result = open_archive(dir.path());
        
        // Linux opens directories for reading; the first read fails
        if (result.has_value()) {
            auto entry = result->next_entry();
            REQUIRE_FALSE(entry.has_value());
            CHECK(entry.error().code() == error_code::io_error);
        } else {
            CHECK(result.error().code() == error_code::io_error);
        }
    }
    
    SECTION("Empty file") {
        test_support::write_file(dir / "empty.tar", {});
        
        auto result = open_archive(dir / "empty.tar");
        
        REQUIRE(result.has_value());
        auto entry = result->next_entry();
        REQUIRE(entry.has_value());
        CHECK_FALSE(entry->has_value());
        CHECK(result->finished());
    }
    
    SECTION("File that's not a tar archive") {
        const std::string text = "This is just plain text, not a tar file at all!";
        std::vector<std::byte> bytes(1024);
        std::memcpy(bytes.data(), text.data(), text.size());
        test_support::write_file(dir / "text.tar", bytes);
        
        auto result = open_archive(dir / "text.tar");
        REQUIRE(result.has_value());
        
        // No magic, so it reads as a v7 header whose checksum cannot match
        auto entry = result->next_entry();
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::corrupt_archive);
        CHECK_THAT(entry.error().message(), ContainsSubstring("checksum"));
    }
    
    SECTION("File with a foreign magic") {
        std::vector<std::byte> bytes(1024, std::byte{'z'});
        test_support::write_file(dir / "zip.tar", bytes);
        
        auto result = open_archive(dir / "zip.tar");
        REQUIRE(result.has_value());
        
        auto entry = result->next_entry();
        REQUIRE_FALSE(entry.has_value());
        CHECK(entry.error().code() == error_code::invalid_header);
        CHECK_THAT(entry.error().message(), ContainsSubstring("Not a tar archive (magic: 'zzzzzz')"));
    }
}

TEST_CASE("Error handling during archive iteration", "[integration][error_handling]") {
    SECTION("Invalid checksum") {
        auto archive = tar_builder{}.add_file("file.txt", "content").finish();
        archive[0] = std::byte{'F'};
        
        auto err = first_error(archive);
        
        REQUIRE(err.has_value());
        CHECK(err->code() == error_code::corrupt_archive);
        CHECK_THAT(err->message(), ContainsSubstring("checksum"));
    }
    
    SECTION("Truncated inside entry data") {
        auto archive = tar_builder{}.add_file("big.bin", test_support::make_content(5000)).bytes();
        archive.resize(512 + 2000);
        
        auto err = first_error(archive);
        
        REQUIRE(err.has_value());
        CHECK(err->code() == error_code::corrupt_archive);
    }
    
    SECTION("Truncated inside a header block") {
        auto archive = tar_builder{}.add_file("a.txt", "data").bytes();
        archive.resize(archive.size() + 300, std::byte{'x'});
        
        auto err = first_error(archive);
        
        REQUIRE(err.has_value());
        CHECK(err->code() == error_code::corrupt_archive);
        CHECK_THAT(err->message(), ContainsSubstring("Incomplete block"));
    }
    
    SECTION("Extension record without a member") {
        auto archive = tar_builder{}.add_gnu_long_file(std::string(200, 'l'), "data").bytes();
        archive.resize(1024);
        
        auto err = first_error(archive);
        
        REQUIRE(err.has_value());
        CHECK(err->code() == error_code::corrupt_archive);
        CHECK_THAT(err->message(), ContainsSubstring("extension record"));
    }
    
    SECTION("Extension record with an absurd size") {
        auto header = test_support::make_header({.name = "././@LongLink", .size = 64 * 1024 * 1024,
                                                 .typeflag = 'L', .gnu = true});
        auto archive = tar_builder{}.add_raw(header).finish();
        
        auto err = first_error(archive);
        
        REQUIRE(err.has_value());
        CHECK(err->code() == error_code::corrupt_archive);
        CHECK_THAT(err->message(), ContainsSubstring("exceeds limit"));
    }
    
    SECTION("Unknown entry type is read like a file") {
        auto archive = tar_builder{}
            .add_file("fine.txt", "ok")
            .add_member({.name = "odd", .typeflag = 'Q'}, "vendor data")
            .finish();
        
        CHECK_FALSE(first_error(archive).has_value());
    }
    
    SECTION("Trailing padding cut short") {
        auto archive = tar_builder{}.add_file("a.txt", "data").bytes();
        archive.resize(512 + 100);
        test_support::TempDir dir;
        test_support::write_file(dir / "short.tar", archive);
        
        auto reader = open_archive(dir / "short.tar");
        REQUIRE(reader.has_value());
        
        auto entry = reader->next_entry();
        REQUIRE(entry.has_value());
        REQUIRE(entry->has_value());
        
        auto end = reader->next_entry();
        REQUIRE_FALSE(end.has_value());
        CHECK(end.error().code() == error_code::corrupt_archive);
        CHECK_FALSE(reader->finished());
    }
}

TEST_CASE("Members from other tar writers are split verbatim", "[integration][error_handling]") {
    test_support::TempDir dir;
    const auto target = dir / "out";
    fs::create_directories(target);
    
    const std::string listing = std::string{"Ykeep.txt"} + '\0' + '\0';
    auto archive = tar_builder{}
        .add_member({.name = "legacy.txt", .v7 = true}, "v7")
        .add_member({.name = "backup/", .typeflag = 'D', .gnu = true}, listing)
        .add_member({.name = "vendor.bin", .typeflag = 'Q'}, "vendor data")
        .add_member({.name = "old.txt", .gnu = true, .mtime = -86400}, "1969-12-31")
        .finish();
    test_support::write_file(dir / "mixed.tar", archive);
    
    split_request request;
    request.chunk_size = 2048;
    request.source = dir / "mixed.tar";
    request.target = target;
    
    auto summary = split_archive(request);
    
    REQUIRE(summary.has_value());
    REQUIRE(summary->chunks.size() == 2);
    for (size_t i = 0; i < 2; ++i) {
        auto chunk = test_support::read_file(summary->chunks[i].path);
        REQUIRE(chunk.size() == 2048 + 1024);
        const auto offset = static_cast<std::ptrdiff_t>(i * 2048);
        CHECK(std::equal(chunk.begin(), chunk.begin() + 2048, archive.begin() + offset));
    }
}

TEST_CASE("Failed splits leave only sealed chunks", "[integration][error_handling]") {
    test_support::TempDir dir;
    const auto target = dir / "out";
    fs::create_directories(target);
    
    // Three 1024-byte footprints, then the archive is cut inside the fourth member
    auto archive = tar_builder{}
        .add_file("one.txt", "1")
        .add_file("two.txt", "2")
        .add_file("three.txt", "3")
        .add_file("four.bin", test_support::make_content(4000))
        .bytes();
    archive.resize(archive.size() - 3000);
    test_support::write_file(dir / "cut.tar", archive);
    
    split_request request;
    request.chunk_size = 2048;
    request.source = dir / "cut.tar";
    request.target = target;
    
    auto summary = split_archive(request);
    
    REQUIRE_FALSE(summary.has_value());
    CHECK(summary.error().code() == error_code::corrupt_archive);
    CHECK_THAT(summary.error().message(), ContainsSubstring("four.bin"));
    CHECK(fs::exists(target / "split_cut_0.tar"));
    CHECK(fs::exists(target / "split_cut_1.tar"));
    CHECK_FALSE(fs::exists(target / "split_cut_2.tar"));
}

TEST_CASE("Error message quality", "[integration][error_handling]") {
    CHECK(to_string(error_code::invalid_configuration) == "configuration error");
    CHECK(to_string(error_code::path_error) == "path error");
    CHECK(to_string(error_code::io_error) == "I/O error");
    CHECK(to_string(error_code::corrupt_archive) == "corrupt archive");
}
