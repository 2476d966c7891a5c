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
#include <tarsplit/splitter.hpp>
#include <tarsplit/tarsplit.hpp>
#include "test_archives.hpp"
#include <filesystem>
#include <vector>

using namespace tarsplit;
using test_support::tar_builder;
namespace fs = std::filesystem;

namespace {

// Ten members of 3000 bytes; each has a footprint of 3584 bytes
std::vector<std::byte> ten_member_archive() {
    tar_builder builder;
    for (int i = 0; i < 10; ++i) {
        builder.add_file("photos/img-" + std::to_string(i) + ".raw", 
                         test_support::make_content(3000, static_cast<char>('a' + i)));
    }
    return builder.finish();
}

size_t count_entries(const fs::path& path) {
    auto reader = open_archive(path);
    REQUIRE(reader.has_value());
    size_t count = 0;
    while (true) {
        auto entry = reader->next_entry();
        REQUIRE(entry.has_value());
        if (!*entry) {
            break;
        }
        ++count;
    }
    CHECK(reader->finished());
    return count;
}

} // anonymous namespace

TEST_CASE("Splitting an archive on disk", "[splitter][integration]") {
    test_support::TempDir dir;
    const auto source = dir / "holiday.tar";
    const auto target = dir / "chunks";
    fs::create_directories(target);
    test_support::write_file(source, ten_member_archive());
    
    split_request request;
    request.source = source;
    request.target = target;
    
    SECTION("By number of chunks") {
        request.num_chunks = 3;
        
        std::vector<split_event> events;
        auto summary = split_archive(request, [&events](const split_event& event) { events.push_back(event); });
        
        REQUIRE(summary.has_value());
        CHECK(summary->source_size == 10 * 3584 + 1024);
        CHECK(summary->max_chunk_size == 12288);
        
        // Three members fit per chunk; the last chunk takes the remainder
        REQUIRE(summary->chunks.size() == 4);
        for (uint32_t i = 0; i < 4; ++i) {
            CHECK(summary->chunks[i].path == target / chunk_filename("split", "holiday", i));
            CHECK(count_entries(summary->chunks[i].path) == (i < 3 ? 3 : 1));
        }
        
        REQUIRE_FALSE(events.empty());
        CHECK(events.front().kind == split_event_kind::planned);
        CHECK(events.front().max_chunk_size == 12288);
        for (const auto& event : events) {
            CHECK(event.source_size == summary->source_size);
        }
        CHECK(events.back().kind == split_event_kind::chunk_sealed);
        CHECK(events.back().final_chunk);
    }
    
    SECTION("By chunk size with a custom prefix") {
        request.chunk_size = 20000;
        request.prefix = "part";
        
        auto summary = split_archive(request);
        
        REQUIRE(summary.has_value());
        REQUIRE(summary->chunks.size() == 2);
        CHECK(fs::exists(target / "part_holiday_0.tar"));
        CHECK(fs::exists(target / "part_holiday_1.tar"));
        CHECK(count_entries(target / "part_holiday_0.tar") == 5);
        CHECK(count_entries(target / "part_holiday_1.tar") == 5);
    }
    
    SECTION("Planning errors happen before any output") {
        request.chunk_size = 100000;
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::invalid_configuration);
        CHECK(fs::is_empty(target));
    }
}

TEST_CASE("Split request path checks", "[splitter]") {
    test_support::TempDir dir;
    const auto source = dir / "data.tar";
    test_support::write_file(source, tar_builder{}.add_file("a.txt", "data").finish());
    
    split_request request;
    request.num_chunks = 3;
    request.source = source;
    request.target = dir.path();
    
    SECTION("Missing source") {
        request.source = dir / "missing.tar";
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::path_error);
        CHECK_THAT(summary.error().message(), Catch::Matchers::ContainsSubstring("existing archive"));
    }
    
    SECTION("Source is a directory") {
        request.source = dir.path();
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::path_error);
    }
    
    SECTION("Target is a file") {
        request.target = source;
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::path_error);
        CHECK_THAT(summary.error().message(), Catch::Matchers::ContainsSubstring("existing directory"));
    }
    
    SECTION("Source below the minimum archive size") {
        const auto tiny = dir / "tiny.tar";
        test_support::write_file(tiny, std::vector<std::byte>(100));
        request.source = tiny;
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::invalid_configuration);
    }
    
    SECTION("Source that is not a tar archive") {
        const auto target = dir / "out";
        fs::create_directories(target);
        const auto bogus = dir / "bogus.tar";
        test_support::write_file(bogus, std::vector<std::byte>(8192, std::byte{'z'}));
        request.source = bogus;
        request.target = target;
        
        auto summary = split_archive(request);
        
        REQUIRE_FALSE(summary.has_value());
        CHECK(summary.error().code() == error_code::invalid_header);
        CHECK(fs::is_empty(target));
    }
}
