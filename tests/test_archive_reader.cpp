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
#include <tarsplit/archive_reader.hpp>
#include <tarsplit/stream.hpp>
#include "test_archives.hpp"
#include <algorithm>
#include <chrono>
#include <string>
#include <vector>

using namespace tarsplit;
using test_support::tar_builder;

namespace {

// Input stream without random access, like a pipe. Reads starting at or
// after fail_from report an I/O error.
class mock_stream : public input_stream {
private:
    std::vector<std::byte> data_;
    size_t position_ = 0;
    size_t fail_from_;

public:
    explicit mock_stream(std::vector<std::byte> data, size_t fail_from = static_cast<size_t>(-1))
        : data_(std::move(data)), fail_from_(fail_from) {}

    std::expected<size_t, error> read(std::span<std::byte> buffer) override {
        if (position_ >= fail_from_) {
            return std::unexpected(error{error_code::io_error, "Input/output error"});
        }
        size_t available = data_.size() - position_;
        size_t to_read = std::min(buffer.size(), available);
        
        std::ranges::copy_n(data_.begin() + static_cast<std::ptrdiff_t>(position_), 
                            static_cast<std::ptrdiff_t>(to_read), buffer.begin());
        position_ += to_read;
        
        return to_read;
    }

    std::expected<void, error> skip(size_t bytes) override {
        if (position_ + bytes > data_.size()) {
            return std::unexpected(error{error_code::corrupt_archive, "Skip past end"});
        }
        position_ += bytes;
        return {};
    }

    bool at_end() const override {
        return position_ >= data_.size();
    }
};

archive_reader make_reader(std::vector<std::byte> archive) {
    auto reader = archive_reader::from_stream(std::make_unique<mock_stream>(std::move(archive)));
    REQUIRE(reader.has_value());
    return std::move(*reader);
}

} // anonymous namespace

TEST_CASE("Reading plain ustar members", "[archive_reader]") {
    auto reader = make_reader(tar_builder{}
        .add_directory("docs/")
        .add_file("docs/readme.txt", "hello tar")
        .add_symlink("docs/link", "readme.txt")
        .add_file("empty.txt", "")
        .finish());
    
    auto dir = reader.next_entry();
    REQUIRE(dir.has_value());
    REQUIRE(dir->has_value());
    CHECK((*dir)->path() == "docs/");
    CHECK((*dir)->is_directory());
    CHECK((*dir)->stored_size() == 0);
    CHECK((*dir)->raw_header().size() == 512);
    
    auto file = reader.next_entry();
    REQUIRE(file.has_value());
    REQUIRE(file->has_value());
    CHECK((*file)->path() == "docs/readme.txt");
    CHECK((*file)->is_regular_file());
    CHECK((*file)->size() == 9);
    CHECK((*file)->stored_size() == 9);
    CHECK((*file)->owner_name() == "testuser");
    
    auto data = test_support::entry_data(**file);
    REQUIRE(data.has_value());
    CHECK(*data == "hello tar");
    
    auto link = reader.next_entry();
    REQUIRE(link.has_value());
    REQUIRE(link->has_value());
    CHECK((*link)->is_symbolic_link());
    REQUIRE((*link)->link_target().has_value());
    CHECK(*(*link)->link_target() == "readme.txt");
    CHECK((*link)->stored_size() == 0);
    
    auto empty = reader.next_entry();
    REQUIRE(empty.has_value());
    REQUIRE(empty->has_value());
    CHECK((*empty)->stored_size() == 0);
    
    auto end = reader.next_entry();
    REQUIRE(end.has_value());
    CHECK_FALSE(end->has_value());
    CHECK(reader.finished());
    CHECK(reader.entries_read() == 4);
    
    // Further calls keep reporting the end
    auto again = reader.next_entry();
    REQUIRE(again.has_value());
    CHECK_FALSE(again->has_value());
}

TEST_CASE("Unread entry data is skipped", "[archive_reader]") {
    const std::string big = test_support::make_content(5000);
    auto reader = make_reader(tar_builder{}
        .add_file("big.bin", big)
        .add_file("small.txt", "abc")
        .finish());
    
    SECTION("Nothing read") {
        auto first = reader.next_entry();
        REQUIRE(first.has_value());
        REQUIRE(first->has_value());
        
        auto second = reader.next_entry();
        REQUIRE(second.has_value());
        REQUIRE(second->has_value());
        CHECK((*second)->path() == "small.txt");
    }
    
    SECTION("Partially read") {
        auto first = reader.next_entry();
        REQUIRE(first.has_value());
        REQUIRE(first->has_value());
        
        std::array<std::byte, 100> buffer{};
        auto count = (*first)->read_data(buffer);
        REQUIRE(count.has_value());
        CHECK(*count == 100);
        
        auto second = reader.next_entry();
        REQUIRE(second.has_value());
        REQUIRE(second->has_value());
        CHECK((*second)->path() == "small.txt");
        
        auto data = test_support::entry_data(**second);
        REQUIRE(data.has_value());
        CHECK(*data == "abc");
    }
}

TEST_CASE("Reading every member to the end", "[archive_reader]") {
    auto reader = make_reader(tar_builder{}
        .add_file("a.txt", "1")
        .add_file("b.txt", "22")
        .add_file("c.txt", "333")
        .finish());
    
    std::vector<std::string> names;
    uint64_t total = 0;
    while (true) {
        auto entry = reader.next_entry();
        REQUIRE(entry.has_value());
        if (!*entry) {
            break;
        }
        names.push_back((*entry)->path().string());
        total += (*entry)->size();
    }
    
    CHECK(names == std::vector<std::string>{"a.txt", "b.txt", "c.txt"});
    CHECK(total == 6);
    CHECK(reader.finished());
    CHECK(reader.entries_read() == 3);
}

TEST_CASE("End of archive detection", "[archive_reader]") {
    SECTION("Empty archive") {
        auto reader = make_reader(tar_builder{}.finish());
        
        auto entry = reader.next_entry();
        REQUIRE(entry.has_value());
        CHECK_FALSE(entry->has_value());
        CHECK(reader.entries_read() == 0);
    }
    
    SECTION("End of file without trailer") {
        auto reader = make_reader(tar_builder{}.add_file("a.txt", "data").bytes());
        
        REQUIRE(reader.next_entry().has_value());
        auto end = reader.next_entry();
        REQUIRE(end.has_value());
        CHECK_FALSE(end->has_value());
    }
    
    SECTION("Single zero block at end of file") {
        auto archive = tar_builder{}.add_file("a.txt", "data").bytes();
        archive.resize(archive.size() + 512);
        auto reader = make_reader(std::move(archive));
        
        REQUIRE(reader.next_entry().has_value());
        auto end = reader.next_entry();
        REQUIRE(end.has_value());
        CHECK_FALSE(end->has_value());
    }
    
    SECTION("Zero block followed by a header") {
        auto archive = tar_builder{}.add_file("a.txt", "data").bytes();
        archive.resize(archive.size() + 512);
        auto header = test_support::make_header({.name = "b.txt"});
        archive.insert(archive.end(), header.begin(), header.end());
        archive.resize(archive.size() + 1024);
        auto reader = make_reader(std::move(archive));
        
        REQUIRE(reader.next_entry().has_value());
        auto broken = reader.next_entry();
        REQUIRE_FALSE(broken.has_value());
        CHECK(broken.error().code() == error_code::corrupt_archive);
    }
    
    SECTION("Read error after a single zero block") {
        auto archive = tar_builder{}.add_file("a.txt", "data").finish();
        const size_t second_zero_block = archive.size() - 512;
        auto stream = std::make_unique<mock_stream>(std::move(archive), second_zero_block);
        auto reader = archive_reader::from_stream(std::move(stream));
        REQUIRE(reader.has_value());
        
        REQUIRE(reader->next_entry().has_value());
        auto end = reader->next_entry();
        REQUIRE_FALSE(end.has_value());
        CHECK(end.error().code() == error_code::io_error);
        CHECK(end.error().message() == "Input/output error");
        CHECK_FALSE(reader->finished());
    }
}

TEST_CASE("Null stream is rejected", "[archive_reader]") {
    auto reader = archive_reader::from_stream(nullptr);
    
    REQUIRE_FALSE(reader.has_value());
    CHECK(reader.error().code() == error_code::invalid_operation);
}

TEST_CASE("Reading stops at a damaged header", "[archive_reader]") {
    std::vector<std::byte> garbage(512, std::byte{'?'});
    auto reader = make_reader(tar_builder{}
        .add_file("good.txt", "fine")
        .add_raw(garbage)
        .finish());
    
    auto good = reader.next_entry();
    REQUIRE(good.has_value());
    REQUIRE(good->has_value());
    CHECK((*good)->path() == "good.txt");
    
    auto damaged = reader.next_entry();
    REQUIRE_FALSE(damaged.has_value());
    CHECK(damaged.error().code() == error_code::invalid_header);
    CHECK_FALSE(reader.finished());
}

TEST_CASE("Headers from older and non-POSIX writers", "[archive_reader]") {
    SECTION("v7 member without magic") {
        auto reader = make_reader(tar_builder{}
            .add_member({.name = "old/notes.txt", .v7 = true}, "written by v7 tar")
            .add_file("new.txt", "ustar")
            .finish());
        
        auto old = reader.next_entry();
        REQUIRE(old.has_value());
        REQUIRE(old->has_value());
        CHECK((*old)->path() == "old/notes.txt");
        CHECK((*old)->stored_size() == 17);
        CHECK((*old)->owner_name().empty());
        
        auto data = test_support::entry_data(**old);
        REQUIRE(data.has_value());
        CHECK(*data == "written by v7 tar");
        
        auto next = reader.next_entry();
        REQUIRE(next.has_value());
        REQUIRE(next->has_value());
        CHECK((*next)->path() == "new.txt");
    }
    
    SECTION("GNU member dated before 1970") {
        auto reader = make_reader(tar_builder{}
            .add_member({.name = "moon-landing.txt", .gnu = true, .mtime = -14182940}, "1969-07-20")
            .finish());
        
        auto entry = reader.next_entry();
        REQUIRE(entry.has_value());
        REQUIRE(entry->has_value());
        CHECK((*entry)->path() == "moon-landing.txt");
        CHECK((*entry)->stored_size() == 10);
        CHECK((*entry)->modification_time() == std::chrono::system_clock::time_point{});
        
        auto data = test_support::entry_data(**entry);
        REQUIRE(data.has_value());
        CHECK(*data == "1969-07-20");
    }
    
    SECTION("GNU dumpdir member keeps its data") {
        const std::string listing = std::string{"Ya.txt"} + '\0' + "Nb.txt" + '\0' + '\0';
        auto reader = make_reader(tar_builder{}
            .add_member({.name = "snapshot/", .typeflag = 'D', .gnu = true}, listing)
            .add_file("snapshot/a.txt", "a")
            .finish());
        
        auto dumpdir = reader.next_entry();
        REQUIRE(dumpdir.has_value());
        REQUIRE(dumpdir->has_value());
        CHECK((*dumpdir)->type() == static_cast<entry_type>('D'));
        CHECK((*dumpdir)->stored_size() == listing.size());
        CHECK((*dumpdir)->footprint() == 1024);
        
        auto data = test_support::entry_data(**dumpdir);
        REQUIRE(data.has_value());
        CHECK(*data == listing);
        
        auto next = reader.next_entry();
        REQUIRE(next.has_value());
        REQUIRE(next->has_value());
        CHECK((*next)->path() == "snapshot/a.txt");
    }
}
