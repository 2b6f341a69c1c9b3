// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license
// Tests for atomic file writes (files.cpp)

#include "util/files.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <string>

using namespace strata::util;

namespace {

struct TempDir {
    std::filesystem::path path;
    explicit TempDir(const std::string& name) : path(std::filesystem::temp_directory_path() / name) {
        std::filesystem::remove_all(path);
        std::filesystem::create_directories(path);
    }
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
};

}  // namespace

TEST_CASE("Atomic write - string round trip", "[atomic_write]") {
    TempDir dir("strata_atomic_string");
    const auto file = dir.path / "blocks.json";

    REQUIRE(atomic_write_file(file, std::string("{\"version\":1}")));
    CHECK(read_file_string(file) == "{\"version\":1}");
}

TEST_CASE("Atomic write - overwrite replaces contents", "[atomic_write]") {
    TempDir dir("strata_atomic_overwrite");
    const auto file = dir.path / "data.bin";

    REQUIRE(atomic_write_file(file, std::string(4096, 'a')));
    REQUIRE(atomic_write_file(file, std::string("short")));
    CHECK(read_file_string(file) == "short");

    // No temp files are left behind.
    size_t entries = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir.path)) {
        (void)entry;
        ++entries;
    }
    CHECK(entries == 1);
}

TEST_CASE("Atomic write - embedded zero bytes survive", "[atomic_write]") {
    TempDir dir("strata_atomic_binary");
    const auto file = dir.path / "raw.bin";

    std::string data(1 << 16, '\0');
    for (size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<char>(i * 31);
    }
    REQUIRE(atomic_write_file(file, data));
    CHECK(read_file_string(file) == data);
}

TEST_CASE("Atomic write - missing files read empty", "[atomic_write]") {
    TempDir dir("strata_atomic_missing");
    CHECK(read_file_string(dir.path / "absent").empty());
}

TEST_CASE("Atomic write - missing parent directories are created", "[atomic_write]") {
    TempDir dir("strata_atomic_mkdir");
    const auto file = dir.path / "a" / "b" / "blocks.json";
    REQUIRE(atomic_write_file(file, std::string("{}")));
    CHECK(std::filesystem::is_directory(dir.path / "a" / "b"));
    CHECK(read_file_string(file) == "{}");
}
