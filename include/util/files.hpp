// Copyright (c) 2025 The Strata Developers
// Distributed under the MIT software license

#pragma once

#include <filesystem>
#include <string>

namespace strata {
namespace util {

// Write |data| to |path| through a temp file in the same directory, fsync and
// rename. Missing parent directories are created. Readers never observe a
// partially written file.
bool atomic_write_file(const std::filesystem::path& path, const std::string& data);

// Returns an empty string on any error (logged).
std::string read_file_string(const std::filesystem::path& path);

}  // namespace util
}  // namespace strata
