#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace fileops::fs::hash {

// Lowercase hex digest of the file contents, streamed in chunkSize reads.
// Throws std::invalid_argument for an unknown algorithm and std::runtime_error on I/O failure.
std::string file(const std::filesystem::path& path, const std::string& algorithm, uintmax_t chunkSize);

std::string toHex(const unsigned char* data, size_t len);

}
