#pragma once
#include <array>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace ba::crypto {
constexpr size_t kMd5DigestSize = 16;
using Md5Digest = std::array<uint8_t, kMd5DigestSize>;

Md5Digest MD5_Hash(std::span<const uint8_t> data);
Md5Digest MD5_Hash(const std::vector<uint8_t>& data);

// Streams the file through the digest. Throws ba::Error (IO) when the file
// cannot be opened or read.
Md5Digest MD5_File(const std::filesystem::path& path);

// Lowercase hex rendering, as written by md5sum.
std::string MD5_FileHex(const std::filesystem::path& path);
} // namespace ba::crypto
