#pragma once

#include <zip.h>

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>

#include "ba/crypto/md5.h"
#include "ba/error.h"
#include "ba/storage/parity_codec.h"

namespace ba_test {

  class TempDir {
  public:
    explicit TempDir(const std::string& prefix = "ba_test_") {
      static int counter = 0;
      auto base = std::filesystem::temp_directory_path();
      auto name = prefix +
                  std::to_string(static_cast<unsigned long long>(
                      std::chrono::steady_clock::now().time_since_epoch().count())) +
                  "_" + std::to_string(++counter);
      path_ = base / name;
      std::filesystem::create_directories(path_);
    }

    ~TempDir() {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_{};
  };

  [[noreturn]] inline void Fail(const std::string& message) {
    std::cerr << "FAILED: " << message << std::endl;
    std::abort();
  }

  inline void Expect(bool condition, const std::string& message) {
    if (!condition) {
      Fail(message);
    }
  }

  inline void WriteFile(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    if (!out) {
      Fail("unable to write " + path.string());
    }
  }

  inline void WriteBytes(const std::filesystem::path& path, const std::vector<uint8_t>& bytes) {
    WriteFile(path, std::string(bytes.begin(), bytes.end()));
  }

  inline std::string ReadFile(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  }

  inline std::vector<std::string> ReadLines(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    std::vector<std::string> lines;
    std::string line;
    while (std::getline(in, line)) {
      lines.push_back(line);
    }
    return lines;
  }

  // Clock pinned to 2024-03-05 12:00 local time.
  inline std::chrono::system_clock::time_point FixedTime() {
    std::tm tm{};
    tm.tm_year = 2024 - 1900;
    tm.tm_mon = 2;
    tm.tm_mday = 5;
    tm.tm_hour = 12;
    tm.tm_isdst = -1;
    return std::chrono::system_clock::from_time_t(std::mktime(&tm));
  }

  struct ZipMember {
    std::string name;
    std::string data;
    bool deflate{true};
  };

  // Writes `members` with libzip and returns the archive bytes. An empty list
  // yields a bare end-of-central-directory record, which libzip will not write.
  inline std::vector<uint8_t> BuildZip(const std::vector<ZipMember>& members) {
    if (members.empty()) {
      std::vector<uint8_t> empty(22, 0);
      const uint8_t magic[] = {'P', 'K', 0x05, 0x06};
      std::memcpy(empty.data(), magic, sizeof(magic));
      return empty;
    }
    TempDir scratch("ba_zipbuild_");
    const auto path = scratch.path() / "archive.zip";
    int error_code = 0;
    zip_t* archive = zip_open(path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code);
    if (archive == nullptr) {
      Fail("zip_open failed with code " + std::to_string(error_code));
    }
    for (const auto& member : members) {
      zip_source_t* source = zip_source_buffer(archive, member.data.data(), member.data.size(), 0);
      if (source == nullptr) {
        Fail(std::string("zip_source_buffer: ") + zip_strerror(archive));
      }
      const zip_int64_t index = zip_file_add(archive, member.name.c_str(), source, ZIP_FL_ENC_UTF_8);
      if (index < 0) {
        zip_source_free(source);
        Fail(std::string("zip_file_add: ") + zip_strerror(archive));
      }
      const zip_int32_t method = member.deflate ? ZIP_CM_DEFLATE : ZIP_CM_STORE;
      if (zip_set_file_compression(archive, static_cast<zip_uint64_t>(index), method, 0) != 0) {
        Fail(std::string("zip_set_file_compression: ") + zip_strerror(archive));
      }
    }
    if (zip_close(archive) != 0) {
      const std::string message = zip_strerror(archive);
      zip_discard(archive);
      Fail("zip_close: " + message);
    }
    const auto bytes = ReadFile(path);
    return std::vector<uint8_t>(bytes.begin(), bytes.end());
  }

  // Offset of the first occurrence of `needle` at or after `from`.
  inline size_t FindBytes(const std::vector<uint8_t>& haystack, const std::string& needle, size_t from = 0) {
    const auto it = std::search(haystack.begin() + static_cast<std::ptrdiff_t>(from), haystack.end(),
                                needle.begin(), needle.end());
    if (it == haystack.end()) {
      Fail("byte pattern not found: " + needle);
    }
    return static_cast<size_t>(it - haystack.begin());
  }

  inline uint32_t GetLe32(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) | (static_cast<uint32_t>(bytes[offset + 1]) << 8) |
           (static_cast<uint32_t>(bytes[offset + 2]) << 16) | (static_cast<uint32_t>(bytes[offset + 3]) << 24);
  }

  inline uint16_t GetLe16(const std::vector<uint8_t>& bytes, size_t offset) {
    return static_cast<uint16_t>(bytes[offset] | (bytes[offset + 1] << 8));
  }

  inline void SetLe32(std::vector<uint8_t>& bytes, size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
      bytes[offset + static_cast<size_t>(i)] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
  }

  // Puts `stub` in front of a ZIP and shifts its recorded offsets the way
  // "zip -A" does for self-extracting archives.
  inline std::vector<uint8_t> PrependStub(const std::vector<uint8_t>& zip, const std::string& stub) {
    std::vector<uint8_t> out(stub.begin(), stub.end());
    out.insert(out.end(), zip.begin(), zip.end());
    const uint32_t shift = static_cast<uint32_t>(stub.size());
    const std::string eocd_magic("PK\x05\x06", 4);
    size_t eocd = 0;
    for (size_t from = stub.size();;) {
      eocd = FindBytes(out, eocd_magic, from);
      if (eocd + 22 == out.size()) {
        break;
      }
      from = eocd + 1;
    }
    const uint16_t entries = GetLe16(out, eocd + 10);
    const uint32_t directory = GetLe32(out, eocd + 16) + shift;
    SetLe32(out, eocd + 16, directory);
    size_t pos = directory;
    for (uint16_t i = 0; i < entries; ++i) {
      if (GetLe32(out, pos) != 0x02014b50) {
        Fail("central directory entry expected");
      }
      SetLe32(out, pos + 42, GetLe32(out, pos + 42) + shift);
      pos += 46 + GetLe16(out, pos + 28) + GetLe16(out, pos + 30) + GetLe16(out, pos + 32);
    }
    return out;
  }

  // Stand-in for par2: the index holds the book's MD5, the volume holds a copy
  // of its bytes so Repair can restore them the way par2 does (damaged input
  // renamed to "<name>.1", restored file written under the original name).
  class FakeParityCodec : public ba::storage::ParityCodec {
  public:
    bool fail_create{false};
    bool produce_nothing{false};
    bool fail_verify{false};
    int create_calls{0};
    int verify_calls{0};
    int repair_calls{0};
    std::vector<std::filesystem::path> create_dirs;

    std::vector<std::filesystem::path> Create(const std::filesystem::path& working_dir,
                                              const std::string& file_name,
                                              uint32_t redundancy_percent) override {
      ++create_calls;
      create_dirs.push_back(working_dir);
      if (fail_create) {
        throw ba::Error(ba::ErrorDomain::Dependency, ba::errors::dependency::kToolFailed,
                        "fake create failure");
      }
      if (produce_nothing) {
        return {};
      }
      const auto book = working_dir / file_name;
      const auto index = working_dir / IndexFileName(file_name);
      const auto volume = working_dir / (file_name + ".vol00+" + std::to_string(redundancy_percent) + ".par2");
      WriteFile(index, ba::crypto::MD5_FileHex(book));
      WriteFile(volume, ReadFile(book));
      return {index, volume};
    }

    bool Verify(const std::filesystem::path& working_dir, const std::string& file_name) override {
      ++verify_calls;
      if (fail_verify) {
        return false;
      }
      const auto target = working_dir / file_name;
      std::error_code ec;
      if (!std::filesystem::exists(target, ec)) {
        return false;
      }
      return ReadFile(working_dir / IndexFileName(file_name)) == ba::crypto::MD5_FileHex(target);
    }

    bool Repair(const std::filesystem::path& working_dir, const std::string& file_name) override {
      ++repair_calls;
      const auto target = working_dir / file_name;
      std::error_code ec;
      if (std::filesystem::exists(target, ec) &&
          ReadFile(working_dir / IndexFileName(file_name)) == ba::crypto::MD5_FileHex(target)) {
        return true;
      }
      std::filesystem::path volume;
      for (const auto& entry : std::filesystem::directory_iterator(working_dir)) {
        const auto name = entry.path().filename().string();
        if (name.rfind(file_name + ".vol", 0) == 0) {
          volume = entry.path();
        }
      }
      if (volume.empty()) {
        return false;
      }
      std::filesystem::rename(target, working_dir / (file_name + ".1"));
      WriteFile(target, ReadFile(volume));
      return true;
    }

    std::string IndexFileName(const std::string& file_name) const override {
      return file_name + ".par2";
    }
  };

} // namespace ba_test
