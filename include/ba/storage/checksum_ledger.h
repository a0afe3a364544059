#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ba::storage {

  struct ChecksumEntry {
    std::string key;       // <collection>/<name>
    std::string checksum;  // 32 lowercase hex digits
  };

  struct DuplicateGroup {
    std::string checksum;
    std::vector<std::string> keys;  // ledger order; a key repeats when its line does
  };

  struct DuplicateReport {
    std::vector<DuplicateGroup> groups;

    [[nodiscard]] bool Empty() const noexcept { return groups.empty(); }
  };

  bool IsValidChecksum(std::string_view checksum);
  bool IsValidBookKey(std::string_view key);

  // md5sum line rendering, including the leading-backslash escape for keys
  // containing '\' or a newline.
  std::string FormatLedgerLine(const std::string& checksum, const std::string& key);
  std::optional<ChecksumEntry> ParseLedgerLine(std::string_view line);

  // Append-only md5sum-format ledger. Entries are never updated or removed.
  class ChecksumLedger {
  public:
    // Creates the file when missing and loads every entry. Throws ba::Error (IO).
    explicit ChecksumLedger(std::filesystem::path path);

    [[nodiscard]] bool Contains(const std::string& key) const;
    [[nodiscard]] std::optional<std::string> Lookup(const std::string& key) const;

    // Durably appends one line. Throws ba::Error (Validation) for a malformed
    // checksum or key and ba::Error (IO) when the write fails.
    void Append(const std::string& key, const std::string& checksum);

    [[nodiscard]] const std::vector<ChecksumEntry>& Entries() const noexcept { return entries_; }
    [[nodiscard]] DuplicateReport FindDuplicates() const;

    // Re-reads the file from disk.
    void Reload();

    [[nodiscard]] size_t MalformedLines() const noexcept { return malformed_lines_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    void Index(const ChecksumEntry& entry);

    std::filesystem::path path_;
    std::vector<ChecksumEntry> entries_;
    std::unordered_map<std::string, std::string> first_checksum_;
    size_t malformed_lines_{0};
  };

} // namespace ba::storage
