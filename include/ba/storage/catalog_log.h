#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

namespace ba::storage {

  struct CatalogRecord {
    std::string date;      // YYYY-MM-DD
    std::string checksum;
    std::string key;
  };

  // Local calendar date of `tp` as YYYY-MM-DD.
  std::string FormatDate(std::chrono::system_clock::time_point tp);

  // Tab-delimited audit history; one record per ledger entry, same order.
  class CatalogLog {
  public:
    explicit CatalogLog(std::filesystem::path path);

    void Append(const std::string& date, const std::string& checksum, const std::string& key);

    // Parses the whole file. Lines without three fields are skipped.
    [[nodiscard]] std::vector<CatalogRecord> Records() const;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

  private:
    std::filesystem::path path_;
  };

} // namespace ba::storage
