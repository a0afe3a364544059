#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include "ba/core/book_ref.h"
#include "ba/storage/parity_codec.h"

namespace ba::storage {

  struct RepairSet {
    std::string key;
    std::filesystem::path directory;  // <root>/<collection>
    std::filesystem::path index;      // <directory>/<name>.par2
    std::filesystem::path link;       // <directory>/<name> -> book
    std::vector<std::filesystem::path> artifacts;
  };

  // Keeps recovery data per book under <root>/<collection>/, next to a
  // symbolic link to the book so the codec can verify it in place.
  class RepairStore {
  public:
    RepairStore(std::filesystem::path root, ParityCodec& codec);

    // Generates, places, links and self-verifies recovery data. On any failure
    // removes what this call placed and throws ba::RepairCreationError. A
    // missing codec binary propagates as ba::Error (Dependency).
    RepairSet Protect(const ba::core::BookRef& book, uint32_t redundancy_percent);

    // False when the index or link is missing, the link dangles, or the codec
    // rejects the set.
    bool Verify(const std::string& key);

    [[nodiscard]] bool Has(const std::string& key) const;

    // Rewrites the linked book from its recovery data. The damaged copy is kept
    // beside it as "<name>.~N~". True when the book was verified or restored.
    bool Repair(const std::string& key);

    [[nodiscard]] const std::filesystem::path& root() const noexcept { return root_; }

  private:
    struct Location {
      std::string collection;
      std::string name;
      std::filesystem::path directory;
      std::filesystem::path index;
      std::filesystem::path link;
    };

    [[nodiscard]] Location Locate(const std::string& key) const;
    [[nodiscard]] bool LinkResolves(const Location& where) const;

    std::filesystem::path root_;
    ParityCodec& codec_;
  };

} // namespace ba::storage
