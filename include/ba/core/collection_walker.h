#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

#include "ba/core/book_ref.h"

namespace ba::core {

  // Lazily enumerates the books directly inside each collection directory of
  // BOOK_DIR, both levels in name order. Hidden entries and the repair
  // directory are never visited; nested directories are not descended into.
  // The sequence is finite and cannot be restarted.
  class CollectionWalker {
  public:
    using UnreadableHandler =
        std::function<void(const std::filesystem::path& collection, const std::error_code& ec)>;

    // Lists the collections up front. Throws ba::Error (IO) when BOOK_DIR
    // cannot be read.
    CollectionWalker(std::filesystem::path book_dir, std::string repair_basename,
                     UnreadableHandler on_unreadable = {});

    std::optional<BookRef> Next();

    [[nodiscard]] const std::vector<std::string>& Collections() const noexcept { return collections_; }

  private:
    bool EnterNextCollection();

    std::filesystem::path book_dir_;
    std::string repair_basename_;
    UnreadableHandler on_unreadable_;
    std::vector<std::string> collections_;
    size_t next_collection_{0};
    std::string current_collection_;
    std::vector<std::string> current_books_;
    size_t next_book_{0};
  };

} // namespace ba::core
