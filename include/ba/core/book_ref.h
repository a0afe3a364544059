#pragma once

#include <filesystem>
#include <string>

namespace ba::core {

  // A book as discovered under BOOK_DIR. `key` is "<collection>/<name>" and is
  // the identity used by the ledger, the catalog log and the repair store.
  struct BookRef {
    std::string collection;
    std::string name;
    std::filesystem::path path;  // absolute
    std::string key;
  };

  inline std::string MakeBookKey(const std::string& collection, const std::string& name) {
    return collection + "/" + name;
  }

} // namespace ba::core
