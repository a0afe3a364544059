#include "ba/core/collection_walker.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"

#include <algorithm>

namespace ba::core {
namespace {

bool IsHidden(const std::string& name) {
  return !name.empty() && name.front() == '.';
}

// Snapshot of the names in `dir` accepted by `keep`, sorted.
template <typename Predicate>
std::vector<std::string> ListSorted(const std::filesystem::path& dir, std::error_code& ec,
                                    Predicate keep) {
  std::vector<std::string> names;
  for (std::filesystem::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
    auto name = it->path().filename().string();
    if (IsHidden(name)) {
      continue;
    }
    if (keep(*it)) {
      names.push_back(std::move(name));
    }
  }
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace

CollectionWalker::CollectionWalker(std::filesystem::path book_dir, std::string repair_basename,
                                   UnreadableHandler on_unreadable)
    : book_dir_(std::filesystem::absolute(book_dir)),
      repair_basename_(std::move(repair_basename)),
      on_unreadable_(std::move(on_unreadable)) {
  std::error_code ec;
  collections_ = ListSorted(book_dir_, ec, [this](const std::filesystem::directory_entry& entry) {
    std::error_code type_ec;
    return entry.is_directory(type_ec) && entry.path().filename().string() != repair_basename_;
  });
  if (ec) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kBookDirUnreadable,
                    std::string(ba::errors::msg::kBookDirUnreadable) + ": " +
                        ba::PathToUtf8String(book_dir_) + ": " + ec.message(),
                    ec.value());
  }
}

bool CollectionWalker::EnterNextCollection() {
  while (next_collection_ < collections_.size()) {
    current_collection_ = collections_[next_collection_++];
    const auto dir = book_dir_ / current_collection_;
    std::error_code ec;
    current_books_ = ListSorted(dir, ec, [](const std::filesystem::directory_entry& entry) {
      std::error_code type_ec;
      return entry.is_regular_file(type_ec);
    });
    next_book_ = 0;
    if (ec) {
      current_books_.clear();
      if (on_unreadable_) {
        on_unreadable_(dir, ec);
      }
      continue;
    }
    if (!current_books_.empty()) {
      return true;
    }
  }
  return false;
}

std::optional<BookRef> CollectionWalker::Next() {
  while (next_book_ >= current_books_.size()) {
    if (!EnterNextCollection()) {
      return std::nullopt;
    }
  }
  BookRef ref;
  ref.collection = current_collection_;
  ref.name = current_books_[next_book_++];
  ref.path = book_dir_ / ref.collection / ref.name;
  ref.key = MakeBookKey(ref.collection, ref.name);
  return ref;
}

} // namespace ba::core
