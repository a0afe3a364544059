#include "ba/storage/repair_store.h"

#include "ba/common.h"
#include "ba/error.h"
#include "ba/errors.h"
#include "ba/orchestrator/io_util.h"
#include "ba/storage/checksum_ledger.h"

#include <cctype>
#include <system_error>

namespace ba::storage {
namespace {

void RemoveQuietly(const std::filesystem::path& path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

bool IsSymlink(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::is_symlink(std::filesystem::symlink_status(path, ec));
}

bool EntryExists(const std::filesystem::path& path) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::symlink_status(path, ec));
}

// par2 renames a damaged input to "<name>.1", "<name>.2", ... before writing
// the restored file.
bool IsParRenamedInput(const std::string& candidate, const std::string& name) {
  if (candidate.size() <= name.size() + 1 || candidate.compare(0, name.size(), name) != 0 ||
      candidate[name.size()] != '.') {
    return false;
  }
  for (size_t i = name.size() + 1; i < candidate.size(); ++i) {
    if (!std::isdigit(static_cast<unsigned char>(candidate[i]))) {
      return false;
    }
  }
  return true;
}

// Tracks what one Protect call put on disk so a failure can take it back.
class PlacementJournal {
 public:
  void Placed(std::filesystem::path path) { placed_.push_back(std::move(path)); }
  void Pending(std::vector<std::filesystem::path> paths) { pending_ = std::move(paths); }
  void Linked(std::filesystem::path link) { link_ = std::move(link); }

  void RollBack() {
    for (const auto& path : placed_) {
      RemoveQuietly(path);
    }
    for (const auto& path : pending_) {
      RemoveQuietly(path);
    }
    if (!link_.empty()) {
      RemoveQuietly(link_);
    }
    placed_.clear();
    pending_.clear();
    link_.clear();
  }

 private:
  std::vector<std::filesystem::path> placed_;
  std::vector<std::filesystem::path> pending_;
  std::filesystem::path link_;
};

} // namespace

RepairStore::RepairStore(std::filesystem::path root, ParityCodec& codec)
    : root_(std::move(root)), codec_(codec) {}

RepairStore::Location RepairStore::Locate(const std::string& key) const {
  if (!IsValidBookKey(key)) {
    throw ba::Error(ba::ErrorDomain::Validation, ba::errors::validation::kInvalidBookKey,
                    std::string(ba::errors::msg::kInvalidBookKey) + ": '" + key + "'");
  }
  const auto slash = key.find('/');
  Location where;
  where.collection = key.substr(0, slash);
  where.name = key.substr(slash + 1);
  where.directory = root_ / where.collection;
  where.index = where.directory / codec_.IndexFileName(where.name);
  where.link = where.directory / where.name;
  return where;
}

bool RepairStore::LinkResolves(const Location& where) const {
  if (!IsSymlink(where.link)) {
    return false;
  }
  std::error_code ec;
  return std::filesystem::is_regular_file(where.link, ec);
}

RepairSet RepairStore::Protect(const ba::core::BookRef& book, uint32_t redundancy_percent) {
  const auto where = Locate(book.key);
  PlacementJournal journal;

  std::error_code ec;
  std::filesystem::create_directories(where.directory, ec);
  if (ec) {
    throw ba::RepairCreationError(book.key, ba::errors::repair::kPlacementFailed,
                                  std::string(ba::errors::msg::kRepairDirUnavailable) + ": " +
                                      ba::PathToUtf8String(where.directory),
                                  ec.value());
  }

  std::vector<std::filesystem::path> generated;
  try {
    generated = codec_.Create(book.path.parent_path(), book.name, redundancy_percent);
  } catch (const ba::Error& err) {
    if (err.domain == ba::ErrorDomain::Dependency &&
        err.code == ba::errors::dependency::kToolMissing) {
      throw;
    }
    throw ba::RepairCreationError(book.key, ba::errors::repair::kGenerationFailed,
                                  std::string(ba::errors::msg::kParityGenerationFailed) + ": " +
                                      book.key + ": " + err.what(),
                                  err.native_code);
  }
  if (generated.empty()) {
    throw ba::RepairCreationError(book.key, ba::errors::repair::kNoArtifacts,
                                  std::string(ba::errors::msg::kParityNoArtifacts) + ": " + book.key);
  }

  RepairSet set;
  set.key = book.key;
  set.directory = where.directory;
  set.index = where.index;
  set.link = where.link;

  journal.Pending(generated);
  try {
    for (const auto& artifact : generated) {
      auto placed = ba::orchestrator::MoveWithNumberedBackup(artifact, where.directory);
      journal.Placed(placed);
      set.artifacts.push_back(std::move(placed));
    }
  } catch (const ba::Error& err) {
    journal.RollBack();
    throw ba::RepairCreationError(book.key, ba::errors::repair::kPlacementFailed,
                                  std::string(ba::errors::msg::kParityPlacementFailed) + ": " +
                                      err.what(),
                                  err.native_code);
  } catch (const std::filesystem::filesystem_error& err) {
    journal.RollBack();
    throw ba::RepairCreationError(book.key, ba::errors::repair::kPlacementFailed,
                                  std::string(ba::errors::msg::kParityPlacementFailed) + ": " +
                                      err.what(),
                                  err.code().value());
  }
  journal.Pending({});

  // A stale link from an earlier attempt is replaced; anything else is in the way.
  if (IsSymlink(where.link)) {
    RemoveQuietly(where.link);
  }
  if (EntryExists(where.link)) {
    journal.RollBack();
    throw ba::RepairCreationError(book.key, ba::errors::repair::kLinkFailed,
                                  std::string(ba::errors::msg::kParityLinkFailed) + ": " +
                                      ba::PathToUtf8String(where.link) + " exists");
  }
  std::filesystem::create_symlink(book.path, where.link, ec);
  if (ec) {
    journal.RollBack();
    throw ba::RepairCreationError(book.key, ba::errors::repair::kLinkFailed,
                                  std::string(ba::errors::msg::kParityLinkFailed) + ": " +
                                      ec.message(),
                                  ec.value());
  }
  journal.Linked(where.link);

  bool verified = false;
  try {
    verified = Verify(book.key);
  } catch (const ba::Error& err) {
    journal.RollBack();
    if (err.domain == ba::ErrorDomain::Dependency &&
        err.code == ba::errors::dependency::kToolMissing) {
      throw;
    }
    throw ba::RepairCreationError(book.key, ba::errors::repair::kSelfVerificationFailed,
                                  std::string(ba::errors::msg::kParitySelfVerifyFailed) + ": " +
                                      book.key + ": " + err.what(),
                                  err.native_code);
  }
  if (!verified) {
    journal.RollBack();
    throw ba::RepairCreationError(book.key, ba::errors::repair::kSelfVerificationFailed,
                                  std::string(ba::errors::msg::kParitySelfVerifyFailed) + ": " +
                                      book.key);
  }
  return set;
}

bool RepairStore::Has(const std::string& key) const {
  const auto where = Locate(key);
  std::error_code ec;
  return std::filesystem::is_regular_file(where.index, ec) && IsSymlink(where.link);
}

bool RepairStore::Verify(const std::string& key) {
  const auto where = Locate(key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(where.index, ec) || !LinkResolves(where)) {
    return false;
  }
  return codec_.Verify(where.directory, where.name);
}

bool RepairStore::Repair(const std::string& key) {
  const auto where = Locate(key);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(where.index, ec) || !IsSymlink(where.link)) {
    return false;
  }
  const auto book_path = std::filesystem::read_symlink(where.link, ec);
  if (ec) {
    return false;
  }
  if (!codec_.Repair(where.directory, where.name)) {
    return false;
  }
  if (IsSymlink(where.link)) {
    return true;  // nothing needed restoring
  }

  // The codec wrote the restored book in place of the link. Put it back at the
  // book's location, keeping the damaged copy as a numbered backup.
  const auto restored = where.directory / where.name;
  const auto staged = book_path.parent_path() / (where.name + ".restored");
  std::filesystem::rename(restored, staged, ec);
  if (ec) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kArtifactMoveFailed,
                    std::string(ba::errors::msg::kParityPlacementFailed) + ": " + ec.message(),
                    ec.value());
  }
  if (EntryExists(book_path)) {
    ba::orchestrator::BackupExisting(book_path);
  }
  std::filesystem::rename(staged, book_path, ec);
  if (ec) {
    throw ba::Error(ba::ErrorDomain::IO, ba::errors::io::kArtifactMoveFailed,
                    std::string(ba::errors::msg::kParityPlacementFailed) + ": " + ec.message(),
                    ec.value());
  }

  for (std::filesystem::directory_iterator it(where.directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    const auto name = it->path().filename().string();
    if (IsParRenamedInput(name, where.name) && IsSymlink(it->path())) {
      RemoveQuietly(it->path());
    }
  }
  std::filesystem::create_symlink(book_path, where.link, ec);
  return !ec;
}

} // namespace ba::storage
