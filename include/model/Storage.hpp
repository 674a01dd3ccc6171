#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediamgr::model {

// Orders canonical positive-integer strings numerically ("2" < "10").
// Non-numeric keys never reach a configuration; they fall back to plain
// lexicographic order so the comparator stays a strict weak ordering.
struct NumericKeyLess {
  bool operator()(std::string_view a, std::string_view b) const {
    if (a.size() != b.size()) return a.size() < b.size();
    return a < b;
  }
  using is_transparent = void;
};

// True for "1", "42"; false for "", "0", "007", "-3", "x1".
[[nodiscard]] bool is_id_key(std::string_view key);

// Runtime-only; recomputed every reconciliation pass, never persisted.
struct DriveStatus {
  std::optional<std::string> mountpoint;
  bool available{false};
  uint64_t free_bytes{};
  uint64_t total_bytes{};
};

struct StorageDrive {
  std::string label;
  std::string serial;
  DriveStatus status;
};

using BackupMap = std::map<std::string, StorageDrive, NumericKeyLess>;

struct StorageGroup {
  std::string display_name;
  StorageDrive master;
  BackupMap backups;  // backup id -> drive, contiguous 1..M after a write
};

struct StorageConfiguration {
  std::map<std::string, StorageGroup, NumericKeyLess> groups;

  [[nodiscard]] bool empty() const { return groups.empty(); }
  [[nodiscard]] size_t size() const { return groups.size(); }
  [[nodiscard]] const StorageGroup* find(std::string_view id) const;
  [[nodiscard]] StorageGroup* find(std::string_view id);
  // max(numeric ids) + 1, or "1" when empty
  [[nodiscard]] std::string next_group_id() const;
};

enum class DriveRole { Master, Backup };

struct ValidationIssue {
  std::string group_id;
  DriveRole role{DriveRole::Master};
  std::string backup_id;  // set when role == Backup
  std::string serial;
  std::string message;

  // "Master" or "Backup-N"
  [[nodiscard]] std::string role_name() const;
};

// Master present and matched in the last validation pass.
[[nodiscard]] inline bool is_group_usable(const StorageGroup& g) { return g.master.status.available; }

// Build a backup map keyed 1..N in the given order.
[[nodiscard]] BackupMap make_backups(const std::vector<StorageDrive>& drives);

} // namespace mediamgr::model
