#include "model/Storage.hpp"

#include <cctype>
#include <charconv>

namespace mediamgr::model {

bool is_id_key(std::string_view key) {
  if (key.empty() || key.size() > 9) return false;
  if (key[0] == '0') return false;
  for (char c : key)
    if (!std::isdigit(static_cast<unsigned char>(c))) return false;
  return true;
}

const StorageGroup* StorageConfiguration::find(std::string_view id) const {
  auto it = groups.find(id);
  return it == groups.end() ? nullptr : &it->second;
}

StorageGroup* StorageConfiguration::find(std::string_view id) {
  auto it = groups.find(id);
  return it == groups.end() ? nullptr : &it->second;
}

std::string StorageConfiguration::next_group_id() const {
  long max_id = 0;
  for (const auto& [id, g] : groups) {
    (void)g;
    long v = 0;
    auto [ptr, ec] = std::from_chars(id.data(), id.data() + id.size(), v);
    if (ec != std::errc{} || ptr != id.data() + id.size()) continue;
    if (v > max_id) max_id = v;
  }
  return std::to_string(max_id + 1);
}

std::string ValidationIssue::role_name() const {
  if (role == DriveRole::Master) return "Master";
  return "Backup-" + backup_id;
}

BackupMap make_backups(const std::vector<StorageDrive>& drives) {
  BackupMap out;
  int n = 0;
  for (const auto& d : drives) out.emplace(std::to_string(++n), d);
  return out;
}

} // namespace mediamgr::model
