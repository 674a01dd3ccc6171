#include "app/DuplicateSerial.hpp"
#include "util/Log.hpp"

#include <unordered_set>

namespace mediamgr::app {

using model::ErrorKind;

std::optional<std::string> find_conflict(const model::StorageConfiguration& cfg, std::string_view serial,
                                         std::string_view exclude_group_id) {
  for (const auto& [gid, g] : cfg.groups) {
    if (gid == exclude_group_id) continue;
    if (g.master.serial == serial) return gid;
    for (const auto& [bid, b] : g.backups) {
      (void)bid;
      if (b.serial == serial) return gid;
    }
  }
  return std::nullopt;
}

std::optional<std::string> find_within_group_duplicate(const model::StorageDrive& master,
                                                       const std::vector<model::StorageDrive>& backups) {
  std::unordered_set<std::string> seen{master.serial};
  for (const auto& b : backups)
    if (!seen.insert(b.serial).second) return b.serial;
  return std::nullopt;
}

model::Result<void> check_serials(const model::StorageConfiguration& cfg, const model::StorageDrive& master,
                                  const std::vector<model::StorageDrive>& backups,
                                  std::string_view exclude_group_id, const DuplicatePolicy& policy,
                                  const std::vector<std::string>& already_held) {
  if (auto dup = find_within_group_duplicate(master, backups))
    return model::make_error(ErrorKind::DuplicateSerial,
                             "serial " + *dup + " is used more than once in the same group",
                             std::string(exclude_group_id), *dup);

  std::vector<const model::StorageDrive*> drives{&master};
  for (const auto& b : backups) drives.push_back(&b);

  std::unordered_set<std::string> asked(already_held.begin(), already_held.end());
  for (const auto* d : drives) {
    if (!asked.insert(d->serial).second) continue;
    auto other = find_conflict(cfg, d->serial, exclude_group_id);
    if (!other) continue;
    if (!policy.interactive || !policy.confirm)
      return model::make_error(ErrorKind::DuplicateSerial,
                               "serial " + d->serial + " is already assigned to group " + *other, *other, d->serial);
    if (!policy.confirm(d->serial, *other))
      return model::make_error(ErrorKind::DuplicateSerial,
                               "sharing serial " + d->serial + " with group " + *other + " was declined",
                               *other, d->serial);
    util::log_info("DuplicateSerial", "operator accepted sharing serial %s with group %s",
                   d->serial.c_str(), other->c_str());
  }
  return {};
}

} // namespace mediamgr::app
