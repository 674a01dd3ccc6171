#include "app/Validator.hpp"
#include "util/Log.hpp"

namespace mediamgr::app {

using model::DriveRole;
using model::ErrorKind;

const model::DeviceDescriptor* match_device(const model::DeviceList& devices, const std::string& serial) {
  const model::DeviceDescriptor* found = nullptr;
  for (const auto& d : devices) {
    if (d.serial != serial) continue;
    if (d.mountpoint) return &d;
    if (!found) found = &d;
  }
  return found;
}

static void apply_match(model::StorageDrive& drive, const model::DeviceDescriptor* dev) {
  if (dev) {
    drive.status.available = true;
    drive.status.mountpoint = dev->mountpoint;
    drive.status.total_bytes = dev->total_bytes;
    drive.status.free_bytes = dev->free_bytes;
  } else {
    drive.status = model::DriveStatus{};
  }
}

auto validate(model::StorageConfiguration& cfg, const model::DeviceList& devices)
    -> model::Result<std::vector<model::ValidationIssue>> {
  // Check shape first so a malformed configuration is left untouched
  for (const auto& [gid, g] : cfg.groups) {
    if (g.master.serial.empty())
      return model::make_error(ErrorKind::Malformed, "group " + gid + " has no Master serial", gid);
    for (const auto& [bid, b] : g.backups)
      if (b.serial.empty())
        return model::make_error(ErrorKind::Malformed, "group " + gid + " Backup-" + bid + " has no serial", gid);
  }

  std::vector<model::ValidationIssue> issues;
  for (auto& [gid, g] : cfg.groups) {
    const auto* dev = match_device(devices, g.master.serial);
    apply_match(g.master, dev);
    if (!dev) {
      model::ValidationIssue is{gid, DriveRole::Master, {}, g.master.serial, {}};
      is.message = "Master drive " + g.master.serial + " of group " + gid + " (" + g.display_name + ") is not connected";
      util::log_warn("Validator", "%s", is.message.c_str());
      issues.push_back(std::move(is));
    }
    for (auto& [bid, b] : g.backups) {
      const auto* bdev = match_device(devices, b.serial);
      apply_match(b, bdev);
      if (bdev) continue;
      model::ValidationIssue is{gid, DriveRole::Backup, bid, b.serial, {}};
      is.message = "Backup-" + bid + " drive " + b.serial + " of group " + gid + " is not connected";
      util::log_info("Validator", "%s", is.message.c_str());
      issues.push_back(std::move(is));
    }
  }
  return issues;
}

auto find_group_for_serial(const model::StorageConfiguration& cfg, const std::string& serial)
    -> std::optional<std::string> {
  for (const auto& [gid, g] : cfg.groups) {
    if (g.master.serial == serial) return gid;
    for (const auto& [bid, b] : g.backups) {
      (void)bid;
      if (b.serial == serial) return gid;
    }
  }
  return std::nullopt;
}

auto format_issue(const model::ValidationIssue& issue) -> std::string {
  return "group " + issue.group_id + " " + issue.role_name() + ": serial " + issue.serial + " not found";
}

} // namespace mediamgr::app
