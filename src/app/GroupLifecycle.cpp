#include "app/GroupLifecycle.hpp"
#include "app/Validator.hpp"
#include "util/Log.hpp"

#include <iterator>
#include <set>

namespace mediamgr::app {

using model::ErrorKind;
using model::make_error;

void renumber_groups(model::StorageConfiguration& cfg) {
  decltype(cfg.groups) out;
  int n = 0;
  for (auto& [gid, g] : cfg.groups) {
    (void)gid;
    out.emplace(std::to_string(++n), std::move(g));
  }
  cfg.groups = std::move(out);
}

void renumber_backups(model::StorageGroup& group) {
  model::BackupMap out;
  int n = 0;
  for (auto& [bid, b] : group.backups) {
    (void)bid;
    out.emplace(std::to_string(++n), std::move(b));
  }
  group.backups = std::move(out);
}

static std::vector<model::StorageDrive> backup_list(const model::StorageGroup& g) {
  std::vector<model::StorageDrive> out;
  out.reserve(g.backups.size());
  for (const auto& [bid, b] : g.backups) {
    (void)bid;
    out.push_back(b);
  }
  return out;
}

static model::Result<void> check_drive(const model::StorageDrive& d, const char* role) {
  if (d.serial.empty())
    return make_error(ErrorKind::InvalidArgument, std::string(role) + " drive " + d.label + " has no serial number");
  return {};
}

static model::Result<void> check_arguments(const std::string& display_name, const model::StorageDrive& master,
                                           const std::vector<model::StorageDrive>& backups) {
  if (display_name.empty())
    return make_error(ErrorKind::InvalidArgument, "display name must not be empty");
  if (auto ok = check_drive(master, "Master"); !ok) return ok;
  for (const auto& b : backups)
    if (auto ok = check_drive(b, "Backup"); !ok) return ok;
  return {};
}

// An Edit may leave the stored name alone, even when it is empty on disk.
static model::Result<void> check_edit(const GroupEdit& edit) {
  if (edit.display_name && edit.display_name->empty())
    return make_error(ErrorKind::InvalidArgument, "display name must not be empty");
  if (edit.master)
    if (auto ok = check_drive(*edit.master, "Master"); !ok) return ok;
  if (edit.backups)
    for (const auto& b : *edit.backups)
      if (auto ok = check_drive(b, "Backup"); !ok) return ok;
  return {};
}

// Runtime status is recomputed on reload; never carry a caller's copy in.
static model::StorageDrive durable(const model::StorageDrive& d) {
  return model::StorageDrive{d.label, d.serial, {}};
}

GroupLifecycle::GroupLifecycle(ConfigStore store, collectors::IDeviceEnumerator& devices, DuplicatePolicy policy)
    : store_(std::move(store)), devices_(devices), policy_(std::move(policy)) {}

model::Result<std::vector<model::ValidationIssue>> GroupLifecycle::load(model::StorageConfiguration& cfg) {
  auto loaded = store_.load();
  if (!loaded) return std::unexpected(loaded.error());
  if (loaded->empty())
    util::log_info("GroupLifecycle", "storage is unconfigured; first-run setup required");
  auto devices = devices_.list_devices();
  auto issues = validate(*loaded, devices);
  if (!issues) return std::unexpected(issues.error());
  cfg = std::move(*loaded);
  issues_ = *issues;
  update_registry(cfg, devices);
  return issues;
}

model::Result<std::vector<model::ValidationIssue>> GroupLifecycle::refresh(model::StorageConfiguration& cfg) {
  auto devices = devices_.list_devices();
  auto issues = validate(cfg, devices);
  if (!issues) return std::unexpected(issues.error());
  issues_ = *issues;
  update_registry(cfg, devices);
  return issues;
}

model::Result<std::string> GroupLifecycle::add_group(model::StorageConfiguration& cfg, const std::string& display_name,
                                                     const model::StorageDrive& master,
                                                     const std::vector<model::StorageDrive>& backups) {
  if (auto ok = check_arguments(display_name, master, backups); !ok) return std::unexpected(ok.error());
  if (auto ok = check_serials(cfg, master, backups, {}, policy_); !ok) {
    util::log_warn("GroupLifecycle", "add '%s' rejected: %s", display_name.c_str(), ok.error().message.c_str());
    return std::unexpected(ok.error());
  }

  model::StorageConfiguration next = cfg;
  const std::string new_id = next.next_group_id();
  model::StorageGroup g;
  g.display_name = display_name;
  g.master = durable(master);
  std::vector<model::StorageDrive> bl;
  for (const auto& b : backups) bl.push_back(durable(b));
  g.backups = model::make_backups(bl);
  next.groups.emplace(new_id, std::move(g));

  if (auto ok = commit(cfg, std::move(next)); !ok) return std::unexpected(ok.error());
  // The new group sorts last, so it keeps the highest key after renumbering
  const std::string final_id = cfg.groups.rbegin()->first;
  util::log_info("GroupLifecycle", "added group %s '%s' (Master %s, %zu Backup(s))",
                 final_id.c_str(), display_name.c_str(), master.serial.c_str(), backups.size());
  return final_id;
}

model::Result<std::string> GroupLifecycle::edit_group(model::StorageConfiguration& cfg,
                                                      const std::string& group_id, const GroupEdit& edit) {
  const auto* current = cfg.find(group_id);
  if (!current)
    return make_error(ErrorKind::GroupNotFound, "group " + group_id + " does not exist", group_id);
  if (auto ok = check_edit(edit); !ok) return std::unexpected(ok.error());

  model::StorageGroup updated = *current;
  if (edit.display_name) updated.display_name = *edit.display_name;
  if (edit.master) updated.master = durable(*edit.master);
  if (edit.backups) {
    std::vector<model::StorageDrive> bl;
    for (const auto& b : *edit.backups) bl.push_back(durable(b));
    updated.backups = model::make_backups(bl);
  }
  auto backups = backup_list(updated);

  std::vector<std::string> held{current->master.serial};
  for (const auto& [bid, b] : current->backups) {
    (void)bid;
    held.push_back(b.serial);
  }
  if (auto ok = check_serials(cfg, updated.master, backups, group_id, policy_, held); !ok) {
    util::log_warn("GroupLifecycle", "edit of group %s rejected: %s", group_id.c_str(), ok.error().message.c_str());
    return std::unexpected(ok.error());
  }

  renumber_backups(updated);
  // Renumbering keeps order, so the group's final key is its position
  const auto position = std::distance(cfg.groups.begin(), cfg.groups.find(group_id));
  const std::string final_id = std::to_string(position + 1);
  model::StorageConfiguration next = cfg;
  next.groups[group_id] = std::move(updated);
  if (auto ok = commit(cfg, std::move(next)); !ok) return std::unexpected(ok.error());
  if (final_id != group_id)
    util::log_info("GroupLifecycle", "edited group %s (now %s)", group_id.c_str(), final_id.c_str());
  else
    util::log_info("GroupLifecycle", "edited group %s", group_id.c_str());
  return final_id;
}

model::Result<void> GroupLifecycle::remove_groups(model::StorageConfiguration& cfg,
                                                  const std::vector<std::string>& group_ids) {
  if (group_ids.empty())
    return make_error(ErrorKind::InvalidArgument, "no group ids given to remove");
  std::set<std::string> wanted(group_ids.begin(), group_ids.end());
  std::vector<std::string> missing;
  for (const auto& id : wanted)
    if (!cfg.find(id)) missing.push_back(id);
  if (!missing.empty()) {
    std::string list;
    for (const auto& id : missing) list += (list.empty() ? "" : ", ") + id;
    // group_id names a single group; a longer list stays in the message
    return make_error(ErrorKind::GroupNotFound, "no such group(s): " + list,
                      missing.size() == 1 ? missing.front() : std::string());
  }

  model::StorageConfiguration next = cfg;
  for (const auto& id : wanted) next.groups.erase(id);
  if (auto ok = commit(cfg, std::move(next)); !ok) return std::unexpected(ok.error());
  util::log_info("GroupLifecycle", "removed %zu group(s); %zu remain", wanted.size(), cfg.size());
  if (cfg.empty())
    util::log_info("GroupLifecycle", "storage is now unconfigured; first-run setup required");
  return {};
}

model::Result<void> GroupLifecycle::commit(model::StorageConfiguration& cfg, model::StorageConfiguration next) {
  renumber_groups(next);

  if (auto ok = store_.save(next); !ok) {
    util::log_error("GroupLifecycle", "%s", ok.error().message.c_str());
    return std::unexpected(ok.error());
  }

  auto reloaded = store_.load();
  if (!reloaded) {
    util::log_error("GroupLifecycle", "reload after write failed: %s", reloaded.error().message.c_str());
    return make_error(ErrorKind::Persistence, "reload after write failed: " + reloaded.error().message);
  }
  if (!same_durable_content(*reloaded, next)) {
    util::log_error("GroupLifecycle", "reloaded configuration differs from what was written to %s",
                    store_.path().c_str());
    return make_error(ErrorKind::Persistence, "reloaded configuration differs from what was written");
  }

  auto devices = devices_.list_devices();
  auto issues = validate(*reloaded, devices);
  if (!issues) return std::unexpected(issues.error());

  cfg = std::move(*reloaded);
  issues_ = std::move(*issues);
  update_registry(cfg, devices);
  return {};
}

void GroupLifecycle::update_registry(const model::StorageConfiguration& cfg, const model::DeviceList& devices) {
  registry_.rebuild(cfg, devices);
  if (registry_path_.empty()) return;
  if (!registry_.save(registry_path_))
    util::log_warn("GroupLifecycle", "registry export to %s failed", registry_path_.c_str());
}

} // namespace mediamgr::app
