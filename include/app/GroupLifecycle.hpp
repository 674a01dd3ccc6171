#pragma once

#include "app/ConfigStore.hpp"
#include "app/DuplicateSerial.hpp"
#include "app/StorageRegistry.hpp"
#include "collectors/IDeviceEnumerator.hpp"
#include "model/Error.hpp"
#include "model/Storage.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mediamgr::app {

// Fields left unset are kept as they are.
struct GroupEdit {
  std::optional<std::string> display_name;
  std::optional<model::StorageDrive> master;
  std::optional<std::vector<model::StorageDrive>> backups;  // replaces all Backups
};

// Re-key groups to "1".."N" in their current order.
void renumber_groups(model::StorageConfiguration& cfg);

// Re-key a group's Backups to "1".."M" in their current order.
void renumber_backups(model::StorageGroup& group);

// Add / Edit / Remove over a configuration the caller owns. Each call
// either applies the change, persists it, reloads it and re-validates it,
// or leaves the caller's configuration exactly as it was.
class GroupLifecycle {
public:
  GroupLifecycle(ConfigStore store, collectors::IDeviceEnumerator& devices, DuplicatePolicy policy);

  // Registry export written after load and after each mutation (empty: none).
  void set_registry_path(std::filesystem::path p) { registry_path_ = std::move(p); }

  // Startup: load, enumerate, validate. Never writes the configuration.
  [[nodiscard]] model::Result<std::vector<model::ValidationIssue>> load(model::StorageConfiguration& cfg);

  // Re-enumerate and validate the current configuration in place.
  [[nodiscard]] model::Result<std::vector<model::ValidationIssue>> refresh(model::StorageConfiguration& cfg);

  // Returns the key the new group ended up with.
  [[nodiscard]] model::Result<std::string> add_group(model::StorageConfiguration& cfg,
                                                     const std::string& display_name,
                                                     const model::StorageDrive& master,
                                                     const std::vector<model::StorageDrive>& backups);

  // Only the supplied fields are checked and applied. Returns the key the
  // group holds after renumbering.
  [[nodiscard]] model::Result<std::string> edit_group(model::StorageConfiguration& cfg,
                                                      const std::string& group_id, const GroupEdit& edit);

  // At least one id; all ids must exist, otherwise nothing is removed.
  [[nodiscard]] model::Result<void> remove_groups(model::StorageConfiguration& cfg,
                                                  const std::vector<std::string>& group_ids);

  [[nodiscard]] model::DeviceList list_devices() { return devices_.list_devices(); }
  [[nodiscard]] const std::vector<model::ValidationIssue>& last_issues() const { return issues_; }
  [[nodiscard]] const StorageRegistry& registry() const { return registry_; }
  [[nodiscard]] const ConfigStore& store() const { return store_; }

private:
  // Renumber, save, reload, compare, validate; swap into cfg on success.
  model::Result<void> commit(model::StorageConfiguration& cfg, model::StorageConfiguration next);
  void update_registry(const model::StorageConfiguration& cfg, const model::DeviceList& devices);

  ConfigStore store_;
  collectors::IDeviceEnumerator& devices_;
  DuplicatePolicy policy_;
  std::filesystem::path registry_path_;
  StorageRegistry registry_;
  std::vector<model::ValidationIssue> issues_;
};

} // namespace mediamgr::app
