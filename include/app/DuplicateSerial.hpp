#pragma once

#include "model/Error.hpp"
#include "model/Storage.hpp"
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace mediamgr::app {

// Asked when a serial is already used by another group; returning true
// means the operator explicitly accepts sharing the drive.
using ConfirmSharedSerial = std::function<bool(const std::string& serial, const std::string& other_group_id)>;

struct DuplicatePolicy {
  bool interactive{false};
  ConfirmSharedSerial confirm;  // consulted only when interactive
};

// Group (other than exclude_group_id) already holding serial as Master
// or Backup.
[[nodiscard]] std::optional<std::string> find_conflict(const model::StorageConfiguration& cfg,
                                                       std::string_view serial,
                                                       std::string_view exclude_group_id = {});

// A serial repeated inside one group (Master vs Backup, Backup vs Backup).
[[nodiscard]] std::optional<std::string> find_within_group_duplicate(const model::StorageDrive& master,
                                                                     const std::vector<model::StorageDrive>& backups);

// Within-group check (never bypassable), then the cross-group policy for
// every drive of the prospective group. Serials listed in already_held
// (kept unchanged by an edit) were accepted before and are not asked about
// again.
[[nodiscard]] model::Result<void> check_serials(const model::StorageConfiguration& cfg,
                                                const model::StorageDrive& master,
                                                const std::vector<model::StorageDrive>& backups,
                                                std::string_view exclude_group_id,
                                                const DuplicatePolicy& policy,
                                                const std::vector<std::string>& already_held = {});

} // namespace mediamgr::app
