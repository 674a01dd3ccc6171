#pragma once

#include "model/Device.hpp"
#include "model/Error.hpp"
#include "model/Storage.hpp"
#include <optional>
#include <string>
#include <vector>

namespace mediamgr::app {

// Match every configured drive (Master, then Backups in ascending id) to a
// live descriptor by serial and refresh its runtime status. Unmatched
// drives are marked unavailable and reported; nothing is removed. Fails
// only for a malformed configuration (a drive without a serial).
[[nodiscard]] auto validate(model::StorageConfiguration& cfg, const model::DeviceList& devices)
    -> model::Result<std::vector<model::ValidationIssue>>;

// Descriptor for a serial; a mounted volume is preferred over an
// unmounted one of the same disk.
[[nodiscard]] auto match_device(const model::DeviceList& devices, const std::string& serial)
    -> const model::DeviceDescriptor*;

// First group (numeric order) holding the serial as Master or Backup.
[[nodiscard]] auto find_group_for_serial(const model::StorageConfiguration& cfg, const std::string& serial)
    -> std::optional<std::string>;

[[nodiscard]] auto format_issue(const model::ValidationIssue& issue) -> std::string;

} // namespace mediamgr::app
