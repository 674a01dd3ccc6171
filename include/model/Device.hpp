#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace mediamgr::model {

enum class DeviceHealth { Unknown, Healthy, Warning, Unhealthy };

// One enumerated volume (partition, or whole disk when unpartitioned).
// Partitions of the same disk share the disk's serial.
struct DeviceDescriptor {
  std::string serial;                     // hardware serial, opaque
  std::string label;                      // filesystem label, may be empty
  std::optional<std::string> mountpoint;  // absent if not mounted
  uint64_t total_bytes{};
  uint64_t free_bytes{};
  bool removable{false};
  DeviceHealth health{DeviceHealth::Unknown};

  // diagnostics
  std::string name;    // e.g., sdb1
  std::string disk;    // e.g., sdb
  std::string fstype;  // e.g., exfat, ext4
  std::string model;
};

[[nodiscard]] inline const char* health_name(DeviceHealth h) {
  switch (h) {
    case DeviceHealth::Healthy:   return "healthy";
    case DeviceHealth::Warning:   return "warning";
    case DeviceHealth::Unhealthy: return "unhealthy";
    case DeviceHealth::Unknown:   break;
  }
  return "unknown";
}

using DeviceList = std::vector<DeviceDescriptor>;

} // namespace mediamgr::model
