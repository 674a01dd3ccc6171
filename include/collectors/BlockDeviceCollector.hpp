#pragma once
#include "collectors/IDeviceEnumerator.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace mediamgr::collectors {

// Linux: walks /sys/block, reads identity from the udev database under
// /run/udev/data and mount state from /proc/self/mounts.
class BlockDeviceCollector final : public IDeviceEnumerator {
public:
  [[nodiscard]] model::DeviceList list_devices() override;
  [[nodiscard]] const char* name() const override { return "sysfs"; }

  struct MountInfo { std::string mountpoint; std::string fstype; };
  using MountTable = std::unordered_map<std::string, MountInfo>; // kernel name -> mount

  // Parse mounts(5) text, keyed by the kernel name of the source device.
  [[nodiscard]] static MountTable parse_mounts(const std::string& text);

  // Decode the \040-style octal escapes used in mounts(5).
  [[nodiscard]] static std::string unescape_mount_field(const std::string& s);

private:
  using UdevProps = std::unordered_map<std::string, std::string>;

  bool collect_disk(const std::string& disk, const MountTable& mounts, model::DeviceList& out);
  static UdevProps read_udev(const std::string& majmin);
  static std::optional<std::string> lookup_serial(const std::string& base, const UdevProps& udev);
  static model::DeviceHealth read_health(const std::string& base);
  static uint64_t read_size_bytes(const std::string& base);
  static void fill_capacity(model::DeviceDescriptor& d, uint64_t size_bytes);
};

} // namespace mediamgr::collectors
