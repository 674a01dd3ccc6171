#include "collectors/BlockDeviceCollector.hpp"
#include "util/Log.hpp"
#include "util/Procfs.hpp"

#include <sys/statvfs.h>

#include <algorithm>
#include <charconv>
#include <filesystem>
#include <sstream>

namespace mediamgr::collectors {

static bool is_virtual_disk(const std::string& name) {
  return name.rfind("loop", 0) == 0 || name.rfind("ram", 0) == 0 || name.rfind("zram", 0) == 0;
}

static uint64_t parse_u64(const std::string& s) {
  uint64_t v = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), v);
  (void)ptr;
  return ec == std::errc{} ? v : 0;
}

std::string BlockDeviceCollector::unescape_mount_field(const std::string& s) {
  std::string out;
  out.reserve(s.size());
  for (size_t i = 0; i < s.size(); ++i) {
    if (s[i] == '\\' && i + 3 < s.size() &&
        s[i+1] >= '0' && s[i+1] <= '7' && s[i+2] >= '0' && s[i+2] <= '7' && s[i+3] >= '0' && s[i+3] <= '7') {
      out.push_back(static_cast<char>((s[i+1]-'0')*64 + (s[i+2]-'0')*8 + (s[i+3]-'0')));
      i += 3;
    } else {
      out.push_back(s[i]);
    }
  }
  return out;
}

BlockDeviceCollector::MountTable BlockDeviceCollector::parse_mounts(const std::string& text) {
  MountTable out;
  std::istringstream ss(text);
  std::string line;
  bool resolve_links = util::live_roots();
  while (std::getline(ss, line)) {
    if (line.empty()) continue;
    std::istringstream ls(line);
    std::string device, mountpoint, fstype;
    if (!(ls >> device >> mountpoint >> fstype)) continue;
    if (device.rfind("/dev/", 0) != 0) continue;
    device = unescape_mount_field(device);
    // /dev/disk/by-label/... and /dev/mapper/... are symlinks to the kernel node
    if (resolve_links) {
      std::error_code ec;
      auto canon = std::filesystem::canonical(device, ec);
      if (!ec) device = canon.string();
    }
    std::string key = std::filesystem::path(device).filename().string();
    if (key.empty() || out.count(key)) continue; // first mount of a device wins
    out.emplace(key, MountInfo{unescape_mount_field(mountpoint), fstype});
  }
  return out;
}

BlockDeviceCollector::UdevProps BlockDeviceCollector::read_udev(const std::string& majmin) {
  UdevProps props;
  if (majmin.empty()) return props;
  auto txt = util::read_file_string("/run/udev/data/b" + majmin);
  if (!txt) return props;
  std::istringstream ss(*txt);
  std::string line;
  while (std::getline(ss, line)) {
    if (line.rfind("E:", 0) != 0) continue;
    auto eq = line.find('=');
    if (eq == std::string::npos) continue;
    props[line.substr(2, eq - 2)] = line.substr(eq + 1);
  }
  return props;
}

std::optional<std::string> BlockDeviceCollector::lookup_serial(const std::string& base, const UdevProps& udev) {
  for (const char* key : {"ID_SERIAL_SHORT", "ID_SERIAL"}) {
    auto it = udev.find(key);
    if (it != udev.end() && !it->second.empty()) return it->second;
  }
  for (const char* file : {"/device/serial", "/device/wwid"}) {
    auto v = util::read_first_line(base + file);
    if (v && !v->empty()) return v;
  }
  return std::nullopt;
}

model::DeviceHealth BlockDeviceCollector::read_health(const std::string& base) {
  auto state = util::read_first_line(base + "/device/state");
  if (!state || state->empty()) return model::DeviceHealth::Unknown;
  if (*state == "running" || *state == "live") return model::DeviceHealth::Healthy;
  if (*state == "offline" || *state == "blocked" || *state == "dead") return model::DeviceHealth::Unhealthy;
  return model::DeviceHealth::Warning;
}

uint64_t BlockDeviceCollector::read_size_bytes(const std::string& base) {
  auto v = util::read_first_line(base + "/size");
  if (!v) return 0;
  return parse_u64(*v) * 512ULL; // sysfs size is always in 512-byte sectors
}

void BlockDeviceCollector::fill_capacity(model::DeviceDescriptor& d, uint64_t size_bytes) {
  d.total_bytes = size_bytes;
  d.free_bytes = 0;
  if (!d.mountpoint) return;
  struct statvfs vfs{};
  if (::statvfs(d.mountpoint->c_str(), &vfs) != 0) return;
  uint64_t total = static_cast<uint64_t>(vfs.f_blocks) * vfs.f_frsize;
  if (total == 0) return;
  d.total_bytes = total;
  d.free_bytes = static_cast<uint64_t>(vfs.f_bavail) * vfs.f_frsize;
}

bool BlockDeviceCollector::collect_disk(const std::string& disk, const MountTable& mounts,
                                        model::DeviceList& out) {
  const std::string base = "/sys/block/" + disk;
  auto majmin = util::read_first_line(base + "/dev").value_or("");
  auto udev = read_udev(majmin);
  auto serial = lookup_serial(base, udev);
  if (!serial) {
    util::log_debug("BlockDeviceCollector", "skipping %s: no serial number", disk.c_str());
    return false;
  }

  bool removable = util::read_first_line(base + "/removable").value_or("0") == "1";
  if (auto bus = udev.find("ID_BUS"); bus != udev.end() && bus->second == "usb") removable = true;
  auto model_name = util::read_first_line(base + "/device/model").value_or("");
  auto health = read_health(base);

  auto make = [&](const std::string& vol, const std::string& vol_base, const UdevProps& props) {
    model::DeviceDescriptor d;
    d.serial = *serial;
    d.name = vol;
    d.disk = disk;
    d.model = model_name;
    d.removable = removable;
    d.health = health;
    if (auto it = props.find("ID_FS_LABEL"); it != props.end()) d.label = it->second;
    if (auto it = props.find("ID_FS_TYPE"); it != props.end()) d.fstype = it->second;
    if (auto m = mounts.find(vol); m != mounts.end()) {
      d.mountpoint = m->second.mountpoint;
      if (d.fstype.empty()) d.fstype = m->second.fstype;
    }
    fill_capacity(d, read_size_bytes(vol_base));
    return d;
  };

  std::vector<std::string> parts;
  for (const auto& entry : util::list_dir(base)) {
    if (entry.rfind(disk, 0) != 0) continue;
    if (!util::path_exists(base + "/" + entry + "/partition")) continue;
    parts.push_back(entry);
  }
  std::sort(parts.begin(), parts.end());

  if (parts.empty()) {
    out.push_back(make(disk, base, udev));
    return true;
  }
  for (const auto& part : parts) {
    const std::string part_base = base + "/" + part;
    auto part_majmin = util::read_first_line(part_base + "/dev");
    if (!part_majmin) {
      util::log_warn("BlockDeviceCollector", "skipping partition %s: unreadable dev node", part.c_str());
      continue;
    }
    out.push_back(make(part, part_base, read_udev(*part_majmin)));
  }
  return true;
}

model::DeviceList BlockDeviceCollector::list_devices() {
  model::DeviceList out;
  MountTable mounts;
  if (auto txt = util::read_file_string("/proc/self/mounts")) {
    mounts = parse_mounts(*txt);
  } else if (util::live_roots()) {
    util::log_warn("BlockDeviceCollector", "cannot read /proc/self/mounts; mount points unavailable");
  } else {
    // fixture trees without a proc/ part are normal in test mode
    util::log_debug("BlockDeviceCollector", "no mounts table under the remapped proc root");
  }

  auto disks = util::list_dir("/sys/block");
  std::sort(disks.begin(), disks.end());
  for (const auto& disk : disks) {
    if (is_virtual_disk(disk)) continue;
    try {
      collect_disk(disk, mounts, out);
    } catch (const std::exception& e) {
      util::log_warn("BlockDeviceCollector", "skipping %s: %s", disk.c_str(), e.what());
    }
  }
  util::log_debug("BlockDeviceCollector", "enumerated %zu volume(s)", out.size());
  return out;
}

} // namespace mediamgr::collectors
