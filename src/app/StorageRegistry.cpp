#include "app/StorageRegistry.hpp"
#include "app/Validator.hpp"
#include "util/Log.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <fstream>
#include <sstream>
#include <unordered_set>

namespace mediamgr::app {

void StorageRegistry::rebuild(const model::StorageConfiguration& cfg, const model::DeviceList& devices,
                              std::chrono::system_clock::time_point now) {
  nodes_.clear();
  entries_.clear();
  last_scanned_ = now;

  auto touch = [&](const model::StorageDrive& d) {
    auto& n = nodes_[d.serial];
    if (n.serial.empty()) {
      n.serial = d.serial;
      n.label = d.label;
      if (const auto* dev = match_device(devices, d.serial)) n.device = *dev;
    }
  };

  for (const auto& [gid, g] : cfg.groups) {
    touch(g.master);
    auto& e = entries_[g.master.serial];
    e.master_serial = g.master.serial;
    e.group_ids.push_back(gid);
    for (const auto& [bid, b] : g.backups) {
      (void)bid;
      touch(b);
      e.backup_serials.push_back(b.serial);
    }
  }
}

const StorageRegistry::Node* StorageRegistry::node(const std::string& serial) const {
  auto it = nodes_.find(serial);
  return it == nodes_.end() ? nullptr : &it->second;
}

const model::DeviceDescriptor* StorageRegistry::lookup(const std::string& serial) const {
  const auto* n = node(serial);
  return (n && n->device) ? &*n->device : nullptr;
}

static std::string iso_time(std::chrono::system_clock::time_point tp) {
  auto t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static void write_node(std::ostringstream& os, const StorageRegistry::Node& n, const char* role, int depth,
                       std::unordered_set<const StorageRegistry::Node*>& visited) {
  std::string indent(static_cast<size_t>(depth) * 2, ' ');
  if (!visited.insert(&n).second) {
    os << indent << role << " " << n.serial << " ref\n";
    return;
  }
  os << indent << role << " " << n.serial << " label=\"" << n.label << "\"";
  if (!n.device) {
    os << " available=no\n";
    return;
  }
  const auto& d = *n.device;
  os << " available=yes"
     << " device=" << d.name
     << " mount=" << (d.mountpoint ? *d.mountpoint : std::string("-"))
     << " total=" << d.total_bytes
     << " free=" << d.free_bytes
     << " removable=" << (d.removable ? "yes" : "no")
     << " health=" << model::health_name(d.health) << '\n';
}

std::string StorageRegistry::export_text() const {
  std::ostringstream os;
  os << "# mediamgr storage registry\n";
  os << "last_scanned " << iso_time(last_scanned_) << '\n';
  std::unordered_set<const Node*> visited;
  for (const auto& [serial, e] : entries_) {
    os << "groups";
    for (const auto& g : e.group_ids) os << ' ' << g;
    os << '\n';
    if (const auto* m = node(serial)) write_node(os, *m, "master", 1, visited);
    for (const auto& bs : e.backup_serials)
      if (const auto* b = node(bs)) write_node(os, *b, "backup", 2, visited);
  }
  return os.str();
}

bool StorageRegistry::save(const std::filesystem::path& path) const {
  std::error_code ec;
  if (path.has_parent_path()) std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    util::log_warn("StorageRegistry", "cannot write %s: %s", path.c_str(), std::strerror(errno));
    return false;
  }
  auto body = export_text();
  out.write(body.data(), static_cast<std::streamsize>(body.size()));
  out.flush();
  return out.good();
}

} // namespace mediamgr::app
