#pragma once

#include "model/Device.hpp"
#include "model/Storage.hpp"
#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace mediamgr::app {

// Diagnostic cache of the last enumeration, nested Master -> Backups.
// Never consulted for decisions; rebuilt from configuration + devices and
// exported for inspection.
class StorageRegistry {
public:
  // One per distinct serial, shared by every group that references it.
  struct Node {
    std::string serial;
    std::string label;                              // configured label
    std::optional<model::DeviceDescriptor> device;  // most recent observation
  };

  // Master-rooted entry; a Master serial shared by several groups merges
  // their Backups into one entry.
  struct Entry {
    std::string master_serial;
    std::vector<std::string> group_ids;
    std::vector<std::string> backup_serials;
  };

  void rebuild(const model::StorageConfiguration& cfg, const model::DeviceList& devices,
               std::chrono::system_clock::time_point now = std::chrono::system_clock::now());

  [[nodiscard]] const std::map<std::string, Entry>& entries() const { return entries_; }
  [[nodiscard]] const Node* node(const std::string& serial) const;
  [[nodiscard]] const model::DeviceDescriptor* lookup(const std::string& serial) const;
  [[nodiscard]] std::chrono::system_clock::time_point last_scanned() const { return last_scanned_; }
  [[nodiscard]] bool empty() const { return entries_.empty(); }

  // Indented text dump. A node reached a second time is written as a
  // "ref" line instead of being expanded again.
  [[nodiscard]] std::string export_text() const;

  bool save(const std::filesystem::path& path) const;

private:
  std::map<std::string, Node> nodes_;
  std::map<std::string, Entry> entries_;
  std::chrono::system_clock::time_point last_scanned_{};
};

} // namespace mediamgr::app
