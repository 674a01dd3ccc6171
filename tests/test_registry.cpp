#include "minitest.hpp"
#include "app/StorageRegistry.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

using mediamgr::app::StorageRegistry;
using mediamgr::model::DeviceDescriptor;
using mediamgr::model::DeviceList;
using mediamgr::model::StorageConfiguration;
using mediamgr::model::StorageDrive;
using mediamgr::model::StorageGroup;

static StorageGroup group(const std::string& name, const std::string& master,
                          const std::vector<std::string>& backups) {
  StorageGroup g;
  g.display_name = name;
  g.master = StorageDrive{"L-" + master, master, {}};
  std::vector<StorageDrive> bl;
  for (const auto& s : backups) bl.push_back(StorageDrive{"L-" + s, s, {}});
  g.backups = mediamgr::model::make_backups(bl);
  return g;
}

static DeviceDescriptor mounted(const std::string& serial, const std::string& name) {
  DeviceDescriptor d;
  d.serial = serial;
  d.name = name;
  d.mountpoint = "/media/" + name;
  d.total_bytes = 1000;
  d.free_bytes = 400;
  d.removable = true;
  return d;
}

static int count(const std::string& hay, const std::string& needle) {
  int n = 0;
  for (auto pos = hay.find(needle); pos != std::string::npos; pos = hay.find(needle, pos + 1)) ++n;
  return n;
}

static const auto kEpoch = std::chrono::system_clock::time_point{};

TEST(registry_empty_export) {
  StorageRegistry reg;
  reg.rebuild(StorageConfiguration{}, {}, kEpoch);
  ASSERT_TRUE(reg.empty());
  ASSERT_EQ(reg.export_text(), "# mediamgr storage registry\nlast_scanned 1970-01-01T00:00:00Z\n");
}

TEST(registry_nested_master_backups) {
  StorageConfiguration cfg;
  cfg.groups["1"] = group("Photos", "A", {"B", "C"});
  StorageRegistry reg;
  reg.rebuild(cfg, {mounted("A", "sdb1"), mounted("C", "sdc1")}, kEpoch);

  ASSERT_EQ(reg.entries().size(), 1u);
  const auto& e = reg.entries().at("A");
  ASSERT_EQ(e.group_ids.size(), 1u);
  ASSERT_EQ(e.backup_serials.size(), 2u);
  ASSERT_TRUE(reg.lookup("A") != nullptr);
  ASSERT_TRUE(reg.lookup("B") == nullptr);
  ASSERT_TRUE(reg.node("B") != nullptr);
  ASSERT_EQ(reg.node("B")->label, "L-B");

  std::istringstream lines(reg.export_text());
  std::string line;
  std::getline(lines, line);
  std::getline(lines, line);
  std::getline(lines, line);
  ASSERT_EQ(line, "groups 1");
  std::getline(lines, line);
  ASSERT_EQ(line, "  master A label=\"L-A\" available=yes device=sdb1 mount=/media/sdb1 total=1000 free=400 "
                  "removable=yes health=unknown");
  std::getline(lines, line);
  ASSERT_EQ(line, "    backup B label=\"L-B\" available=no");
  std::getline(lines, line);
  ASSERT_TRUE(line.rfind("    backup C label=\"L-C\" available=yes", 0) == 0);
}

TEST(registry_shared_serial_written_once) {
  StorageConfiguration cfg;
  cfg.groups["1"] = group("One", "A", {"S"});
  cfg.groups["2"] = group("Two", "D", {"S"});
  StorageRegistry reg;
  reg.rebuild(cfg, {}, kEpoch);
  auto text = reg.export_text();
  ASSERT_EQ(count(text, "backup S label="), 1);
  ASSERT_EQ(count(text, "backup S ref"), 1);
  ASSERT_TRUE(text.find("groups 1\n") < text.find("groups 2\n"));
}

TEST(registry_shared_master_merges_groups) {
  StorageConfiguration cfg;
  cfg.groups["1"] = group("One", "A", {"B"});
  cfg.groups["2"] = group("Two", "A", {"C"});
  StorageRegistry reg;
  reg.rebuild(cfg, {}, kEpoch);
  ASSERT_EQ(reg.entries().size(), 1u);
  auto text = reg.export_text();
  ASSERT_TRUE(text.find("groups 1 2\n") != std::string::npos);
  ASSERT_EQ(count(text, "master A"), 1);
  ASSERT_EQ(count(text, "backup B"), 1);
  ASSERT_EQ(count(text, "backup C"), 1);
}

TEST(registry_master_reused_as_backup_is_ref) {
  StorageConfiguration cfg;
  cfg.groups["1"] = group("One", "A", {"B"});
  cfg.groups["2"] = group("Two", "B", {"A"});
  StorageRegistry reg;
  reg.rebuild(cfg, {}, kEpoch);
  auto text = reg.export_text();
  ASSERT_EQ(count(text, " ref\n"), 2);
}

TEST(registry_rebuild_replaces_previous_scan) {
  StorageConfiguration cfg;
  cfg.groups["1"] = group("One", "A", {});
  StorageRegistry reg;
  reg.rebuild(cfg, {mounted("A", "sdb1")}, kEpoch);
  ASSERT_TRUE(reg.lookup("A") != nullptr);
  auto later = kEpoch + std::chrono::hours(24);
  reg.rebuild(cfg, {}, later);
  ASSERT_TRUE(reg.lookup("A") == nullptr);
  ASSERT_TRUE(reg.last_scanned() == later);
  ASSERT_TRUE(reg.export_text().find("last_scanned 1970-01-02T00:00:00Z") != std::string::npos);
}

TEST(registry_save_creates_directories) {
  auto dir = std::filesystem::temp_directory_path() /
             ("mediamgr_registry_test_" + std::to_string(::getpid()));
  std::filesystem::remove_all(dir);
  StorageConfiguration cfg;
  cfg.groups["1"] = group("One", "A", {"B"});
  StorageRegistry reg;
  reg.rebuild(cfg, {}, kEpoch);
  auto path = dir / "state" / "registry.toml";
  ASSERT_TRUE(reg.save(path));
  std::ifstream in(path);
  std::string body((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  ASSERT_EQ(body, reg.export_text());

  std::ofstream(dir / "file") << "x";
  ASSERT_FALSE(reg.save(dir / "file" / "registry.toml"));
  std::filesystem::remove_all(dir);
}
