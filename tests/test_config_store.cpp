#include "minitest.hpp"
#include "app/ConfigStore.hpp"
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;
using mediamgr::app::ConfigStore;
using mediamgr::model::ErrorKind;
using mediamgr::model::StorageConfiguration;
using mediamgr::model::StorageDrive;
using mediamgr::model::StorageGroup;

static fs::path test_dir(const char* suffix) {
  auto dir = fs::temp_directory_path() /
             ("mediamgr_configstore_test_" + std::to_string(::getpid()) + "_" + suffix);
  fs::remove_all(dir);
  fs::create_directories(dir);
  return dir;
}

static std::string read_all(const fs::path& p) {
  std::ifstream in(p);
  std::ostringstream os;
  os << in.rdbuf();
  return os.str();
}

static StorageGroup make_group(const std::string& name, const std::string& master,
                               std::vector<std::string> backups = {}) {
  StorageGroup g;
  g.display_name = name;
  g.master = StorageDrive{name + "_M", master, {}};
  int n = 0;
  for (const auto& b : backups) g.backups[std::to_string(++n)] = StorageDrive{name + "_B", b, {}};
  return g;
}

TEST(config_missing_file_is_empty) {
  auto dir = test_dir("missing");
  auto cfg = ConfigStore::load(dir / "storage.toml");
  ASSERT_TRUE(cfg.has_value());
  ASSERT_TRUE(cfg->empty());
  fs::remove_all(dir);
}

TEST(config_save_then_load) {
  auto dir = test_dir("save");
  StorageConfiguration cfg;
  cfg.groups["1"] = make_group("Archive", "M-100", {"B-200", "B-300"});
  cfg.groups["2"] = make_group("Photos", "M-101");
  cfg.groups["1"].master.status.available = true; // runtime only, never written
  ASSERT_TRUE(ConfigStore::save(dir / "storage.toml", cfg).has_value());

  auto text = read_all(dir / "storage.toml");
  ASSERT_TRUE(text.find("[Storage.1.Backup.2]") != std::string::npos);
  ASSERT_TRUE(text.find("available") == std::string::npos);

  auto loaded = ConfigStore::load(dir / "storage.toml");
  ASSERT_TRUE(loaded.has_value());
  ASSERT_EQ(loaded->size(), 2u);
  ASSERT_EQ(loaded->groups.at("1").backups.at("2").serial, "B-300");
  ASSERT_EQ(loaded->groups.at("2").display_name, "Photos");
  ASSERT_FALSE(loaded->groups.at("1").master.status.available);
  ASSERT_TRUE(mediamgr::app::same_durable_content(*loaded, cfg));
  fs::remove_all(dir);
}

TEST(config_load_save_load_is_idempotent) {
  auto dir = test_dir("idem");
  auto path = dir / "storage.toml";
  std::ofstream(path) <<
    "[Storage]\n"
    "[Storage.1]\n"
    "DisplayName = \"Media \\\"A\\\"\"\n"
    "[Storage.1.Master]\n"
    "Label = \"MEDIA_A\"\n"
    "SerialNumber = \"0042\"\n"
    "[Storage.1.Backup.1]\n"
    "Label = \"MEDIA_B\"\n"
    "SerialNumber = \"S2\"\n";
  auto first = ConfigStore::load(path);
  ASSERT_TRUE(first.has_value());
  ASSERT_EQ(first->groups.at("1").display_name, "Media \"A\"");
  ASSERT_EQ(first->groups.at("1").master.serial, "0042");
  ASSERT_TRUE(ConfigStore::save(path, *first).has_value());
  auto text1 = read_all(path);
  auto second = ConfigStore::load(path);
  ASSERT_TRUE(second.has_value());
  ASSERT_TRUE(mediamgr::app::same_durable_content(*first, *second));
  ASSERT_TRUE(ConfigStore::save(path, *second).has_value());
  ASSERT_EQ(read_all(path), text1);
  fs::remove_all(dir);
}

TEST(config_load_keeps_gaps) {
  auto dir = test_dir("gaps");
  auto path = dir / "storage.toml";
  std::ofstream(path) <<
    "[Storage.1.Master]\nSerialNumber = \"A\"\n"
    "[Storage.3.Master]\nSerialNumber = \"C\"\n";
  auto cfg = ConfigStore::load(path);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_EQ(cfg->size(), 2u);
  ASSERT_TRUE(cfg->find("3") != nullptr);
  ASSERT_TRUE(cfg->find("2") == nullptr);
  ASSERT_EQ(cfg->next_group_id(), "4");
  fs::remove_all(dir);
}

TEST(config_saves_numeric_key_order) {
  StorageConfiguration cfg;
  for (int i = 1; i <= 11; ++i) cfg.groups[std::to_string(i)] = make_group("G" + std::to_string(i), "S" + std::to_string(i));
  auto text = ConfigStore::to_text(cfg);
  auto p2 = text.find("[Storage.2]");
  auto p10 = text.find("[Storage.10]");
  ASSERT_TRUE(p2 != std::string::npos && p10 != std::string::npos);
  ASSERT_TRUE(p2 < p10);
}

TEST(config_empty_storage_table) {
  auto dir = test_dir("empty");
  auto path = dir / "storage.toml";
  ASSERT_TRUE(ConfigStore::save(path, StorageConfiguration{}).has_value());
  ASSERT_TRUE(read_all(path).find("[Storage]") != std::string::npos);
  auto cfg = ConfigStore::load(path);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_TRUE(cfg->empty());
  fs::remove_all(dir);
}

TEST(config_rejects_malformed) {
  auto dir = test_dir("malformed");
  auto path = dir / "storage.toml";

  std::ofstream(path) << "[Storage.x.Master]\nSerialNumber = \"A\"\n";
  auto bad_key = ConfigStore::load(path);
  ASSERT_FALSE(bad_key.has_value());
  ASSERT_TRUE(bad_key.error().kind == ErrorKind::Malformed);

  std::ofstream(path) << "[Storage.1]\nDisplayName = \"NoMaster\"\n";
  auto no_master = ConfigStore::load(path);
  ASSERT_FALSE(no_master.has_value());
  ASSERT_TRUE(no_master.error().kind == ErrorKind::Malformed);
  ASSERT_EQ(no_master.error().group_id, "1");

  std::ofstream(path) << "[Storage.1.Master]\nSerialNumber = \"A\"\n[Storage.1.Backup.0]\nSerialNumber = \"B\"\n";
  auto zero_backup = ConfigStore::load(path);
  ASSERT_FALSE(zero_backup.has_value());

  std::ofstream(path) << "[Storage.1.Master]\nLabel = \"NoSerial\"\n";
  auto no_serial = ConfigStore::load(path);
  ASSERT_FALSE(no_serial.has_value());
  fs::remove_all(dir);
}

TEST(config_ignores_other_sections) {
  auto dir = test_dir("other");
  auto path = dir / "storage.toml";
  std::ofstream(path) << "[Plugins]\nffmpeg = \"7.0\"\n[Storage.1.Master]\nSerialNumber = \"A\"\n";
  auto cfg = ConfigStore::load(path);
  ASSERT_TRUE(cfg.has_value());
  ASSERT_EQ(cfg->size(), 1u);
  fs::remove_all(dir);
}

TEST(config_save_failure_is_persistence_error) {
  auto dir = test_dir("fail");
  std::ofstream(dir / "blocker") << "x";
  // parent "directory" is a regular file
  auto r = ConfigStore::save(dir / "blocker" / "storage.toml", StorageConfiguration{});
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::Persistence);
  fs::remove_all(dir);
}
