#include "minitest.hpp"
#include "app/DuplicateSerial.hpp"
#include <string>

using mediamgr::app::check_serials;
using mediamgr::app::DuplicatePolicy;
using mediamgr::app::find_conflict;
using mediamgr::app::find_within_group_duplicate;
using mediamgr::model::ErrorKind;
using mediamgr::model::StorageConfiguration;
using mediamgr::model::StorageDrive;

static StorageConfiguration two_groups() {
  StorageConfiguration cfg;
  cfg.groups["1"].master = StorageDrive{"A", "M-1", {}};
  cfg.groups["1"].backups["1"] = StorageDrive{"AB", "B-1", {}};
  cfg.groups["2"].master = StorageDrive{"C", "M-2", {}};
  return cfg;
}

TEST(conflict_found_in_master_and_backup) {
  auto cfg = two_groups();
  ASSERT_EQ(*find_conflict(cfg, "M-2"), "2");
  ASSERT_EQ(*find_conflict(cfg, "B-1"), "1");
  ASSERT_FALSE(find_conflict(cfg, "X").has_value());
}

TEST(conflict_excludes_own_group) {
  auto cfg = two_groups();
  ASSERT_FALSE(find_conflict(cfg, "B-1", "1").has_value());
  ASSERT_EQ(*find_conflict(cfg, "M-2", "1"), "2");
}

TEST(within_group_duplicate_detected) {
  StorageDrive m{"", "S1", {}};
  ASSERT_EQ(*find_within_group_duplicate(m, {StorageDrive{"", "S1", {}}}), "S1");
  ASSERT_EQ(*find_within_group_duplicate(m, {StorageDrive{"", "S2", {}}, StorageDrive{"", "S2", {}}}), "S2");
  ASSERT_FALSE(find_within_group_duplicate(m, {StorageDrive{"", "S2", {}}}).has_value());
}

TEST(within_group_duplicate_never_confirmable) {
  auto cfg = two_groups();
  int asked = 0;
  DuplicatePolicy policy{true, [&](const std::string&, const std::string&) { ++asked; return true; }};
  auto r = check_serials(cfg, StorageDrive{"", "N-1", {}}, {StorageDrive{"", "N-1", {}}}, {}, policy);
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::DuplicateSerial);
  ASSERT_EQ(asked, 0);
}

TEST(cross_group_non_interactive_rejects) {
  auto cfg = two_groups();
  DuplicatePolicy policy{false, [](const std::string&, const std::string&) { return true; }};
  auto r = check_serials(cfg, StorageDrive{"", "M-2", {}}, {}, {}, policy);
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().kind == ErrorKind::DuplicateSerial);
  ASSERT_EQ(r.error().group_id, "2");
  ASSERT_EQ(r.error().serial, "M-2");
}

TEST(cross_group_interactive_asks_operator) {
  auto cfg = two_groups();
  std::string asked_serial, asked_group;
  DuplicatePolicy yes{true, [&](const std::string& s, const std::string& g) { asked_serial = s; asked_group = g; return true; }};
  ASSERT_TRUE(check_serials(cfg, StorageDrive{"", "N-1", {}}, {StorageDrive{"", "B-1", {}}}, {}, yes).has_value());
  ASSERT_EQ(asked_serial, "B-1");
  ASSERT_EQ(asked_group, "1");

  DuplicatePolicy no{true, [](const std::string&, const std::string&) { return false; }};
  auto r = check_serials(cfg, StorageDrive{"", "B-1", {}}, {}, {}, no);
  ASSERT_FALSE(r.has_value());
  ASSERT_TRUE(r.error().message.find("declined") != std::string::npos);
}

TEST(already_held_serials_not_asked_again) {
  auto cfg = two_groups();
  cfg.groups["2"].backups["1"] = StorageDrive{"", "B-1", {}}; // shared earlier with consent
  DuplicatePolicy strict{false, {}};
  auto r = check_serials(cfg, StorageDrive{"", "M-2", {}}, {StorageDrive{"", "B-1", {}}}, "2", strict, {"M-2", "B-1"});
  ASSERT_TRUE(r.has_value());
}
