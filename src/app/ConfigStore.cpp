#include "app/ConfigStore.hpp"
#include "util/Log.hpp"
#include "util/TomlReader.hpp"

#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <vector>

namespace mediamgr::app {

using model::ErrorKind;
using model::make_error;

static constexpr const char* kRoot = "Storage";

static std::vector<std::string> split_dots(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (true) {
    auto dot = s.find('.', start);
    out.push_back(s.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
    if (dot == std::string::npos) break;
    start = dot + 1;
  }
  return out;
}

static model::Result<model::StorageDrive> read_drive(const util::TomlReader& tr, const std::string& section,
                                                     const std::string& group_id) {
  if (!tr.has(section, "SerialNumber") || tr.get_string(section, "SerialNumber").empty())
    return make_error(ErrorKind::Malformed, "[" + section + "] has no SerialNumber", group_id);
  model::StorageDrive d;
  d.label = tr.get_string(section, "Label");
  d.serial = tr.get_string(section, "SerialNumber");
  for (const auto& k : tr.keys(section))
    if (k != "Label" && k != "SerialNumber")
      util::log_debug("ConfigStore", "ignoring unknown key %s in [%s]", k.c_str(), section.c_str());
  return d;
}

model::Result<model::StorageConfiguration> ConfigStore::load(const std::filesystem::path& path) {
  model::StorageConfiguration cfg;
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    util::log_info("ConfigStore", "no configuration at %s; starting unconfigured", path.c_str());
    return cfg;
  }
  util::TomlReader tr;
  if (!tr.load(path.string()))
    return make_error(ErrorKind::Persistence, "cannot read " + path.string() + ": " + std::strerror(errno));

  std::vector<std::string> masters_seen;
  for (const auto& name : tr.section_names()) {
    auto parts = split_dots(name);
    if (parts.empty() || parts[0] != kRoot) {
      if (!name.empty()) util::log_debug("ConfigStore", "ignoring section [%s]", name.c_str());
      continue;
    }
    if (parts.size() == 1) continue;

    const std::string& gid = parts[1];
    if (!model::is_id_key(gid))
      return make_error(ErrorKind::Malformed, "group key '" + gid + "' is not a positive integer", gid);
    auto& group = cfg.groups[gid];

    if (parts.size() == 2) {
      group.display_name = tr.get_string(name, "DisplayName");
    } else if (parts.size() == 3 && parts[2] == "Master") {
      auto drive = read_drive(tr, name, gid);
      if (!drive) return std::unexpected(drive.error());
      group.master = std::move(*drive);
      masters_seen.push_back(gid);
    } else if (parts.size() == 3 && parts[2] == "Backup") {
      // container table only
    } else if (parts.size() == 4 && parts[2] == "Backup") {
      const std::string& bid = parts[3];
      if (!model::is_id_key(bid))
        return make_error(ErrorKind::Malformed, "backup key '" + bid + "' in group " + gid +
                                                " is not a positive integer", gid);
      auto drive = read_drive(tr, name, gid);
      if (!drive) return std::unexpected(drive.error());
      group.backups[bid] = std::move(*drive);
    } else {
      return make_error(ErrorKind::Malformed, "unexpected section [" + name + "]", gid);
    }
  }

  for (const auto& [gid, g] : cfg.groups) {
    (void)g;
    bool has_master = false;
    for (const auto& m : masters_seen) if (m == gid) { has_master = true; break; }
    if (!has_master)
      return make_error(ErrorKind::Malformed, "group " + gid + " has no Master drive", gid);
  }
  util::log_debug("ConfigStore", "loaded %zu group(s) from %s", cfg.size(), path.c_str());
  return cfg;
}

static util::TomlReader to_toml(const model::StorageConfiguration& cfg) {
  util::TomlReader tr;
  tr.add_section(kRoot);
  for (const auto& [gid, g] : cfg.groups) {
    const std::string gsec = std::string(kRoot) + "." + gid;
    tr.set(gsec, "DisplayName", g.display_name);
    tr.set(gsec + ".Master", "Label", g.master.label);
    tr.set(gsec + ".Master", "SerialNumber", g.master.serial);
    for (const auto& [bid, b] : g.backups) {
      const std::string bsec = gsec + ".Backup." + bid;
      tr.set(bsec, "Label", b.label);
      tr.set(bsec, "SerialNumber", b.serial);
    }
  }
  return tr;
}

std::string ConfigStore::to_text(const model::StorageConfiguration& cfg) {
  std::ostringstream os;
  os << "# mediamgr storage configuration\n";
  to_toml(cfg).write(os);
  return os.str();
}

model::Result<void> ConfigStore::save(const std::filesystem::path& path, const model::StorageConfiguration& cfg) {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec)
      return make_error(ErrorKind::Persistence, "cannot create " + path.parent_path().string() + ": " + ec.message());
  }
  // Serialize fully before touching the target so a failure never truncates it
  const std::string body = to_text(cfg);
  auto tmp = path;
  tmp += ".tmp." + std::to_string(::getpid());
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out)
      return make_error(ErrorKind::Persistence, "cannot open " + tmp.string() + ": " + std::strerror(errno));
    out.write(body.data(), static_cast<std::streamsize>(body.size()));
    out.flush();
    if (!out.good()) {
      std::filesystem::remove(tmp, ec);
      return make_error(ErrorKind::Persistence, "short write to " + tmp.string());
    }
  }
  std::filesystem::rename(tmp, path, ec);
  if (ec) {
    std::error_code ec2;
    std::filesystem::remove(tmp, ec2);
    return make_error(ErrorKind::Persistence, "cannot replace " + path.string() + ": " + ec.message());
  }
  util::log_debug("ConfigStore", "wrote %zu group(s) to %s", cfg.size(), path.c_str());
  return {};
}

static bool same_drive(const model::StorageDrive& a, const model::StorageDrive& b) {
  return a.label == b.label && a.serial == b.serial;
}

bool same_durable_content(const model::StorageConfiguration& a, const model::StorageConfiguration& b) {
  if (a.groups.size() != b.groups.size()) return false;
  auto ia = a.groups.begin();
  auto ib = b.groups.begin();
  for (; ia != a.groups.end(); ++ia, ++ib) {
    if (ia->first != ib->first) return false;
    const auto& ga = ia->second;
    const auto& gb = ib->second;
    if (ga.display_name != gb.display_name || !same_drive(ga.master, gb.master)) return false;
    if (ga.backups.size() != gb.backups.size()) return false;
    auto ba = ga.backups.begin();
    auto bb = gb.backups.begin();
    for (; ba != ga.backups.end(); ++ba, ++bb)
      if (ba->first != bb->first || !same_drive(ba->second, bb->second)) return false;
  }
  return true;
}

} // namespace mediamgr::app
