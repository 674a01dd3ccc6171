#include "app/ConfigStore.hpp"
#include "app/GroupLifecycle.hpp"
#include "app/Settings.hpp"
#include "app/Validator.hpp"
#include "collectors/IDeviceEnumerator.hpp"
#include "ui/Formatting.hpp"
#include "util/Log.hpp"

#include <unistd.h>

#include <cstdio>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

using namespace mediamgr;

static void print_usage(std::ostream& os) {
  os << "Usage: mediamgr [--config PATH] [--non-interactive] [--yes] <command> [args]\n"
        "Commands:\n"
        "  devices                                   list attached volumes\n"
        "  groups                                    list storage groups with status\n"
        "  validate                                  report missing drives (exit 1 if a Master is missing)\n"
        "  add NAME MASTER_SERIAL [BACKUP_SERIAL...] create a group from available removable drives\n"
        "  edit ID [--name N] [--master S] [--backups S,S,...]\n"
        "  remove ID [ID...]                         delete groups and renumber the rest\n"
        "  find SERIAL                               group holding a serial\n"
        "  registry                                  print the diagnostic registry\n";
}

static std::vector<std::string> split_commas(const std::string& s) {
  std::vector<std::string> out;
  size_t start = 0;
  while (start <= s.size()) {
    auto comma = s.find(',', start);
    auto part = s.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
    if (!part.empty()) out.push_back(part);
    if (comma == std::string::npos) break;
    start = comma + 1;
  }
  return out;
}

// Blocks on stdin; the only suspension point in a mutation.
static bool confirm_on_tty(const std::string& serial, const std::string& other_group) {
  std::cout << "Serial " << serial << " is already used by group " << other_group
            << ". Share this drive with the new group? [y/N] " << std::flush;
  std::string answer;
  if (!std::getline(std::cin, answer)) return false;
  return answer == "y" || answer == "Y" || answer == "yes" || answer == "YES";
}

// Drive picker: only removable volumes that are present right now.
static std::optional<model::StorageDrive> select_drive(const model::DeviceList& devices, const std::string& serial) {
  for (const auto& d : devices) {
    if (d.serial != serial || !d.removable) continue;
    model::StorageDrive drive;
    drive.serial = d.serial;
    drive.label = !d.label.empty() ? d.label : (!d.model.empty() ? d.model : d.name);
    return drive;
  }
  return std::nullopt;
}

static int report(const model::StorageError& e) {
  std::cerr << "mediamgr: " << model::error_kind_name(e.kind) << ": " << e.message << "\n";
  return 1;
}

static void print_devices(const model::DeviceList& devices) {
  if (devices.empty()) { std::cout << "No devices found.\n"; return; }
  std::cout << ui::trunc_pad("DEVICE", 10) << ui::trunc_pad("SERIAL", 24) << ui::trunc_pad("LABEL", 16)
            << ui::trunc_pad("MOUNT", 24) << ui::rpad_trunc("FREE", 8) << ui::rpad_trunc("TOTAL", 8)
            << "  RM  HEALTH\n";
  for (const auto& d : devices) {
    std::cout << ui::trunc_pad(d.name, 10) << ui::trunc_pad(d.serial, 24) << ui::trunc_pad(d.label, 16)
              << ui::trunc_pad(d.mountpoint.value_or("-"), 24)
              << ui::rpad_trunc(ui::human_bytes(d.free_bytes), 8)
              << ui::rpad_trunc(ui::human_bytes(d.total_bytes), 8)
              << (d.removable ? "  yes " : "  no  ") << model::health_name(d.health) << "\n";
  }
}

static void print_drive(const char* role, const model::StorageDrive& d) {
  std::cout << "    " << ui::trunc_pad(role, 10) << ui::trunc_pad(d.serial, 24) << ui::trunc_pad(d.label, 16);
  if (d.status.available)
    std::cout << (d.status.mountpoint ? *d.status.mountpoint : std::string("(not mounted)"))
              << "  " << ui::human_bytes(d.status.free_bytes) << "/" << ui::human_bytes(d.status.total_bytes);
  else
    std::cout << "MISSING";
  std::cout << "\n";
}

static void print_groups(const model::StorageConfiguration& cfg) {
  if (cfg.empty()) { std::cout << "No storage groups configured.\n"; return; }
  for (const auto& [gid, g] : cfg.groups) {
    std::cout << "[" << gid << "] " << g.display_name << (model::is_group_usable(g) ? "" : "  (invalid: Master missing)")
              << "\n";
    print_drive("Master", g.master);
    for (const auto& [bid, b] : g.backups) print_drive(("Backup-" + bid).c_str(), b);
  }
}

static void print_issues(const std::vector<model::ValidationIssue>& issues) {
  for (const auto& is : issues) std::cout << "  ! " << app::format_issue(is) << "\n";
}

int main(int argc, char** argv) {
  std::optional<std::string> config_override;
  bool non_interactive = false;
  bool assume_yes = false;
  std::vector<std::string> args;
  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    if (a == "--config" && i + 1 < argc) config_override = argv[++i];
    else if (a == "--non-interactive") non_interactive = true;
    else if (a == "--yes" || a == "-y") assume_yes = true;
    else if (a == "-h" || a == "--help") { print_usage(std::cout); return 0; }
    else args.push_back(a);
  }
  if (args.empty()) { print_usage(std::cerr); return 2; }

  app::Settings settings = app::load_settings();
  if (config_override) settings.config_path = app::output_path(settings, *config_override);
  if (non_interactive || ::isatty(STDIN_FILENO) != 1) settings.interactive = assume_yes && !non_interactive;
  if (!app::apply_logging(settings))
    std::fprintf(stderr, "mediamgr: continuing without log file %s\n", settings.log_file.c_str());

  app::DuplicatePolicy policy;
  policy.interactive = settings.interactive;
  if (assume_yes) policy.confirm = [](const std::string&, const std::string&) { return true; };
  else policy.confirm = confirm_on_tty;

  auto enumerator = collectors::make_device_enumerator();
  app::GroupLifecycle lifecycle(app::ConfigStore(settings.config_path), *enumerator, policy);
  lifecycle.set_registry_path(settings.registry_path);

  const std::string& cmd = args[0];
  if (cmd == "devices") {
    print_devices(lifecycle.list_devices());
    return 0;
  }

  model::StorageConfiguration cfg;
  auto loaded = lifecycle.load(cfg);
  if (!loaded) return report(loaded.error());

  if (cmd == "groups") {
    print_groups(cfg);
    print_issues(*loaded);
    return 0;
  }
  if (cmd == "validate") {
    print_issues(*loaded);
    for (const auto& is : *loaded)
      if (is.role == model::DriveRole::Master) return 1;
    if (loaded->empty()) std::cout << "All configured drives are present.\n";
    return 0;
  }
  if (cmd == "find") {
    if (args.size() != 2) { print_usage(std::cerr); return 2; }
    auto gid = app::find_group_for_serial(cfg, args[1]);
    if (!gid) { std::cout << "Serial " << args[1] << " is not configured.\n"; return 1; }
    std::cout << *gid << "\n";
    return 0;
  }
  if (cmd == "registry") {
    std::cout << lifecycle.registry().export_text();
    return 0;
  }
  if (cmd == "add") {
    if (args.size() < 3) { print_usage(std::cerr); return 2; }
    auto devices = lifecycle.list_devices();
    std::vector<model::StorageDrive> picked;
    for (size_t i = 2; i < args.size(); ++i) {
      auto d = select_drive(devices, args[i]);
      if (!d) {
        std::cerr << "mediamgr: serial " << args[i] << " is not an available removable drive\n";
        return 1;
      }
      picked.push_back(*d);
    }
    std::vector<model::StorageDrive> backups(picked.begin() + 1, picked.end());
    auto id = lifecycle.add_group(cfg, args[1], picked.front(), backups);
    if (!id) return report(id.error());
    std::cout << "Added group " << *id << ".\n";
    print_issues(lifecycle.last_issues());
    return 0;
  }
  if (cmd == "edit") {
    if (args.size() < 2 || args.size() % 2 != 0) { print_usage(std::cerr); return 2; }
    app::GroupEdit edit;
    auto devices = lifecycle.list_devices();
    for (size_t i = 2; i + 1 < args.size(); i += 2) {
      const std::string& opt = args[i];
      const std::string& val = args[i + 1];
      if (opt == "--name") {
        edit.display_name = val;
      } else if (opt == "--master") {
        auto d = select_drive(devices, val);
        if (!d) { std::cerr << "mediamgr: serial " << val << " is not an available removable drive\n"; return 1; }
        edit.master = *d;
      } else if (opt == "--backups") {
        std::vector<model::StorageDrive> bl;
        for (const auto& s : split_commas(val)) {
          auto d = select_drive(devices, s);
          if (!d) { std::cerr << "mediamgr: serial " << s << " is not an available removable drive\n"; return 1; }
          bl.push_back(*d);
        }
        edit.backups = std::move(bl);
      } else {
        print_usage(std::cerr);
        return 2;
      }
    }
    auto id = lifecycle.edit_group(cfg, args[1], edit);
    if (!id) return report(id.error());
    std::cout << "Updated group " << *id << ".\n";
    print_issues(lifecycle.last_issues());
    return 0;
  }
  if (cmd == "remove") {
    if (args.size() < 2) { print_usage(std::cerr); return 2; }
    std::vector<std::string> ids(args.begin() + 1, args.end());
    auto ok = lifecycle.remove_groups(cfg, ids);
    if (!ok) return report(ok.error());
    std::cout << "Removed " << ids.size() << " group(s); " << cfg.size() << " remain.\n";
    return 0;
  }

  print_usage(std::cerr);
  return 2;
}
