#pragma once

#include <cctype>
#include <fstream>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mediamgr::util {

// Small TOML subset used for settings and the storage configuration:
//   [dotted.table] headers
//   key = "basic string"    (\" \\ \n \t escapes)
//   key = 'literal string'
//   key = bare              (booleans, integers)
// plus full-line and trailing '#' comments. Tables and keys keep the order
// in which they were read or first set, so a load/write cycle is stable.
class TomlReader {
public:
  bool load(const std::string& path) {
    tables_.clear();
    std::ifstream in(path);
    if (!in.is_open()) return false;
    table_for("");
    size_t current = 0;
    std::string raw;
    while (std::getline(in, raw)) {
      std::string_view line = trim(raw);
      if (line.empty() || line.front() == '#') continue;
      if (line.front() == '[') {
        auto close = line.find(']');
        if (close == std::string_view::npos) continue;
        std::string name(trim(line.substr(1, close - 1)));
        table_for(name);
        current = index_of(name);
        continue;
      }
      auto eq = line.find('=');
      if (eq == std::string_view::npos) continue;
      std::string key(trim(line.substr(0, eq)));
      if (key.empty()) continue;
      tables_[current].put(key, parse_value(trim(line.substr(eq + 1))));
    }
    // keys before the first header live in the unnamed root table
    if (tables_.front().values.empty()) tables_.erase(tables_.begin());
    return !in.bad();
  }

  bool save(const std::string& path) const {
    std::ofstream out(path, std::ios::trunc);
    if (!out.is_open()) return false;
    write(out);
    out.flush();
    return out.good();
  }

  void write(std::ostream& out) const {
    bool first = true;
    for (const auto& t : tables_) {
      if (t.name.empty() && t.values.empty()) continue;
      if (!first) out << '\n';
      first = false;
      if (!t.name.empty()) out << '[' << t.name << "]\n";
      for (const auto& [k, v] : t.values) {
        out << k << " = ";
        if (v.quoted) out << '"' << escape(v.text) << '"';
        else out << v.text;
        out << '\n';
      }
    }
  }

  [[nodiscard]] std::string get_string(std::string_view table, std::string_view key,
                                        const std::string& def = "") const {
    const auto* v = find_value(table, key);
    return v ? v->text : def;
  }

  // true/false in any case, or 1/0; anything else yields def
  [[nodiscard]] bool get_bool(std::string_view table, std::string_view key, bool def = false) const {
    const auto* v = find_value(table, key);
    if (!v || v->text.empty()) return def;
    std::string lower;
    for (char c : v->text) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    if (lower == "true" || lower == "1") return true;
    if (lower == "false" || lower == "0") return false;
    return def;
  }

  // Strings are always written quoted, so an all-digit serial stays a string.
  void set(const std::string& table, const std::string& key, const std::string& value) {
    table_for(table).put(key, Value{value, true});
  }

  void set(const std::string& table, const std::string& key, const char* value) {
    set(table, key, std::string(value));
  }

  void set(const std::string& table, const std::string& key, bool value) {
    table_for(table).put(key, Value{value ? "true" : "false", false});
  }

  // Declare a table even if it stays empty (written as a bare header).
  void add_section(const std::string& table) { table_for(table); }

  [[nodiscard]] bool has(std::string_view table, std::string_view key) const {
    return find_value(table, key) != nullptr;
  }

  [[nodiscard]] bool has_section(std::string_view table) const { return find_table(table) != nullptr; }

  [[nodiscard]] std::vector<std::string> section_names() const {
    std::vector<std::string> out;
    for (const auto& t : tables_)
      if (!t.name.empty()) out.push_back(t.name);
    return out;
  }

  [[nodiscard]] std::vector<std::string> keys(std::string_view table) const {
    std::vector<std::string> out;
    if (const auto* t = find_table(table))
      for (const auto& kv : t->values) out.push_back(kv.first);
    return out;
  }

private:
  struct Value {
    std::string text;
    bool quoted{false};
  };

  struct Table {
    std::string name;
    std::vector<std::pair<std::string, Value>> values;

    void put(const std::string& key, Value v) {
      for (auto& kv : values)
        if (kv.first == key) { kv.second = std::move(v); return; }
      values.emplace_back(key, std::move(v));
    }
  };

  std::vector<Table> tables_;

  Table& table_for(const std::string& name) {
    for (auto& t : tables_)
      if (t.name == name) return t;
    tables_.push_back(Table{name, {}});
    return tables_.back();
  }

  [[nodiscard]] size_t index_of(std::string_view name) const {
    for (size_t i = 0; i < tables_.size(); ++i)
      if (tables_[i].name == name) return i;
    return tables_.size();
  }

  [[nodiscard]] const Table* find_table(std::string_view name) const {
    for (const auto& t : tables_)
      if (t.name == name) return &t;
    return nullptr;
  }

  [[nodiscard]] const Value* find_value(std::string_view table, std::string_view key) const {
    const auto* t = find_table(table);
    if (!t) return nullptr;
    for (const auto& kv : t->values)
      if (kv.first == key) return &kv.second;
    return nullptr;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }

  static Value parse_value(std::string_view sv) {
    if (sv.empty()) return {};
    if (sv.front() == '"') {
      std::string out;
      for (size_t i = 1; i < sv.size(); ++i) {
        char c = sv[i];
        if (c == '"') break;
        if (c == '\\' && i + 1 < sv.size()) {
          char n = sv[++i];
          if (n == 'n') c = '\n';
          else if (n == 't') c = '\t';
          else c = n;
        }
        out.push_back(c);
      }
      return Value{std::move(out), true};
    }
    if (sv.front() == '\'') {
      auto close = sv.find('\'', 1);
      return Value{std::string(sv.substr(1, close == std::string_view::npos ? std::string_view::npos : close - 1)),
                   true};
    }
    auto hash = sv.find('#');
    return Value{std::string(trim(sv.substr(0, hash))), false};
  }

  static std::string escape(const std::string& v) {
    std::string out;
    out.reserve(v.size());
    for (char c : v) {
      if (c == '\n') { out += "\\n"; continue; }
      if (c == '\t') { out += "\\t"; continue; }
      if (c == '"' || c == '\\') out.push_back('\\');
      out.push_back(c);
    }
    return out;
  }
};

} // namespace mediamgr::util
