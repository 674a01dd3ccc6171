#pragma once

#include "model/Error.hpp"
#include "model/Storage.hpp"
#include <filesystem>
#include <string>

namespace mediamgr::app {

// Reads and writes the storage configuration file. This is the only code
// that writes configuration to disk; only label and serial of each drive
// are written, runtime status never is.
class ConfigStore {
public:
  explicit ConfigStore(std::filesystem::path path) : path_(std::move(path)) {}

  [[nodiscard]] const std::filesystem::path& path() const { return path_; }

  // A missing file is an empty configuration, not an error. Keys are kept
  // exactly as found (gaps included).
  [[nodiscard]] model::Result<model::StorageConfiguration> load() const { return load(path_); }
  [[nodiscard]] model::Result<void> save(const model::StorageConfiguration& cfg) const { return save(path_, cfg); }

  [[nodiscard]] static model::Result<model::StorageConfiguration> load(const std::filesystem::path& path);

  // Groups in ascending numeric key order. Written to a sibling temp file
  // and renamed into place.
  [[nodiscard]] static model::Result<void> save(const std::filesystem::path& path,
                                                const model::StorageConfiguration& cfg);

  // Serialized document, exactly as save() writes it.
  [[nodiscard]] static std::string to_text(const model::StorageConfiguration& cfg);

private:
  std::filesystem::path path_;
};

// Same groups, keys, names, labels and serials (runtime status ignored).
[[nodiscard]] bool same_durable_content(const model::StorageConfiguration& a,
                                        const model::StorageConfiguration& b);

} // namespace mediamgr::app
