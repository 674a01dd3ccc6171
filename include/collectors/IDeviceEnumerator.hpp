#pragma once
#include "model/Device.hpp"
#include <memory>

namespace mediamgr::collectors {

// Lists attached block devices and their volumes. Implementations are
// read-only; "no devices" is an empty list, and a device that fails to
// enumerate is logged and skipped rather than failing the whole call.
class IDeviceEnumerator {
public:
  virtual ~IDeviceEnumerator() = default;

  [[nodiscard]] virtual model::DeviceList list_devices() = 0;

  // Optional: human-friendly name for diagnostics
  [[nodiscard]] virtual const char* name() const = 0;
};

// Used on platforms without a device query facility.
class NullDeviceEnumerator final : public IDeviceEnumerator {
public:
  [[nodiscard]] model::DeviceList list_devices() override { return {}; }
  [[nodiscard]] const char* name() const override { return "null"; }
};

// Enumerator for this platform (sysfs on Linux, null elsewhere).
[[nodiscard]] std::unique_ptr<IDeviceEnumerator> make_device_enumerator();

} // namespace mediamgr::collectors
