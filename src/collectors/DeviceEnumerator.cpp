#include "collectors/IDeviceEnumerator.hpp"
#ifdef __linux__
#include "collectors/BlockDeviceCollector.hpp"
#endif

namespace mediamgr::collectors {

std::unique_ptr<IDeviceEnumerator> make_device_enumerator() {
#ifdef __linux__
  return std::unique_ptr<IDeviceEnumerator>(new BlockDeviceCollector());
#else
  return std::unique_ptr<IDeviceEnumerator>(new NullDeviceEnumerator());
#endif
}

} // namespace mediamgr::collectors
