#include "ui/Formatting.hpp"
#include <iomanip>
#include <sstream>

namespace mediamgr::ui {

// Byte length of the UTF-8 sequence introduced by c (1 for stray bytes)
int u8_len(unsigned char c) {
  if (c < 0x80) return 1;
  if ((c >> 5) == 0x6) return 2;
  if ((c >> 4) == 0xE) return 3;
  if ((c >> 3) == 0x1E) return 4;
  return 1;
}

// One column per code point; serials and labels are never wide glyphs.
int display_cols(const std::string& s) {
  int cols = 0;
  size_t i = 0;
  while (i < s.size()) {
    size_t len = static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    i += (i + len > s.size()) ? 1 : len;
    ++cols;
  }
  return cols;
}

std::string take_cols(const std::string& s, int cols) {
  std::string out;
  size_t i = 0;
  for (int seen = 0; seen < cols && i < s.size(); ++seen) {
    size_t len = static_cast<size_t>(u8_len(static_cast<unsigned char>(s[i])));
    if (i + len > s.size()) len = 1;
    out.append(s, i, len);
    i += len;
  }
  return out;
}

// Left-aligned cell; overlong text keeps a trailing '.' marker.
std::string trunc_pad(const std::string& s, int w) {
  if (w <= 0) return {};
  const int cols = display_cols(s);
  if (cols <= w) return s + std::string(static_cast<size_t>(w - cols), ' ');
  if (w == 1) return take_cols(s, 1);
  return take_cols(s, w - 1) + ".";
}

// Right-aligned cell for numbers.
std::string rpad_trunc(const std::string& s, int w) {
  if (w <= 0) return {};
  const int cols = display_cols(s);
  if (cols <= w) return std::string(static_cast<size_t>(w - cols), ' ') + s;
  return take_cols(s, w);
}

std::string human_bytes(uint64_t b) {
  static constexpr const char* kUnits[] = {"K", "M", "G", "T"};
  if (b < 1024) return std::to_string(b) + "B";
  double v = static_cast<double>(b) / 1024.0;
  size_t unit = 0;
  while (v >= 1024.0 && unit + 1 < sizeof(kUnits) / sizeof(kUnits[0])) {
    v /= 1024.0;
    ++unit;
  }
  std::ostringstream os;
  os << std::fixed << std::setprecision(1) << v << kUnits[unit];
  return os.str();
}

} // namespace mediamgr::ui
