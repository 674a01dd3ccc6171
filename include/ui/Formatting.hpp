#pragma once

#include <cstdint>
#include <string>

namespace mediamgr::ui {

// UTF-8 text width utilities
int u8_len(unsigned char c);
int display_cols(const std::string& s);
std::string take_cols(const std::string& s, int cols);

// Text formatting and alignment
std::string trunc_pad(const std::string& s, int w);
std::string rpad_trunc(const std::string& s, int w);

// 1536 -> "1.5K", 0 -> "0B"
std::string human_bytes(uint64_t b);

} // namespace mediamgr::ui
