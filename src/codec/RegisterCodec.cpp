#include "RegisterCodec.hpp"
#include "ModbusError.hpp"
#include "../log.hpp"
#include <cmath>
#include <cstdio>
#include <cstring>

namespace ptg {

namespace {

int check_count(const std::vector<std::uint16_t>& regs, int expected, WireType t) {
  if (static_cast<int>(regs.size()) == expected) return 0;
  ptg::log::log_warn(__FILE__, __LINE__, "%s: expected %d registers, got %d",
                     wire_type_name(t), expected, static_cast<int>(regs.size()));
  return static_cast<int>(Err::MALFORMED_RESPONSE);
}

std::uint32_t join_u32(std::uint16_t hi, std::uint16_t lo) {
  return (std::uint32_t(hi) << 16) | lo;
}

void split_u32(std::uint32_t v, std::vector<std::uint16_t>& out) {
  out.push_back(static_cast<std::uint16_t>((v >> 16) & 0xFFFF));
  out.push_back(static_cast<std::uint16_t>(v & 0xFFFF));
}

std::uint64_t join_u64_be(const std::uint16_t* r) {
  return (std::uint64_t(r[0]) << 48) | (std::uint64_t(r[1]) << 32) |
         (std::uint64_t(r[2]) << 16) | std::uint64_t(r[3]);
}

bool is_leap(int y) { return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0; }

int days_in_month(int y, int m) {
  static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  if (m == 2 && is_leap(y)) return 29;
  return kDays[m - 1];
}

} // namespace

const char* wire_type_name(WireType t) {
  switch (t) {
    case WireType::UINT16: return "uint16";
    case WireType::UINT32: return "uint32";
    case WireType::UINT64: return "uint64";
    case WireType::FLOAT32: return "float32";
    case WireType::STRING: return "string";
    case WireType::DATETIME: return "datetime";
    case WireType::BITMAP: return "bitmap";
  }
  return "unknown";
}

int wire_word_count(WireType t) {
  switch (t) {
    case WireType::UINT16: return 1;
    case WireType::BITMAP: return 1;
    case WireType::UINT32: return 2;
    case WireType::FLOAT32: return 2;
    case WireType::UINT64: return 4;
    case WireType::DATETIME: return 4;
    case WireType::STRING: return 0;
  }
  return 0;
}

bool operator==(const DateTime& a, const DateTime& b) {
  return a.year == b.year && a.month == b.month && a.day == b.day &&
         a.hour == b.hour && a.minute == b.minute && a.second == b.second &&
         a.millisecond == b.millisecond;
}

bool is_valid_datetime(const DateTime& dt) {
  if (dt.month < 1 || dt.month > 12) return false;
  if (dt.day < 1 || dt.day > days_in_month(dt.year, dt.month)) return false;
  if (dt.hour < 0 || dt.hour > 23) return false;
  if (dt.minute < 0 || dt.minute > 59) return false;
  if (dt.second < 0 || dt.second > 59) return false;
  if (dt.millisecond < 0 || dt.millisecond > 999) return false;
  return true;
}

std::string format_datetime(const DateTime& dt) {
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03d",
                dt.year, dt.month, dt.day, dt.hour, dt.minute, dt.second, dt.millisecond);
  return std::string(buf);
}

int decode_u16(const std::vector<std::uint16_t>& regs, Reading<std::uint16_t>& out) {
  int rc = check_count(regs, 1, WireType::UINT16);
  if (rc != 0) return rc;
  out = regs[0] == kNullU16 ? absent<std::uint16_t>() : present(regs[0]);
  return 0;
}

int decode_u32(const std::vector<std::uint16_t>& regs, Reading<std::uint32_t>& out) {
  int rc = check_count(regs, 2, WireType::UINT32);
  if (rc != 0) return rc;
  std::uint32_t u = join_u32(regs[0], regs[1]);
  out = u == kNullU32 ? absent<std::uint32_t>() : present(u);
  return 0;
}

int decode_u64(const std::vector<std::uint16_t>& regs, Reading<std::uint64_t>& out) {
  int rc = check_count(regs, 4, WireType::UINT64);
  if (rc != 0) return rc;
  std::uint64_t u = join_u64_be(regs.data());
  out = u == kNullU64 ? absent<std::uint64_t>() : present(u);
  return 0;
}

int decode_f32(const std::vector<std::uint16_t>& regs, Reading<float>& out) {
  int rc = check_count(regs, 2, WireType::FLOAT32);
  if (rc != 0) return rc;
  std::uint32_t u = join_u32(regs[0], regs[1]);
  float f; std::memcpy(&f, &u, 4);
  // +/-Inf are real readings; only NaN means "not available"
  out = std::isnan(f) ? absent<float>() : present(f);
  return 0;
}

int decode_string(const std::vector<std::uint16_t>& regs, int words, Reading<std::string>& out) {
  int rc = check_count(regs, words, WireType::STRING);
  if (rc != 0) return rc;
  std::string s;
  s.reserve(regs.size() * 2);
  for (std::uint16_t r : regs) {
    char hi = static_cast<char>((r >> 8) & 0xFF);
    char lo = static_cast<char>(r & 0xFF);
    // zero bytes are dropped wherever they occur, not only as trailing padding
    if (hi != '\0') s.push_back(hi);
    if (lo != '\0') s.push_back(lo);
  }
  out = s.empty() ? absent<std::string>() : present(s);
  return 0;
}

int decode_datetime(const std::vector<std::uint16_t>& regs, Reading<DateTime>& out) {
  int rc = check_count(regs, 4, WireType::DATETIME);
  if (rc != 0) return rc;
  if (regs[0] == kNullU16 && regs[1] == kNullU16 && regs[2] == kNullU16 && regs[3] == kNullU16) {
    out = absent<DateTime>();
    return 0;
  }

  const std::uint16_t year_raw = regs[0];
  const std::uint16_t day_month = regs[1];
  const std::uint16_t minute_hour = regs[2];
  const std::uint16_t second_millisecond = regs[3];

  DateTime dt;
  dt.year = (year_raw & 0x7F) + 2000;
  dt.month = (day_month >> 8) & 0x0F;
  dt.day = day_month & 0x1F;
  dt.hour = (minute_hour >> 8) & 0x1F;
  dt.minute = minute_hour & 0x3F;
  dt.second = second_millisecond / 1000;
  dt.millisecond = second_millisecond % 1000;

  if (!is_valid_datetime(dt)) {
    ptg::log::log_warn(__FILE__, __LINE__, "datetime out of range: %04X %04X %04X %04X",
                       year_raw, day_month, minute_hour, second_millisecond);
    return static_cast<int>(Err::INVALID_TIMESTAMP);
  }
  out = present(dt);
  return 0;
}

int decode_bitmap(const std::vector<std::uint16_t>& regs, std::uint16_t& out) {
  int rc = check_count(regs, 1, WireType::BITMAP);
  if (rc != 0) return rc;
  out = regs[0];
  return 0;
}

void encode_u16(const Reading<std::uint16_t>& v, std::vector<std::uint16_t>& out) {
  out.push_back(v.present ? v.value : kNullU16);
}

void encode_u32(const Reading<std::uint32_t>& v, std::vector<std::uint16_t>& out) {
  split_u32(v.present ? v.value : kNullU32, out);
}

void encode_u64(const Reading<std::uint64_t>& v, std::vector<std::uint16_t>& out) {
  std::uint64_t u = v.present ? v.value : kNullU64;
  out.push_back(static_cast<std::uint16_t>((u >> 48) & 0xFFFF));
  out.push_back(static_cast<std::uint16_t>((u >> 32) & 0xFFFF));
  out.push_back(static_cast<std::uint16_t>((u >> 16) & 0xFFFF));
  out.push_back(static_cast<std::uint16_t>(u & 0xFFFF));
}

void encode_f32(const Reading<float>& v, std::vector<std::uint16_t>& out) {
  std::uint32_t u = kNullF32Bits;
  if (v.present) std::memcpy(&u, &v.value, 4);
  split_u32(u, out);
}

int encode_string(const std::string& s, int words, std::vector<std::uint16_t>& out) {
  if (words <= 0 || s.size() > static_cast<std::size_t>(words) * 2) {
    ptg::log::log_error(__FILE__, __LINE__, "string of %d bytes does not fit in %d registers",
                        static_cast<int>(s.size()), words);
    return static_cast<int>(Err::INVALID_ARG);
  }
  std::string padded = s;
  padded.resize(static_cast<std::size_t>(words) * 2, '\0');
  for (std::size_t i = 0; i < padded.size(); i += 2) {
    std::uint16_t hi = static_cast<std::uint8_t>(padded[i]);
    std::uint16_t lo = static_cast<std::uint8_t>(padded[i + 1]);
    out.push_back(static_cast<std::uint16_t>((hi << 8) | lo));
  }
  return 0;
}

int encode_datetime(const Reading<DateTime>& v, std::vector<std::uint16_t>& out) {
  if (!v.present) {
    out.insert(out.end(), 4, kNullU16);
    return 0;
  }
  const DateTime& dt = v.value;
  if (dt.year < 2000 || dt.year > 2127 || !is_valid_datetime(dt)) return static_cast<int>(Err::INVALID_TIMESTAMP);
  out.push_back(static_cast<std::uint16_t>(dt.year - 2000));
  out.push_back(static_cast<std::uint16_t>((dt.month << 8) | dt.day));
  out.push_back(static_cast<std::uint16_t>((dt.hour << 8) | dt.minute));
  out.push_back(static_cast<std::uint16_t>(dt.second * 1000 + dt.millisecond));
  return 0;
}

} // namespace ptg
