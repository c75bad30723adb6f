#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace ptg {

// Wire-level value: present, or absent because the device sent the type's
// "not available" pattern. Absence is not an error.
template <typename T>
struct Reading {
  bool present{false};
  T value{};
};

template <typename T>
inline Reading<T> present(T v) {
  Reading<T> r;
  r.present = true;
  r.value = v;
  return r;
}

template <typename T>
inline Reading<T> absent() { return Reading<T>(); }

enum class WireType { UINT16, UINT32, UINT64, FLOAT32, STRING, DATETIME, BITMAP };

const char* wire_type_name(WireType t);

// Fixed word count per wire type; 0 for STRING (width set by the attribute).
int wire_word_count(WireType t);

constexpr std::uint16_t kNullU16 = 0xFFFF;
constexpr std::uint32_t kNullU32 = 0x80000000u;
constexpr std::uint64_t kNullU64 = 0x8000000000000000ull;
constexpr std::uint32_t kNullF32Bits = 0x7FC00000u;

// Device-local calendar time, no timezone.
struct DateTime {
  int year{2000};
  int month{1};
  int day{1};
  int hour{0};
  int minute{0};
  int second{0};
  int millisecond{0};
};

bool operator==(const DateTime& a, const DateTime& b);
inline bool operator!=(const DateTime& a, const DateTime& b) { return !(a == b); }

bool is_valid_datetime(const DateTime& dt);

// "YYYY-MM-DDTHH:MM:SS.mmm"
std::string format_datetime(const DateTime& dt);

// Decoders return 0, MALFORMED_RESPONSE when regs.size() does not match the
// type's word count, or INVALID_TIMESTAMP for out-of-range calendar fields.
// Words are composed high word first, high byte first.
int decode_u16(const std::vector<std::uint16_t>& regs, Reading<std::uint16_t>& out);
int decode_u32(const std::vector<std::uint16_t>& regs, Reading<std::uint32_t>& out);
int decode_u64(const std::vector<std::uint16_t>& regs, Reading<std::uint64_t>& out);
int decode_f32(const std::vector<std::uint16_t>& regs, Reading<float>& out);
int decode_string(const std::vector<std::uint16_t>& regs, int words, Reading<std::string>& out);
int decode_datetime(const std::vector<std::uint16_t>& regs, Reading<DateTime>& out);
// Raw single word for bit-field decoding; never absent.
int decode_bitmap(const std::vector<std::uint16_t>& regs, std::uint16_t& out);

// Encoders append to out. Absent values encode as the type's sentinel.
void encode_u16(const Reading<std::uint16_t>& v, std::vector<std::uint16_t>& out);
void encode_u32(const Reading<std::uint32_t>& v, std::vector<std::uint16_t>& out);
void encode_u64(const Reading<std::uint64_t>& v, std::vector<std::uint16_t>& out);
void encode_f32(const Reading<float>& v, std::vector<std::uint16_t>& out);
// INVALID_ARG if s does not fit in 2*words bytes; pads with zero bytes.
int encode_string(const std::string& s, int words, std::vector<std::uint16_t>& out);
// INVALID_TIMESTAMP if dt is out of range or the year is outside [2000, 2127].
int encode_datetime(const Reading<DateTime>& v, std::vector<std::uint16_t>& out);

} // namespace ptg
