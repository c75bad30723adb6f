#include "RegisterCodec.hpp"
#include "ModbusError.hpp"
#include <cassert>
#include <cstdint>
#include <cstdio>
#include <vector>

using namespace ptg;

static const int kInvalidTs = static_cast<int>(Err::INVALID_TIMESTAMP);

int main() {
  // 2023-06-15 14:30:45.123
  {
    Reading<DateTime> r;
    assert(decode_datetime({0x0017, 0x060F, 0x0E1E, 0xB043}, r) == 0);
    assert(r.present);
    assert(r.value.year == 2023 && r.value.month == 6 && r.value.day == 15);
    assert(r.value.hour == 14 && r.value.minute == 30);
    assert(r.value.second == 45 && r.value.millisecond == 123);
    assert(format_datetime(r.value) == "2023-06-15T14:30:45.123");
  }
  // 2024-01-05 10:30:03.700, seconds and milliseconds share the last word
  {
    Reading<DateTime> r;
    assert(decode_datetime({24, 0x0105, 0x0A1E, 0x0E74}, r) == 0);
    assert(r.present);
    assert(r.value.year == 2024 && r.value.month == 1 && r.value.day == 5);
    assert(r.value.hour == 10 && r.value.minute == 30);
    assert(r.value.second == 3 && r.value.millisecond == 700);
    assert(format_datetime(r.value) == "2024-01-05T10:30:03.700");
  }
  // reserved high bits are masked off
  {
    Reading<DateTime> r;
    assert(decode_datetime({0xFF97, 0xF6EF, 0xEEDE, 0xB043}, r) == 0);
    assert(r.present);
    assert(r.value.year == 2023 && r.value.month == 6 && r.value.day == 15);
    assert(r.value.hour == 14 && r.value.minute == 30);
  }
  // all four words 0xFFFF is absence, not an invalid timestamp
  {
    Reading<DateTime> r = present(DateTime());
    assert(decode_datetime({0xFFFF, 0xFFFF, 0xFFFF, 0xFFFF}, r) == 0);
    assert(!r.present);
  }
  // partial sentinel is decoded and rejected
  {
    Reading<DateTime> r;
    assert(decode_datetime({0xFFFF, 0xFFFF, 0xFFFF, 0x0000}, r) == kInvalidTs);
  }
  // month 13, day 0, 30 February, hour 24, minute 60
  {
    Reading<DateTime> r;
    assert(decode_datetime({0x0017, 0x0D01, 0x0000, 0x0000}, r) == kInvalidTs);
    assert(decode_datetime({0x0017, 0x0100, 0x0000, 0x0000}, r) == kInvalidTs);
    assert(decode_datetime({0x0017, 0x021E, 0x0000, 0x0000}, r) == kInvalidTs);
    assert(decode_datetime({0x0017, 0x0101, 0x1800, 0x0000}, r) == kInvalidTs);
    assert(decode_datetime({0x0017, 0x0101, 0x003C, 0x0000}, r) == kInvalidTs);
    assert(decode_datetime({0x0017, 0x0101, 0x0000, 60000}, r) == kInvalidTs);
  }
  // leap day: valid in 2024, not in 2023
  {
    Reading<DateTime> r;
    assert(decode_datetime({0x0018, 0x021D, 0x0000, 0x0000}, r) == 0);
    assert(r.present && r.value.day == 29);
    assert(decode_datetime({0x0017, 0x021D, 0x0000, 0x0000}, r) == kInvalidTs);
  }
  // wrong word count
  {
    Reading<DateTime> r;
    assert(decode_datetime({0x0017, 0x060F, 0x0E1E}, r) == static_cast<int>(Err::MALFORMED_RESPONSE));
  }
  // encode packs the same layout and rejects years the 7-bit field cannot hold
  {
    DateTime dt;
    dt.year = 2023; dt.month = 6; dt.day = 15;
    dt.hour = 14; dt.minute = 30; dt.second = 45; dt.millisecond = 123;
    std::vector<std::uint16_t> w;
    assert(encode_datetime(present(dt), w) == 0);
    const std::vector<std::uint16_t> expect = {0x0017, 0x060F, 0x0E1E, 0xB043};
    assert(w == expect);

    w.clear();
    assert(encode_datetime(absent<DateTime>(), w) == 0);
    assert(w == std::vector<std::uint16_t>(4, 0xFFFF));

    w.clear();
    dt.year = 1999;
    assert(encode_datetime(present(dt), w) == kInvalidTs);
    dt.year = 2128;
    assert(encode_datetime(present(dt), w) == kInvalidTs);
    assert(w.empty());
  }

  std::puts("unit_datetime: ok");
  return 0;
}
