#include "RegisterCodec.hpp"
#include "ModbusError.hpp"
#include <cassert>
#include <cmath>
#include <cstdint>
#include <cstring>
#include <cstdio>
#include <limits>
#include <vector>

using namespace ptg;

static const int kMalformed = static_cast<int>(Err::MALFORMED_RESPONSE);

int main() {
  // u16: plain value, sentinel, wrong count
  {
    Reading<std::uint16_t> r;
    assert(decode_u16({0x1234}, r) == 0);
    assert(r.present && r.value == 0x1234);
    assert(decode_u16({0xFFFF}, r) == 0);
    assert(!r.present);
    assert(decode_u16({}, r) == kMalformed);
    assert(decode_u16({1, 2}, r) == kMalformed);
  }
  // u32: high word first; 0xFFFFFFFF is a value, 0x80000000 is not
  {
    Reading<std::uint32_t> r;
    assert(decode_u32({0x0001, 0x0002}, r) == 0);
    assert(r.present && r.value == 0x00010002u);
    assert(decode_u32({0xFFFF, 0xFFFF}, r) == 0);
    assert(r.present && r.value == 0xFFFFFFFFu);
    assert(decode_u32({0x8000, 0x0000}, r) == 0);
    assert(!r.present);
    assert(decode_u32({0x8000}, r) == kMalformed);
  }
  // u64
  {
    Reading<std::uint64_t> r;
    assert(decode_u64({0x0000, 0x0000, 0x0001, 0x86A0}, r) == 0);
    assert(r.present && r.value == 100000ull);
    assert(decode_u64({0x1122, 0x3344, 0x5566, 0x7788}, r) == 0);
    assert(r.value == 0x1122334455667788ull);
    assert(decode_u64({0x8000, 0, 0, 0}, r) == 0);
    assert(!r.present);
    assert(decode_u64({0, 0, 0}, r) == kMalformed);
  }
  // f32: IEEE-754 big-endian; any NaN is absent, infinities are values
  {
    Reading<float> r;
    assert(decode_f32({0x4049, 0x0FDB}, r) == 0);
    assert(r.present && std::fabs(r.value - 3.14159274f) < 1e-6f);
    assert(decode_f32({0x0000, 0x0000}, r) == 0);
    assert(r.present && r.value == 0.0f);
    assert(decode_f32({0x7FC0, 0x0000}, r) == 0);
    assert(!r.present);
    assert(decode_f32({0xFFC0, 0x0001}, r) == 0);
    assert(!r.present);
    assert(decode_f32({0x7F80, 0x0000}, r) == 0);
    assert(r.present && std::isinf(r.value));
    assert(decode_f32({0x4049}, r) == kMalformed);
  }
  // encoders write the type's sentinel for absent values
  {
    std::vector<std::uint16_t> w;
    encode_u16(absent<std::uint16_t>(), w);
    encode_u32(absent<std::uint32_t>(), w);
    encode_u64(absent<std::uint64_t>(), w);
    encode_f32(absent<float>(), w);
    const std::vector<std::uint16_t> expect = {
      0xFFFF,
      0x8000, 0x0000,
      0x8000, 0x0000, 0x0000, 0x0000,
      0x7FC0, 0x0000,
    };
    assert(w == expect);
  }
  // encoders agree with the decoders on byte order
  {
    std::vector<std::uint16_t> w;
    encode_f32(present(-7.25f), w);
    assert(w.size() == 2 && w[0] == 0xC0E8 && w[1] == 0x0000);
    w.clear();
    encode_u64(present<std::uint64_t>(0x0102030405060708ull), w);
    assert(w.size() == 4 && w[0] == 0x0102 && w[3] == 0x0708);
  }
  // every non-sentinel u16 and a spread of u32 values survive encode then decode
  {
    std::vector<std::uint16_t> w;
    Reading<std::uint16_t> r16;
    for (std::uint32_t v = 0; v < 0xFFFF; ++v) {
      w.clear();
      encode_u16(present(static_cast<std::uint16_t>(v)), w);
      assert(decode_u16(w, r16) == 0);
      assert(r16.present && r16.value == v);
    }
    Reading<std::uint32_t> r32;
    for (std::uint64_t v = 0; v <= 0xFFFFFFFFull; v += 0x00010003ull) {
      if (v == kNullU32) continue;
      w.clear();
      encode_u32(present(static_cast<std::uint32_t>(v)), w);
      assert(decode_u32(w, r32) == 0);
      assert(r32.present && r32.value == v);
    }
    w.clear();
    encode_u32(present<std::uint32_t>(0x7FFFFFFFu), w);
    assert(decode_u32(w, r32) == 0 && r32.present && r32.value == 0x7FFFFFFFu);
  }
  // bitmap returns the raw word, sentinel included
  {
    std::uint16_t b = 0;
    assert(decode_bitmap({0xFFFF}, b) == 0);
    assert(b == 0xFFFF);
    assert(decode_bitmap({}, b) == kMalformed);
  }
  assert(wire_word_count(WireType::FLOAT32) == 2);
  assert(wire_word_count(WireType::DATETIME) == 4);
  assert(wire_word_count(WireType::STRING) == 0);

  std::puts("unit_codec: ok");
  return 0;
}
