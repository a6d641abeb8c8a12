#ifndef TRK_DETAIL_BYTE_ORDER_H
#define TRK_DETAIL_BYTE_ORDER_H

#include <cstddef>
#include <cstdint>
#include <cstring>

namespace trk {
namespace detail {

inline uint32_t bswap_u32(uint32_t u) {
  return ((u >> 24) & 0x000000FFu) | ((u >> 8) & 0x0000FF00u) | ((u << 8) & 0x00FF0000u) |
         ((u << 24) & 0xFF000000u);
}

inline void swap_2(int16_t &value) {
  const uint16_t u = static_cast<uint16_t>(value);
  const uint16_t swapped = static_cast<uint16_t>((u >> 8) | (u << 8));
  value = static_cast<int16_t>(swapped);
}

inline void swap_4(int32_t &value) { value = static_cast<int32_t>(bswap_u32(static_cast<uint32_t>(value))); }

inline void swap_4(float &value) {
  uint32_t u = 0;
  std::memcpy(&u, &value, sizeof(u));
  u = bswap_u32(u);
  std::memcpy(&value, &u, sizeof(value));
}

// In-place swap of a contiguous run of 4-byte words (float32 or int32 payload).
inline void swap_words(void *data, std::size_t count) {
  auto *bytes = static_cast<unsigned char *>(data);
  for (std::size_t i = 0; i < count; ++i) {
    uint32_t u = 0;
    std::memcpy(&u, bytes + i * 4, sizeof(u));
    u = bswap_u32(u);
    std::memcpy(bytes + i * 4, &u, sizeof(u));
  }
}

// Reads a 32-bit word from possibly unaligned memory.
inline uint32_t load_u32(const char *ptr) {
  uint32_t u = 0;
  std::memcpy(&u, ptr, sizeof(u));
  return u;
}

inline int32_t load_i32(const char *ptr, bool swapped) {
  uint32_t u = load_u32(ptr);
  if (swapped) {
    u = bswap_u32(u);
  }
  return static_cast<int32_t>(u);
}

} // namespace detail
} // namespace trk

#endif // TRK_DETAIL_BYTE_ORDER_H
