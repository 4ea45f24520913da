#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

// the swap file is little endian regardless of the host

inline void writeLittleu32(std::span<std::byte> out, u32 v) noexcept
{
  out[0] = static_cast<std::byte>((v >> 0) & 0xFF);
  out[1] = static_cast<std::byte>((v >> 8) & 0xFF);
  out[2] = static_cast<std::byte>((v >> 16) & 0xFF);
  out[3] = static_cast<std::byte>((v >> 24) & 0xFF);
}

inline u32 readLittleu32(std::span<const std::byte> in) noexcept
{
  return (static_cast<u32>(in[0]) << 0) |
         (static_cast<u32>(in[1]) << 8) |
         (static_cast<u32>(in[2]) << 16) |
         (static_cast<u32>(in[3]) << 24);
}

inline void writeLittlei32(std::span<std::byte> out, i32 v) noexcept
{
  writeLittleu32(out, static_cast<u32>(v));
}

inline i32 readLittlei32(std::span<const std::byte> in) noexcept
{
  return static_cast<i32>(readLittleu32(in));
}
