#pragma once

#include "layout.hpp"

#include <iostream>
#include <span>
#include <string>

enum class ElementKind
{
  Integer,
  FixedText,
  VarText,
};

// the element type of an array, fixedLen is only used by the text kinds
struct ElementSpec
{
  ElementKind kind = ElementKind::Integer;
  u32 fixedLen = 0;

  static ElementSpec integer() noexcept { return {ElementKind::Integer, 0}; }
  static ElementSpec fixedText(u32 len) noexcept { return {ElementKind::FixedText, len}; }
  static ElementSpec varText(u32 maxLen) noexcept { return {ElementKind::VarText, maxLen}; }

  friend bool operator==(const ElementSpec &a, const ElementSpec &b)
  {
    return a.kind == b.kind && a.fixedLen == b.fixedLen;
  }
};

std::ostream &operator<<(std::ostream &os, ElementKind kind);
std::ostream &operator<<(std::ostream &os, const ElementSpec &spec);

// signed 32 bit integers, 4 bytes little endian per cell
struct IntCodec
{
  using Element = i32;

  u32 width() const noexcept { return sizeof(i32); }
  u32 regionSize() const { return roundToGranularity(static_cast<u64>(CELLS_PER_PAGE) * width()); }
  ElementSpec spec() const noexcept { return ElementSpec::integer(); }

  Element defaultValue() const noexcept { return 0; }
  Element fit(Element v) const noexcept { return v; }

  void encode(const Element &v, std::span<std::byte> slot) const noexcept
  {
    writeLittlei32(slot, v);
  }

  Element decode(std::span<const std::byte> slot) const noexcept
  {
    return readLittlei32(slot);
  }
};

// text of at most fixedLen single byte characters per cell.
// longer values are cut to fixedLen when written, shorter ones are padded
// with zero bytes which are stripped again when read
class FixedTextCodec
{
public:
  using Element = std::string;

  explicit FixedTextCodec(u32 fixedLen);

  u32 width() const noexcept { return m_fixedLen; }
  u32 regionSize() const { return roundToGranularity(static_cast<u64>(CELLS_PER_PAGE) * m_fixedLen); }
  ElementSpec spec() const noexcept { return ElementSpec::fixedText(m_fixedLen); }

  Element defaultValue() const { return {}; }
  // what a read gives back after v has been stored: cut to the fixed length,
  // trailing zero bytes dropped
  Element fit(const Element &v) const;

  void encode(const Element &v, std::span<std::byte> slot) const noexcept;
  Element decode(std::span<const std::byte> slot) const;

private:
  u32 m_fixedLen;
};
