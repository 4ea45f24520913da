#include "vmarray/cell_codec.hpp"

#include <algorithm>
#include <stdexcept>

std::ostream &operator<<(std::ostream &os, ElementKind kind)
{
  switch (kind)
  {
  case ElementKind::Integer:
    return os << "int";
  case ElementKind::FixedText:
    return os << "char";
  case ElementKind::VarText:
    return os << "varchar";
  }
  return os << "unknown";
}

std::ostream &operator<<(std::ostream &os, const ElementSpec &spec)
{
  os << spec.kind;
  if (spec.kind != ElementKind::Integer)
  {
    os << '(' << spec.fixedLen << ')';
  }
  return os;
}

FixedTextCodec::FixedTextCodec(u32 fixedLen)
: m_fixedLen(fixedLen)
{
  if (m_fixedLen == 0)
  {
    throw std::invalid_argument("Fixed text length must be at least 1");
  }
}

void FixedTextCodec::encode(const Element &v, std::span<std::byte> slot) const noexcept
{
  const std::size_t n = std::min<std::size_t>(v.size(), m_fixedLen);
  std::transform(v.begin(), v.begin() + n, slot.begin(),
                 [](char c) { return static_cast<std::byte>(c); });
  std::fill(slot.begin() + n, slot.begin() + m_fixedLen, std::byte{0});
}

FixedTextCodec::Element FixedTextCodec::fit(const Element &v) const
{
  std::size_t len = std::min<std::size_t>(v.size(), m_fixedLen);
  while (len > 0 && v[len - 1] == '\0')
  {
    --len;
  }
  return v.substr(0, len);
}

FixedTextCodec::Element FixedTextCodec::decode(std::span<const std::byte> slot) const
{
  std::size_t len = m_fixedLen;
  while (len > 0 && slot[len - 1] == std::byte{0})
  {
    --len;
  }

  Element out(len, '\0');
  std::transform(slot.begin(), slot.begin() + len, out.begin(),
                 [](std::byte b) { return static_cast<char>(b); });
  return out;
}
