#pragma once

#include "machine.hpp"

#include <array>
#include <limits>
#include <stdexcept>

using PageId = u32;

const u32 CELLS_PER_PAGE = 128;
const u32 BITMAP_SIZE = (CELLS_PER_PAGE + 7) / 8; // 16 bytes
// data regions are padded up to a multiple of this
const u32 STORAGE_GRANULARITY = 512;
// number of pages kept in memory per array
const std::size_t BUFFER_PAGES = 3;

constexpr std::array<char, 2> SIGNATURE = {'V', 'M'};
constexpr u64 SIGNATURE_SIZE = SIGNATURE.size();

inline u32 roundToGranularity(u64 bytes)
{
  const u64 rounded = (bytes + STORAGE_GRANULARITY - 1) / STORAGE_GRANULARITY * STORAGE_GRANULARITY;
  if (rounded > std::numeric_limits<u32>::max())
  {
    throw std::invalid_argument("Data region does not fit in a page slot");
  }
  return static_cast<u32>(rounded);
}

// the shape of a swap file, fixed when the array is created
//
// offset 0: signature "VM"
// offset 2: for each page, BITMAP_SIZE bytes of presence bits followed by
//           dataRegionSize bytes of encoded cells
struct Layout
{
  u32 pageCount;
  u32 dataRegionSize;

  static Layout forArray(u64 arraySize, u32 dataRegionSize)
  {
    const u64 pages = (arraySize + CELLS_PER_PAGE - 1) / CELLS_PER_PAGE;
    if (pages > std::numeric_limits<PageId>::max())
    {
      throw std::invalid_argument("Array has too many pages");
    }
    return Layout{static_cast<u32>(pages), dataRegionSize};
  }

  u64 slotSize() const noexcept { return BITMAP_SIZE + static_cast<u64>(dataRegionSize); }

  u64 pageOffset(PageId pageNum) const noexcept
  {
    return SIGNATURE_SIZE + static_cast<u64>(pageNum) * slotSize();
  }

  u64 fileSize() const noexcept { return pageOffset(pageCount); }

  friend bool operator==(const Layout &a, const Layout &b)
  {
    return a.pageCount == b.pageCount && a.dataRegionSize == b.dataRegionSize;
  }
};
