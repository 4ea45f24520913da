#pragma once

#include "layout.hpp"

#include <array>
#include <bitset>

using Presence = std::bitset<CELLS_PER_PAGE>;

// a page held in one slot of the page buffer
template <typename Element>
struct Page
{
  PageId pageNumber = 0;
  std::array<Element, CELLS_PER_PAGE> cells = {};
  // bit i is set once cell i has been written
  Presence presence;
  bool dirty = false;
  // false until the slot has been loaded from the store
  bool valid = false;
  u64 lastTouch = 0;
};

// maps a logical index to its page and the cell within that page
struct CellAddress
{
  PageId pageNumber;
  u32 offset;

  static CellAddress of(u64 index) noexcept
  {
    return {static_cast<PageId>(index / CELLS_PER_PAGE), static_cast<u32>(index % CELLS_PER_PAGE)};
  }
};
