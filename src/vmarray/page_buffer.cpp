#include "vmarray/page_buffer.hpp"
#include "vmarray/cell_codec.hpp"

#include <utility>

template <typename Codec>
PageBuffer<Codec>::PageBuffer(PageStore store, Codec codec)
: m_store(std::move(store)), m_codec(std::move(codec)), m_slots()
{
}

template <typename Codec>
typename PageBuffer<Codec>::PageType &PageBuffer<Codec>::locateOrAdmit(PageId pageNum)
{
  for (PageType &slot : m_slots)
  {
    if (slot.valid && slot.pageNumber == pageNum)
    {
      touch(slot);
      return slot;
    }
  }

  PageType &target = admissionTarget();

  // decode into temporaries so a failed read leaves the slot as it was
  Presence presence;
  std::array<Element, CELLS_PER_PAGE> cells = {};
  m_store.readPage(pageNum, m_codec, presence, cells);

  target.pageNumber = pageNum;
  target.cells = std::move(cells);
  target.presence = presence;
  target.dirty = false;
  target.valid = true;
  touch(target);
  return target;
}

template <typename Codec>
typename PageBuffer<Codec>::PageType &PageBuffer<Codec>::admissionTarget()
{
  for (PageType &slot : m_slots)
  {
    if (!slot.valid)
    {
      return slot;
    }
  }

  // all slots are loaded, take the oldest. ties go to the earlier slot
  PageType *victim = &m_slots[0];
  for (PageType &slot : m_slots)
  {
    if (slot.lastTouch < victim->lastTouch)
    {
      victim = &slot;
    }
  }

  if (victim->dirty)
  {
    writeBack(*victim);
  }
  return *victim;
}

template <typename Codec>
void PageBuffer<Codec>::writeBack(PageType &page)
{
  m_store.writePage(page.pageNumber, m_codec, page.presence, page.cells);
  page.dirty = false;
}

template <typename Codec>
void PageBuffer<Codec>::flush()
{
  for (PageType &slot : m_slots)
  {
    if (slot.valid && slot.dirty)
    {
      writeBack(slot);
    }
  }
}

template <typename Codec>
std::vector<PageId> PageBuffer<Codec>::residentPages() const
{
  std::vector<PageId> pages;
  for (const PageType &slot : m_slots)
  {
    if (slot.valid)
    {
      pages.push_back(slot.pageNumber);
    }
  }
  return pages;
}

template <typename Codec>
const typename PageBuffer<Codec>::PageType *PageBuffer<Codec>::find(PageId pageNum) const noexcept
{
  for (const PageType &slot : m_slots)
  {
    if (slot.valid && slot.pageNumber == pageNum)
    {
      return &slot;
    }
  }
  return nullptr;
}

template class PageBuffer<IntCodec>;
template class PageBuffer<FixedTextCodec>;
