#pragma once

#include "page.hpp"
#include "page_store.hpp"

#include <array>
#include <vector>

// keeps up to BUFFER_PAGES pages of one array in memory.
// when every slot is in use the least recently touched page is written
// back (if dirty) and its slot reused
template <typename Codec>
class PageBuffer
{
public:
  using Element = typename Codec::Element;
  using PageType = Page<Element>;

  PageBuffer(PageStore store, Codec codec);

  PageBuffer(PageBuffer &&) = default;
  PageBuffer &operator=(PageBuffer &&) = default;
  PageBuffer(const PageBuffer &) = delete;
  PageBuffer &operator=(const PageBuffer &) = delete;

  /* return the slot holding pageNum, loading it from the store (and evicting
   * another page) if it is not resident. the reference is only valid until
   * the next call */
  PageType &locateOrAdmit(PageId pageNum);

  void touch(PageType &page) noexcept { page.lastTouch = ++m_clock; }

  // write every dirty page back to the store, pages stay resident
  void flush();

  std::size_t capacity() const noexcept { return m_slots.size(); }
  // page numbers of the valid slots in slot order
  std::vector<PageId> residentPages() const;
  const PageType *find(PageId pageNum) const noexcept;

  PageStore &store() noexcept { return m_store; }
  const PageStore &store() const noexcept { return m_store; }
  const Codec &codec() const noexcept { return m_codec; }

private:
  PageType &admissionTarget();
  void writeBack(PageType &page);

  PageStore m_store;
  Codec m_codec;
  std::array<PageType, BUFFER_PAGES> m_slots;
  // logical clock, bumped on every access
  u64 m_clock = 0;
};
