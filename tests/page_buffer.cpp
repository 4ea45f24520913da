#include <gtest/gtest.h>

#include "temp_file_fixture.hpp"
#include "vmarray/cell_codec.hpp"
#include "vmarray/page_buffer.hpp"

class PageBufferFile : public TempFileFixture
{
protected:
  PageBuffer<IntCodec> makeBuffer(u32 pages)
  {
    const IntCodec codec{};
    return PageBuffer<IntCodec>(PageStore::create(path, Layout::forArray(pages * CELLS_PER_PAGE, codec.regionSize())), codec);
  }
};

TEST_F(PageBufferFile, StartsEmpty)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  EXPECT_EQ(BUFFER_PAGES, buffer.capacity());
  EXPECT_TRUE(buffer.residentPages().empty());
  EXPECT_EQ(nullptr, buffer.find(0));
}

/* free slots are used in order before anything is evicted */
TEST_F(PageBufferFile, FillsFreeSlots)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  buffer.locateOrAdmit(2);
  buffer.locateOrAdmit(0);
  buffer.locateOrAdmit(1);
  EXPECT_EQ((std::vector<PageId>{2, 0, 1}), buffer.residentPages());
}

/* a resident page is returned as is without reading the store again */
TEST_F(PageBufferFile, HitReturnsSameSlot)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  auto &first = buffer.locateOrAdmit(1);
  first.cells[3] = 17;
  auto &second = buffer.locateOrAdmit(1);
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(17, second.cells[3]);
  EXPECT_EQ(1u, buffer.residentPages().size());
}

TEST_F(PageBufferFile, AdmittedPageState)
{
  PageBuffer<IntCodec> buffer = makeBuffer(2);
  auto &page = buffer.locateOrAdmit(1);
  EXPECT_TRUE(page.valid);
  EXPECT_FALSE(page.dirty);
  EXPECT_EQ(1u, page.pageNumber);
  EXPECT_TRUE(page.presence.none());
}

TEST_F(PageBufferFile, EvictsOldest)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  buffer.locateOrAdmit(0);
  buffer.locateOrAdmit(1);
  buffer.locateOrAdmit(2);
  buffer.locateOrAdmit(3);

  EXPECT_EQ(nullptr, buffer.find(0));
  // page 3 reused the slot page 0 was in
  EXPECT_EQ((std::vector<PageId>{3, 1, 2}), buffer.residentPages());
}

/* touching a page again makes it the most recently used */
TEST_F(PageBufferFile, HitRefreshesRecency)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  buffer.locateOrAdmit(0);
  buffer.locateOrAdmit(1);
  buffer.locateOrAdmit(2);
  buffer.locateOrAdmit(0);
  buffer.locateOrAdmit(3);

  EXPECT_NE(nullptr, buffer.find(0));
  EXPECT_EQ(nullptr, buffer.find(1));
  EXPECT_NE(nullptr, buffer.find(2));
  EXPECT_NE(nullptr, buffer.find(3));
}

TEST_F(PageBufferFile, DirtyVictimWrittenBack)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  {
    auto &page = buffer.locateOrAdmit(0);
    page.cells[10] = 1234;
    page.presence[10] = true;
    page.dirty = true;
  }
  buffer.locateOrAdmit(1);
  buffer.locateOrAdmit(2);
  buffer.locateOrAdmit(3);
  ASSERT_EQ(nullptr, buffer.find(0));

  // loaded back from the store
  auto &page = buffer.locateOrAdmit(0);
  EXPECT_TRUE(page.presence[10]);
  EXPECT_EQ(1234, page.cells[10]);
  EXPECT_FALSE(page.dirty);
}

/* a clean victim is dropped without touching the store */
TEST_F(PageBufferFile, CleanVictimDiscarded)
{
  PageBuffer<IntCodec> buffer = makeBuffer(4);
  {
    auto &page = buffer.locateOrAdmit(0);
    // changed but never marked dirty
    page.cells[0] = 5;
    page.presence[0] = true;
  }
  buffer.locateOrAdmit(1);
  buffer.locateOrAdmit(2);
  buffer.locateOrAdmit(3);

  auto &page = buffer.locateOrAdmit(0);
  EXPECT_FALSE(page.presence[0]);
  EXPECT_EQ(0, page.cells[0]);
}

TEST_F(PageBufferFile, FlushClearsDirty)
{
  PageBuffer<IntCodec> buffer = makeBuffer(2);
  auto &page = buffer.locateOrAdmit(1);
  page.cells[0] = 8;
  page.presence[0] = true;
  page.dirty = true;

  buffer.flush();
  EXPECT_FALSE(page.dirty);
  EXPECT_EQ((std::vector<PageId>{1}), buffer.residentPages());

  Presence presence;
  std::array<i32, CELLS_PER_PAGE> cells = {};
  buffer.store().readPage(1, buffer.codec(), presence, cells);
  EXPECT_TRUE(presence[0]);
  EXPECT_EQ(8, cells[0]);
}

/* when loading fails the buffer keeps what it had */
TEST_F(PageBufferFile, FailedLoadKeepsSlots)
{
  PageBuffer<IntCodec> buffer = makeBuffer(3);
  buffer.locateOrAdmit(0);
  buffer.locateOrAdmit(1);
  {
    auto &page = buffer.locateOrAdmit(2);
    page.cells[1] = 42;
    page.presence[1] = true;
    page.dirty = true;
  }

  EXPECT_THROW(buffer.locateOrAdmit(7), IoError);
  EXPECT_EQ((std::vector<PageId>{0, 1, 2}), buffer.residentPages());
  const auto *page = buffer.find(2);
  ASSERT_NE(nullptr, page);
  EXPECT_EQ(42, page->cells[1]);
}
