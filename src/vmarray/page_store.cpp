#include "vmarray/page_store.hpp"
#include "vmarray/cell_codec.hpp"

#include <sstream>
#include <vector>

IoError::IoError(const std::string &message)
: std::runtime_error(message)
{
}

static std::string pageMessage(PageId id, const std::string &message)
{
  std::ostringstream ss;
  ss << "Page " << id << ": " << message;
  return ss.str();
}

IoError::IoError(PageId id, const std::string &message)
: std::runtime_error(pageMessage(id, message)), m_page(id)
{
}

Bitmap encodePresence(const Presence &presence) noexcept
{
  Bitmap bitmap = {};
  for (u32 i = 0; i < CELLS_PER_PAGE; i++)
  {
    if (presence[i])
    {
      bitmap[i / 8] |= static_cast<std::byte>(1 << (i % 8));
    }
  }
  return bitmap;
}

Presence decodePresence(const Bitmap &bitmap) noexcept
{
  Presence presence;
  for (u32 i = 0; i < CELLS_PER_PAGE; i++)
  {
    presence[i] = ((bitmap[i / 8] >> (i % 8)) & std::byte{1}) == std::byte{1};
  }
  return presence;
}

PageStore::PageStore(std::fstream stream, std::filesystem::path path, Layout layout)
: m_stream(std::move(stream)), m_path(std::move(path)), m_layout(layout)
{
}

PageStore PageStore::create(const std::filesystem::path &path, const Layout &layout)
{
  std::fstream stream(path, std::ios::in | std::ios::out | std::ios::binary | std::ios::trunc);
  if (!stream.is_open())
  {
    throw IoError("Failed to create swap file " + path.string());
  }

  if (!stream.write(SIGNATURE.data(), SIGNATURE.size()))
  {
    throw IoError("Failed to write signature to " + path.string());
  }

  // bitmap and data regions are adjacent so one zeroed slot covers both
  const std::vector<char> zeroSlot(layout.slotSize(), 0);
  for (PageId p = 0; p < layout.pageCount; p++)
  {
    if (!stream.write(zeroSlot.data(), static_cast<std::streamsize>(zeroSlot.size())))
    {
      throw IoError(p, "Failed to zero fill " + path.string());
    }
  }

  if (!stream.flush())
  {
    throw IoError("Failed to flush new swap file " + path.string());
  }

  return PageStore(std::move(stream), path, layout);
}

PageStore PageStore::open(const std::filesystem::path &path, const Layout &layout)
{
  std::fstream stream(path, std::ios::in | std::ios::out | std::ios::binary);
  if (!stream.is_open())
  {
    throw IoError("Failed to open swap file " + path.string());
  }

  std::array<char, SIGNATURE.size()> signature = {};
  if (!stream.read(signature.data(), signature.size()) || signature != SIGNATURE)
  {
    throw IoError(path.string() + " is not a swap file");
  }

  stream.seekg(0, std::ios::end);
  const std::streamoff actual = stream.tellg();
  if (!stream)
  {
    throw IoError("Failed to get size of swap file " + path.string());
  }

  if (static_cast<u64>(actual) != layout.fileSize())
  {
    std::ostringstream ss;
    ss << "Swap file " << path.string() << " is " << actual << " bytes, expected "
       << layout.fileSize() << " for " << layout.pageCount << " pages of "
       << layout.dataRegionSize << " data bytes";
    throw IoError(ss.str());
  }

  return PageStore(std::move(stream), path, layout);
}

void PageStore::seekTo(PageId pageNum)
{
  if (!isOpen())
  {
    throw IoError(pageNum, "Swap file is closed");
  }
  if (pageNum >= m_layout.pageCount)
  {
    throw IoError(pageNum, "Page is beyond the end of the swap file");
  }
  if (!m_stream.seekg(static_cast<std::streamoff>(m_layout.pageOffset(pageNum))))
  {
    m_stream.clear();
    throw IoError(pageNum, "Failed in seeking");
  }
}

void PageStore::readRegion(PageId pageNum, std::span<std::byte> region, const char *what)
{
  m_stream.read(reinterpret_cast<char *>(region.data()), static_cast<std::streamsize>(region.size()));
  if (static_cast<std::size_t>(m_stream.gcount()) != region.size())
  {
    std::ostringstream ss;
    ss << "Short " << what << " read, got " << m_stream.gcount() << " of " << region.size() << " bytes";
    m_stream.clear();
    throw IoError(pageNum, ss.str());
  }
}

void PageStore::writeRegion(PageId pageNum, std::span<const std::byte> region, const char *what)
{
  if (!m_stream.write(reinterpret_cast<const char *>(region.data()), static_cast<std::streamsize>(region.size())))
  {
    m_stream.clear();
    throw IoError(pageNum, std::string("Failed to write ") + what);
  }
}

template <typename Codec>
void PageStore::readPage(PageId pageNum, const Codec &codec, Presence &presence,
                         std::array<typename Codec::Element, CELLS_PER_PAGE> &cells)
{
  seekTo(pageNum);

  Bitmap bitmap;
  readRegion(pageNum, bitmap, "bitmap");

  std::vector<std::byte> data(m_layout.dataRegionSize);
  readRegion(pageNum, data, "data");

  presence = decodePresence(bitmap);
  const std::span<const std::byte> view(data);
  for (u32 i = 0; i < CELLS_PER_PAGE; i++)
  {
    cells[i] = codec.decode(view.subspan(static_cast<std::size_t>(i) * codec.width(), codec.width()));
  }
}

template <typename Codec>
void PageStore::writePage(PageId pageNum, const Codec &codec, const Presence &presence,
                          const std::array<typename Codec::Element, CELLS_PER_PAGE> &cells)
{
  const Bitmap bitmap = encodePresence(presence);

  // tail bytes past the last cell stay zero
  std::vector<std::byte> data(m_layout.dataRegionSize, std::byte{0});
  const std::span<std::byte> view(data);
  for (u32 i = 0; i < CELLS_PER_PAGE; i++)
  {
    codec.encode(cells[i], view.subspan(static_cast<std::size_t>(i) * codec.width(), codec.width()));
  }

  seekTo(pageNum);
  writeRegion(pageNum, bitmap, "bitmap");
  writeRegion(pageNum, data, "data");

  if (!m_stream.flush())
  {
    m_stream.clear();
    throw IoError(pageNum, "Failed to flush");
  }
}

template void PageStore::readPage(PageId, const IntCodec &, Presence &,
                                  std::array<IntCodec::Element, CELLS_PER_PAGE> &);
template void PageStore::readPage(PageId, const FixedTextCodec &, Presence &,
                                  std::array<FixedTextCodec::Element, CELLS_PER_PAGE> &);
template void PageStore::writePage(PageId, const IntCodec &, const Presence &,
                                   const std::array<IntCodec::Element, CELLS_PER_PAGE> &);
template void PageStore::writePage(PageId, const FixedTextCodec &, const Presence &,
                                   const std::array<FixedTextCodec::Element, CELLS_PER_PAGE> &);

void PageStore::close()
{
  if (!isOpen())
  {
    return;
  }
  m_stream.close();
  if (!m_stream)
  {
    m_stream.clear();
    throw IoError("Failed to close swap file " + m_path.string());
  }
}
