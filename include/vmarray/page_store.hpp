#pragma once

#include "layout.hpp"
#include "page.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <stdexcept>
#include <string>

// raised when the swap file cannot be created, opened, read or written in full
class IoError : public std::runtime_error
{
public:
  explicit IoError(const std::string &message);
  IoError(PageId id, const std::string &message);

  std::optional<PageId> page() const noexcept { return m_page; }

private:
  std::optional<PageId> m_page;
};

using Bitmap = std::array<std::byte, BITMAP_SIZE>;

// bit i of the presence set lives in byte i / 8 as 1 << (i % 8)
Bitmap encodePresence(const Presence &presence) noexcept;
Presence decodePresence(const Bitmap &bitmap) noexcept;

// the swap file backing one array. pages are read and written whole at
// Layout::pageOffset, nothing else in the file changes after creation
class PageStore
{
public:
  // create a zero filled swap file, replacing anything at path
  static PageStore create(const std::filesystem::path &path, const Layout &layout);
  // open an existing swap file, its signature and size must match layout
  static PageStore open(const std::filesystem::path &path, const Layout &layout);

  PageStore(PageStore &&) = default;
  PageStore &operator=(PageStore &&) = default;
  PageStore(const PageStore &) = delete;
  PageStore &operator=(const PageStore &) = delete;

  const Layout &layout() const noexcept { return m_layout; }
  const std::filesystem::path &path() const noexcept { return m_path; }
  bool isOpen() const noexcept { return m_stream.is_open(); }

  // decode page pageNum into presence and cells.
  // the outputs are only partially filled if this throws
  template <typename Codec>
  void readPage(PageId pageNum, const Codec &codec, Presence &presence,
                std::array<typename Codec::Element, CELLS_PER_PAGE> &cells);

  // encode and write page pageNum, then flush it to the file
  template <typename Codec>
  void writePage(PageId pageNum, const Codec &codec, const Presence &presence,
                 const std::array<typename Codec::Element, CELLS_PER_PAGE> &cells);

  void close();

private:
  PageStore(std::fstream stream, std::filesystem::path path, Layout layout);

  void seekTo(PageId pageNum);
  void readRegion(PageId pageNum, std::span<std::byte> region, const char *what);
  void writeRegion(PageId pageNum, std::span<const std::byte> region, const char *what);

  std::fstream m_stream;
  std::filesystem::path m_path;
  Layout m_layout;
};
