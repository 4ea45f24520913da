#include "vmarray/virtual_array.hpp"

#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>

std::ostream &operator<<(std::ostream &os, const Value &value)
{
  if (const i32 *n = std::get_if<i32>(&value); n != nullptr)
  {
    return os << *n;
  }
  return os << '"' << std::get<std::string>(value) << '"';
}

static std::string outOfRangeMessage(u64 index, u64 size)
{
  std::ostringstream ss;
  ss << "Index " << index << " is out of range for an array of " << size << " elements";
  return ss.str();
}

IndexOutOfRange::IndexOutOfRange(u64 index, u64 size)
: std::out_of_range(outOfRangeMessage(index, size)), m_index(index), m_size(size)
{
}

template <typename Codec>
VirtualArray<Codec>::VirtualArray(const std::filesystem::path &path, u64 arraySize, Codec codec)
: m_path(path),
  m_size(arraySize),
  m_codec(std::move(codec)),
  m_layout(Layout::forArray(arraySize, m_codec.regionSize())),
  m_buffer()
{
  std::error_code ec;
  const bool exists = std::filesystem::exists(m_path, ec);
  if (ec)
  {
    throw IoError("Failed to check swap file " + m_path.string() + ": " + ec.message());
  }

  PageStore store = exists
      ? PageStore::open(m_path, m_layout)
      : PageStore::create(m_path, m_layout);
  m_buffer.emplace(std::move(store), m_codec);
}

template <typename Codec>
VirtualArray<Codec>::~VirtualArray()
{
  try
  {
    close();
  }
  catch (const std::exception &e)
  {
    std::cerr << "Failed to close array " << m_path << ": " << e.what() << std::endl;
  }
}

template <typename Codec>
PageBuffer<Codec> &VirtualArray<Codec>::openBuffer()
{
  if (!m_buffer)
  {
    throw std::logic_error("Array " + m_path.string() + " is closed");
  }
  return *m_buffer;
}

template <typename Codec>
const PageBuffer<Codec> &VirtualArray<Codec>::buffer() const
{
  if (!m_buffer)
  {
    throw std::logic_error("Array " + m_path.string() + " is closed");
  }
  return *m_buffer;
}

template <typename Codec>
std::pair<typename PageBuffer<Codec>::PageType &, u32> VirtualArray<Codec>::pageForIndex(u64 index)
{
  PageBuffer<Codec> &buffer = openBuffer();
  if (index >= m_size)
  {
    throw IndexOutOfRange(index, m_size);
  }

  const CellAddress addr = CellAddress::of(index);
  return {buffer.locateOrAdmit(addr.pageNumber), addr.offset};
}

template <typename Codec>
typename VirtualArray<Codec>::Element VirtualArray<Codec>::read(u64 index)
{
  auto [page, offset] = pageForIndex(index);
  if (!page.presence[offset])
  {
    return m_codec.defaultValue();
  }
  return page.cells[offset];
}

template <typename Codec>
void VirtualArray<Codec>::write(u64 index, const Element &value)
{
  auto [page, offset] = pageForIndex(index);
  page.cells[offset] = m_codec.fit(value);
  page.presence[offset] = true;
  page.dirty = true;
  m_buffer->touch(page);
}

template <typename Codec>
void VirtualArray<Codec>::writeValue(u64 index, const Value &value)
{
  const Element *element = std::get_if<Element>(&value);
  if (element == nullptr)
  {
    std::ostringstream ss;
    ss << "An array of " << spec() << " can not hold " << value;
    throw std::invalid_argument(ss.str());
  }
  write(index, *element);
}

template <typename Codec>
void VirtualArray<Codec>::flush()
{
  openBuffer().flush();
}

template <typename Codec>
void VirtualArray<Codec>::close()
{
  if (!m_buffer)
  {
    return;
  }
  m_buffer->flush();
  // the array counts as closed even if closing the stream fails
  PageStore store = std::move(m_buffer->store());
  m_buffer.reset();
  store.close();
}

template class VirtualArray<IntCodec>;
template class VirtualArray<FixedTextCodec>;

std::unique_ptr<IVirtualArray> openArray(const std::filesystem::path &path, const ElementSpec &spec, u64 arraySize)
{
  switch (spec.kind)
  {
  case ElementKind::Integer:
    return std::make_unique<IntArray>(path, arraySize);
  case ElementKind::FixedText:
    return std::make_unique<FixedTextArray>(path, arraySize, FixedTextCodec(spec.fixedLen));
  case ElementKind::VarText:
    // would need a second file of string offsets next to the swap file
    throw NotImplementedError("varchar arrays are not implemented");
  }
  throw std::invalid_argument("Unknown element kind");
}
