#pragma once

#include "cell_codec.hpp"
#include "page_buffer.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>

// an element of any supported kind, as passed through IVirtualArray
using Value = std::variant<i32, std::string>;

std::ostream &operator<<(std::ostream &os, const Value &value);

class IndexOutOfRange : public std::out_of_range
{
public:
  IndexOutOfRange(u64 index, u64 size);

  u64 index() const noexcept { return m_index; }
  u64 size() const noexcept { return m_size; }

private:
  u64 m_index;
  u64 m_size;
};

class NotImplementedError : public std::logic_error
{
public:
  using std::logic_error::logic_error;
};

// the kind independent face of an array, picked once by openArray
class IVirtualArray
{
public:
  virtual ~IVirtualArray() = default;

  virtual Value readValue(u64 index) = 0;
  // throws std::invalid_argument if value is not of the array's kind
  virtual void writeValue(u64 index, const Value &value) = 0;
  virtual void flush() = 0;
  // flush and release the swap file, the array can not be used afterwards
  virtual void close() = 0;

  virtual bool isOpen() const noexcept = 0;
  virtual u64 size() const noexcept = 0;
  virtual ElementSpec spec() const noexcept = 0;
  virtual const std::filesystem::path &path() const noexcept = 0;
};

template <typename Codec>
class VirtualArray : public IVirtualArray
{
public:
  using Element = typename Codec::Element;

  // opens the swap file at path, creating it zero filled if it doesn't exist
  VirtualArray(const std::filesystem::path &path, u64 arraySize, Codec codec = Codec());
  ~VirtualArray() override;

  VirtualArray(const VirtualArray &) = delete;
  VirtualArray &operator=(const VirtualArray &) = delete;

  Element read(u64 index);
  void write(u64 index, const Element &value);

  Value readValue(u64 index) override { return Value(read(index)); }
  void writeValue(u64 index, const Value &value) override;
  void flush() override;
  void close() override;

  bool isOpen() const noexcept override { return m_buffer.has_value(); }
  u64 size() const noexcept override { return m_size; }
  ElementSpec spec() const noexcept override { return m_codec.spec(); }
  const std::filesystem::path &path() const noexcept override { return m_path; }

  u32 pageCount() const noexcept { return m_layout.pageCount; }
  const PageBuffer<Codec> &buffer() const;

private:
  std::pair<typename PageBuffer<Codec>::PageType &, u32> pageForIndex(u64 index);
  PageBuffer<Codec> &openBuffer();

  std::filesystem::path m_path;
  u64 m_size;
  Codec m_codec;
  Layout m_layout;
  std::optional<PageBuffer<Codec>> m_buffer;
};

using IntArray = VirtualArray<IntCodec>;
using FixedTextArray = VirtualArray<FixedTextCodec>;

// create or open the array at path for the given element kind
std::unique_ptr<IVirtualArray> openArray(const std::filesystem::path &path, const ElementSpec &spec, u64 arraySize);
