#include "vencode/raw-bytes.hpp"

#include <cassert>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <new>
#include <string_view>
#include <utility>

namespace vencode {

RawBytes::RawBytes(size_type capacity) : _buf(static_cast<pointer>(std::malloc(capacity))), _capacity(capacity) {
  if (capacity != 0 && _buf == nullptr) {
    throw std::bad_alloc();
  }
}

RawBytes::RawBytes(view_type data) : RawBytes(data.size()) {
  if (!data.empty()) {
    std::memcpy(_buf, data.data(), data.size());
    _size = data.size();
  }
}

RawBytes::RawBytes(std::string_view str) : RawBytes(std::as_bytes(std::span<const char>(str.data(), str.size()))) {}

RawBytes::RawBytes(const RawBytes &rhs) : RawBytes(rhs.view()) {}

RawBytes::RawBytes(RawBytes &&rhs) noexcept
    : _buf(std::exchange(rhs._buf, nullptr)),
      _size(std::exchange(rhs._size, 0)),
      _capacity(std::exchange(rhs._capacity, 0)) {}

RawBytes &RawBytes::operator=(const RawBytes &rhs) {
  if (this != &rhs) {
    assign(rhs.view());
  }
  return *this;
}

RawBytes &RawBytes::operator=(RawBytes &&rhs) noexcept {
  if (this != &rhs) {
    std::free(_buf);
    _buf = std::exchange(rhs._buf, nullptr);
    _size = std::exchange(rhs._size, 0);
    _capacity = std::exchange(rhs._capacity, 0);
  }
  return *this;
}

RawBytes::~RawBytes() { std::free(_buf); }

void RawBytes::unchecked_append(const_pointer first, const_pointer last) {
  if (first != last) {
    const auto sz = static_cast<size_type>(last - first);
    std::memcpy(_buf + _size, first, sz);
    _size += sz;
  }
}

void RawBytes::append(const_pointer first, const_pointer last) {
  assert(first <= last);
  ensureAvailableCapacity(static_cast<size_type>(last - first));
  unchecked_append(first, last);
}

void RawBytes::append(std::string_view str) {
  const auto *first = reinterpret_cast<const_pointer>(str.data());
  append(first, first + str.size());
}

void RawBytes::push_back(value_type byte) {
  ensureAvailableCapacity(1U);
  _buf[_size++] = byte;
}

void RawBytes::assign(view_type data) {
  _size = 0;
  ensureAvailableCapacity(data.size());
  unchecked_append(data.data(), data.data() + data.size());
}

void RawBytes::setSize(size_type newSize) {
  assert(newSize <= _capacity);
  _size = newSize;
}

void RawBytes::reserve(size_type newCapacity) {
  if (_capacity < newCapacity) {
    reallocUp(newCapacity);
  }
}

void RawBytes::ensureAvailableCapacity(size_type availableCapacity) {
  const size_type required = _size + availableCapacity;
  if (required < _size) {
    throw std::bad_alloc();
  }
  if (_capacity < required) {
    const size_type doubledCapacity = (_capacity * 2U) + 1U;
    reallocUp(required < doubledCapacity ? doubledCapacity : required);
  }
}

void RawBytes::swap(RawBytes &rhs) noexcept {
  using std::swap;
  swap(_buf, rhs._buf);
  swap(_size, rhs._size);
  swap(_capacity, rhs._capacity);
}

bool RawBytes::operator==(const RawBytes &rhs) const noexcept {
  if (size() != rhs.size()) {
    return false;
  }
  // memcmp with nullptr is undefined behavior even for a zero size
  return empty() || std::memcmp(data(), rhs.data(), size()) == 0;
}

void RawBytes::reallocUp(size_type newCapacity) {
  auto *newBuf = static_cast<pointer>(std::realloc(_buf, newCapacity));
  if (newBuf == nullptr) {
    throw std::bad_alloc();
  }
  _buf = newBuf;
  _capacity = newCapacity;
}

}  // namespace vencode
