#pragma once

#include <cstddef>
#include <span>
#include <string_view>
#include <type_traits>

namespace vencode {

/**
 * A growable byte buffer with exponential growth and no value initialization of the reserved area.
 * It backs encoder outputs, scratch buffers and marshaled payloads.
 */
class RawBytes {
 public:
  using value_type = std::byte;
  using size_type = std::size_t;
  using pointer = value_type *;
  using const_pointer = const value_type *;
  using iterator = value_type *;
  using const_iterator = const value_type *;
  using view_type = std::span<const std::byte>;

  RawBytes() noexcept = default;

  explicit RawBytes(size_type capacity);

  explicit RawBytes(view_type data);

  // Copies the characters of 'str' as bytes.
  explicit RawBytes(std::string_view str);

  RawBytes(const RawBytes &rhs);
  RawBytes(RawBytes &&rhs) noexcept;

  RawBytes &operator=(const RawBytes &rhs);
  RawBytes &operator=(RawBytes &&rhs) noexcept;

  ~RawBytes();

  void unchecked_append(const_pointer first, const_pointer last);

  void append(const_pointer first, const_pointer last);

  void append(view_type data) { append(data.data(), data.data() + data.size()); }

  void append(std::string_view str);

  void push_back(value_type byte);

  void assign(view_type data);

  void clear() noexcept { _size = 0; }

  void setSize(size_type newSize);

  [[nodiscard]] size_type size() const noexcept { return _size; }

  [[nodiscard]] size_type capacity() const noexcept { return _capacity; }

  [[nodiscard]] size_type availableCapacity() const noexcept { return _capacity - _size; }

  void reserve(size_type newCapacity);

  // Growth is exponential.
  void ensureAvailableCapacity(size_type availableCapacity);

  [[nodiscard]] pointer data() noexcept { return _buf; }
  [[nodiscard]] const_pointer data() const noexcept { return _buf; }

  [[nodiscard]] iterator begin() noexcept { return _buf; }
  [[nodiscard]] const_iterator begin() const noexcept { return _buf; }

  [[nodiscard]] iterator end() noexcept { return _buf + _size; }
  [[nodiscard]] const_iterator end() const noexcept { return _buf + _size; }

  [[nodiscard]] bool empty() const noexcept { return _size == 0; }

  [[nodiscard]] view_type view() const noexcept { return {_buf, _size}; }

  // Bytes reinterpreted as characters, convenient for text formats and tests.
  [[nodiscard]] std::string_view asString() const noexcept {
    return {reinterpret_cast<const char *>(_buf), _size};
  }

  operator view_type() const noexcept { return view(); }

  void swap(RawBytes &rhs) noexcept;

  value_type &operator[](size_type pos) { return _buf[pos]; }
  value_type operator[](size_type pos) const { return _buf[pos]; }

  bool operator==(const RawBytes &rhs) const noexcept;

  using trivially_relocatable = std::true_type;

 private:
  void reallocUp(size_type newCapacity);

  pointer _buf = nullptr;
  size_type _size = 0;
  size_type _capacity = 0;
};

inline void swap(RawBytes &lhs, RawBytes &rhs) noexcept { lhs.swap(rhs); }

}  // namespace vencode
