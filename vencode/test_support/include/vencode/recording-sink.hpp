#pragma once

#include <cstddef>
#include <span>
#include <string>

#include "vencode/encode-writer.hpp"

namespace vencode::test {

// ByteSink keeping everything written to it, and the number of calls it received.
class RecordingSink : public ByteSink {
 public:
  void write(std::span<const std::byte> data) override {
    _data.append(reinterpret_cast<const char *>(data.data()), data.size());
    ++_nbWrites;
  }

  void flush() override { ++_nbFlushes; }

  [[nodiscard]] const std::string &data() const noexcept { return _data; }

  [[nodiscard]] std::size_t nbWrites() const noexcept { return _nbWrites; }

  [[nodiscard]] std::size_t nbFlushes() const noexcept { return _nbFlushes; }

 private:
  std::string _data;
  std::size_t _nbWrites{0};
  std::size_t _nbFlushes{0};
};

}  // namespace vencode::test
