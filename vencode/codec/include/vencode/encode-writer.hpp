#pragma once

#include <cstddef>
#include <ostream>
#include <span>
#include <string_view>

#include "vencode/raw-bytes.hpp"

namespace vencode {

// Destination of encoded bytes when not encoding into a RawBytes.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  virtual void write(std::span<const std::byte> data) = 0;

  virtual void flush() {}
};

// ByteSink over a std::ostream. Throws EncodeError(WriteFailure) when the stream fails.
class OStreamSink : public ByteSink {
 public:
  explicit OStreamSink(std::ostream &os) noexcept : _os(&os) {}

  void write(std::span<const std::byte> data) override;

  void flush() override;

 private:
  std::ostream *_os;
};

// Output of an encoder: appends to a RawBytes, or writes to a ByteSink, optionally through a buffer.
class EncodeWriter {
 public:
  EncodeWriter() noexcept = default;

  // Clears 'out' and appends all further writes to it.
  void reset(RawBytes &out);

  // Writes to 'sink', buffering up to 'bufferSize' bytes (0 for no buffering).
  void reset(ByteSink &sink, std::size_t bufferSize);

  [[nodiscard]] bool initialized() const noexcept { return _out != nullptr || _sink != nullptr; }

  void writeb(std::span<const std::byte> data);

  void writestr(std::string_view str);

  void writen1(std::byte byte);

  // Writes 'str' between double quotes.
  void writeqstr(std::string_view str);

  // Flushes buffered bytes to the sink.
  void end();

 private:
  void flushBuffer();

  RawBytes *_out{nullptr};
  ByteSink *_sink{nullptr};
  RawBytes _buf;
  std::size_t _bufferSize{0};
};

}  // namespace vencode
