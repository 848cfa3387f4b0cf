#include "vencode/encode-writer.hpp"

#include <cstddef>
#include <ios>
#include <span>
#include <string_view>

#include "vencode/config.hpp"
#include "vencode/encode-error.hpp"
#include "vencode/raw-bytes.hpp"

namespace vencode {

void OStreamSink::write(std::span<const std::byte> data) {
  _os->write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
  if (VENCODE_UNLIKELY(!*_os)) {
    throw EncodeError(EncodeErrc::WriteFailure, "failed to write {} bytes to output stream", data.size());
  }
}

void OStreamSink::flush() {
  _os->flush();
  if (VENCODE_UNLIKELY(!*_os)) {
    throw EncodeError(EncodeErrc::WriteFailure, "failed to flush output stream");
  }
}

void EncodeWriter::reset(RawBytes &out) {
  out.clear();
  _out = &out;
  _sink = nullptr;
  _buf.clear();
  _bufferSize = 0;
}

void EncodeWriter::reset(ByteSink &sink, std::size_t bufferSize) {
  _out = nullptr;
  _sink = &sink;
  _buf.clear();
  _bufferSize = bufferSize;
  _buf.reserve(bufferSize);
}

void EncodeWriter::writeb(std::span<const std::byte> data) {
  if (_out != nullptr) {
    _out->append(data);
    return;
  }
  if (_bufferSize == 0) {
    _sink->write(data);
    return;
  }
  if (_buf.size() + data.size() > _bufferSize) {
    flushBuffer();
    if (data.size() >= _bufferSize) {
      _sink->write(data);
      return;
    }
  }
  _buf.append(data);
}

void EncodeWriter::writestr(std::string_view str) {
  writeb(std::span<const std::byte>(reinterpret_cast<const std::byte *>(str.data()), str.size()));
}

void EncodeWriter::writen1(std::byte byte) { writeb(std::span<const std::byte>(&byte, 1)); }

void EncodeWriter::writeqstr(std::string_view str) {
  writen1(std::byte{'"'});
  writestr(str);
  writen1(std::byte{'"'});
}

void EncodeWriter::flushBuffer() {
  if (!_buf.empty()) {
    // size is reset first so that a failing sink does not get the same bytes twice
    RawBytes::view_type pending = _buf.view();
    _buf.clear();
    _sink->write(pending);
  }
}

void EncodeWriter::end() {
  if (_sink == nullptr) {
    return;
  }
  flushBuffer();
  _sink->flush();
}

}  // namespace vencode
