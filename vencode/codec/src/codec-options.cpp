#include "vencode/codec-options.hpp"

#include <chrono>
#include <cstddef>

#include "vencode/invalid_argument_exception.hpp"

namespace vencode {

void CodecOptions::validate() const {
  if (writerBufferSize > kMaxWriterBufferSize) {
    throw invalid_argument("writerBufferSize {} is larger than the maximum {}", writerBufferSize, kMaxWriterBufferSize);
  }
}

CodecOptions &CodecOptions::withWriterBufferSize(std::size_t size) {
  writerBufferSize = size;
  return *this;
}

CodecOptions &CodecOptions::withChanRecvTimeout(std::chrono::milliseconds timeout) {
  chanRecvTimeout = timeout;
  return *this;
}

CodecOptions &CodecOptions::withStructToArray(bool enable) {
  structToArray = enable;
  return *this;
}

CodecOptions &CodecOptions::withCanonical(bool enable) {
  canonical = enable;
  return *this;
}

CodecOptions &CodecOptions::withCheckCircularRef(bool enable) {
  checkCircularRef = enable;
  return *this;
}

CodecOptions &CodecOptions::withRecursiveEmptyCheck(bool enable) {
  recursiveEmptyCheck = enable;
  return *this;
}

CodecOptions &CodecOptions::withRaw(bool enable) {
  raw = enable;
  return *this;
}

CodecOptions &CodecOptions::withStringToRaw(bool enable) {
  stringToRaw = enable;
  return *this;
}

CodecOptions &CodecOptions::withOptimumSize(bool enable) {
  optimumSize = enable;
  return *this;
}

}  // namespace vencode
