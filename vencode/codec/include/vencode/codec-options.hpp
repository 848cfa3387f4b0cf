#pragma once

#include <chrono>
#include <cstddef>

namespace vencode {

// Encoding configuration of a Handle, fixed before the first encode.
struct CodecOptions {
  static constexpr std::size_t kMaxWriterBufferSize = 1UL << 30;

  // Throws invalid_argument if the options are not consistent.
  void validate() const;

  CodecOptions &withWriterBufferSize(std::size_t size);

  CodecOptions &withChanRecvTimeout(std::chrono::milliseconds timeout);

  CodecOptions &withStructToArray(bool enable = true);

  CodecOptions &withCanonical(bool enable = true);

  CodecOptions &withCheckCircularRef(bool enable = true);

  CodecOptions &withRecursiveEmptyCheck(bool enable = true);

  CodecOptions &withRaw(bool enable = true);

  CodecOptions &withStringToRaw(bool enable = true);

  CodecOptions &withOptimumSize(bool enable = true);

  // Size of the internal buffer in front of a ByteSink output. 0 writes directly to the sink.
  // Unused when encoding into a RawBytes.
  std::size_t writerBufferSize{0};

  // How channels are drained before being encoded:
  //  - 0 : only the values immediately available, never blocks
  //  - <0: all values until the channel is closed
  //  - >0: values until the channel is closed or the timeout expires
  std::chrono::milliseconds chanRecvTimeout{0};

  // Encode all structs as arrays of their field values, in declaration order.
  bool structToArray{false};

  // Deterministic output: struct fields in key order, map entries sorted by key.
  bool canonical{false};

  // Fail with CircularReference when a struct is reached twice through pointers on the current path.
  bool checkCircularRef{false};

  // Omit-if-empty looks into pointers, interfaces and nested structs instead of comparing with the zero value.
  bool recursiveEmptyCheck{false};

  // Allow Raw values, written verbatim. Encoding a Raw value without this option is an error.
  bool raw{false};

  // Hint for drivers: encode strings as raw byte strings.
  bool stringToRaw{false};

  // Hint for drivers: prefer the smallest representation when the format offers a choice, for instance a
  // float64 that a float32 holds exactly. The encoder itself never reads it.
  bool optimumSize{false};
};

}  // namespace vencode
