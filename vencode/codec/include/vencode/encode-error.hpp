#pragma once

#include <cassert>
#include <cstdint>
#include <format>
#include <optional>
#include <string_view>
#include <utility>

#include "vencode/exception.hpp"

namespace vencode {

enum class EncodeErrc : std::uint8_t {
  UninitializedEncoder,
  UnsupportedValue,
  CircularReference,
  MalformedFlattenedSequence,
  RawDisallowed,
  SendOnlyChannel,
  CustomMarshalFailure,
  InvalidKeyEncoding,
  WriteFailure
};

[[nodiscard]] std::string_view EncodeErrcName(EncodeErrc errc) noexcept;

// Thrown inside the encoder, caught once by Encoder::encode.
class EncodeError : public exception {
 public:
  template <typename... Args>
  EncodeError(EncodeErrc errc, std::format_string<Args...> fmt, Args &&...args)
      : exception(fmt, std::forward<Args>(args)...), _errc(errc) {}

  [[nodiscard]] EncodeErrc errc() const noexcept { return _errc; }

 private:
  EncodeErrc _errc;
};

// Outcome of Encoder::encode.
class EncodeResult {
 public:
  EncodeResult() noexcept = default;

  explicit EncodeResult(const EncodeError &error) : _error(error) {}

  [[nodiscard]] bool hasError() const noexcept { return _error.has_value(); }

  [[nodiscard]] EncodeErrc error() const noexcept {
    assert(hasError());
    return _error->errc();
  }

  // Empty if there is no error.
  [[nodiscard]] std::string_view message() const noexcept { return _error ? _error->what() : std::string_view(); }

 private:
  std::optional<EncodeError> _error;
};

}  // namespace vencode
