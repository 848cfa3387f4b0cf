#include "vencode/encode-error.hpp"

#include <string_view>

namespace vencode {

std::string_view EncodeErrcName(EncodeErrc errc) noexcept {
  switch (errc) {
    case EncodeErrc::UninitializedEncoder:
      return "UninitializedEncoder";
    case EncodeErrc::UnsupportedValue:
      return "UnsupportedValue";
    case EncodeErrc::CircularReference:
      return "CircularReference";
    case EncodeErrc::MalformedFlattenedSequence:
      return "MalformedFlattenedSequence";
    case EncodeErrc::RawDisallowed:
      return "RawDisallowed";
    case EncodeErrc::SendOnlyChannel:
      return "SendOnlyChannel";
    case EncodeErrc::CustomMarshalFailure:
      return "CustomMarshalFailure";
    case EncodeErrc::InvalidKeyEncoding:
      return "InvalidKeyEncoding";
    case EncodeErrc::WriteFailure:
      return "WriteFailure";
  }
  return "Unknown";
}

}  // namespace vencode
