#pragma once

#include <cstdint>
#include <memory>

#include "vencode/any.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

// Application-defined encoding of a type, registered on a Handle under a numeric tag.
// Binary drivers write the payload returned by writeExt, text drivers encode the value returned by convertExt.
class Extension {
 public:
  virtual ~Extension() = default;

  [[nodiscard]] virtual RawBytes writeExt(ValueRef value) const = 0;

  [[nodiscard]] virtual Any convertExt(ValueRef value) const = 0;
};

struct ExtensionEntry {
  std::uint64_t tag{0};
  std::shared_ptr<const Extension> ext;
};

}  // namespace vencode
