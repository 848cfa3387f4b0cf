#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <string_view>
#include <unordered_map>

#include "vencode/codec-fn.hpp"
#include "vencode/codec-options.hpp"
#include "vencode/extension.hpp"
#include "vencode/reflect.hpp"
#include "vencode/type-info.hpp"

namespace vencode {

class Driver;
class Encoder;

// Configuration of one wire format: options, registered extensions, cached encoding strategies and the factory
// of its drivers. A Handle is shared by the encoders of the format and must outlive them.
// Extensions must be registered before the first encode.
class Handle {
 public:
  // Throws invalid_argument if 'options' are not valid.
  explicit Handle(CodecOptions options);

  Handle(const Handle &) = delete;
  Handle &operator=(const Handle &) = delete;

  virtual ~Handle();

  [[nodiscard]] virtual std::string_view name() const noexcept = 0;

  [[nodiscard]] virtual bool isBinary() const noexcept = 0;

  [[nodiscard]] virtual bool isJson() const noexcept { return false; }

  [[nodiscard]] virtual std::unique_ptr<Driver> newDriver(Encoder &encoder) const = 0;

  [[nodiscard]] const CodecOptions &options() const noexcept { return _options; }

  // Encodes values of type T with 'ext' under 'tag'.
  template <class T>
  void setExt(std::uint64_t tag, std::shared_ptr<const Extension> ext) {
    setExt(TypeInfoFor<T>(), tag, std::move(ext));
  }

  void setExt(const TypeInfo &type, std::uint64_t tag, std::shared_ptr<const Extension> ext);

  [[nodiscard]] const ExtensionEntry *findExt(const TypeInfo &type) const noexcept;

  [[nodiscard]] bool hasExtensions() const noexcept { return !_exts.empty(); }

  // Strategy of 'type', registered extensions included.
  [[nodiscard]] const CodecFn &fn(const TypeInfo &type) const;

  // Strategy of 'type', ignoring registered extensions.
  [[nodiscard]] const CodecFn &fnNoExt(const TypeInfo &type) const;

 private:
  CodecOptions _options;
  std::unordered_map<const TypeInfo *, ExtensionEntry> _exts;
  mutable CodecFnCache _fns{true};
  mutable CodecFnCache _fnsNoExt{false};
  mutable std::atomic<bool> _used{false};
};

}  // namespace vencode
