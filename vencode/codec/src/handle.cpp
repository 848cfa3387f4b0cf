#include "vencode/handle.hpp"

#include <cstdint>
#include <memory>
#include <utility>

#include "vencode/codec-fn.hpp"
#include "vencode/codec-options.hpp"
#include "vencode/extension.hpp"
#include "vencode/invalid_argument_exception.hpp"
#include "vencode/log.hpp"
#include "vencode/type-info.hpp"

namespace vencode {

Handle::Handle(CodecOptions options) : _options(std::move(options)) { _options.validate(); }

Handle::~Handle() = default;

void Handle::setExt(const TypeInfo &type, std::uint64_t tag, std::shared_ptr<const Extension> ext) {
  if (_used.load(std::memory_order_acquire)) {
    throw invalid_argument("cannot register extension for {} after the handle has been used", type.name);
  }
  if (ext == nullptr) {
    _exts.erase(&type);
    return;
  }
  log::debug("Registering extension with tag {} for type {}", tag, type.name);
  _exts.insert_or_assign(&type, ExtensionEntry{tag, std::move(ext)});
}

const ExtensionEntry *Handle::findExt(const TypeInfo &type) const noexcept {
  auto it = _exts.find(&type);
  return it == _exts.end() ? nullptr : &it->second;
}

const CodecFn &Handle::fn(const TypeInfo &type) const {
  _used.store(true, std::memory_order_release);
  return _fns.get(*this, type);
}

const CodecFn &Handle::fnNoExt(const TypeInfo &type) const {
  _used.store(true, std::memory_order_release);
  return _fnsNoExt.get(*this, type);
}

}  // namespace vencode
