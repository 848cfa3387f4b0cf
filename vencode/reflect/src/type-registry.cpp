#include "vencode/type-registry.hpp"

#include <cxxabi.h>

#include <cstddef>
#include <cstdlib>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>

#include "vencode/log.hpp"
#include "vencode/type-info.hpp"

namespace vencode {

TypeRegistry &TypeRegistry::instance() {
  static TypeRegistry gRegistry;
  return gRegistry;
}

const TypeInfo &TypeRegistry::publish(std::type_index typeId, Builder builder) {
  if (const TypeInfo *existing = find(typeId); existing != nullptr) {
    return *existing;
  }

  // Building may publish other types (embedded structs), so it happens without holding the lock.
  std::unique_ptr<TypeInfo> built = builder();

  std::unique_lock lock(_mutex);
  auto [it, inserted] = _types.try_emplace(typeId, std::move(built));
  if (inserted) {
    log::debug("Registered type {} of kind {}", it->second->name, KindName(it->second->kind));
  }
  return *it->second;
}

const TypeInfo *TypeRegistry::find(std::type_index typeId) const {
  std::shared_lock lock(_mutex);
  auto it = _types.find(typeId);
  return it == _types.end() ? nullptr : it->second.get();
}

std::size_t TypeRegistry::size() const {
  std::shared_lock lock(_mutex);
  return _types.size();
}

std::string DemangledTypeName(const std::type_info &typeInfo) {
  int status = 0;
  std::unique_ptr<char, void (*)(void *)> demangled(abi::__cxa_demangle(typeInfo.name(), nullptr, nullptr, &status),
                                                    std::free);
  if (status != 0 || demangled == nullptr) {
    return typeInfo.name();
  }
  return demangled.get();
}

namespace internal {

std::type_index TypeIdOf(const TypeInfo &type) noexcept { return type.id; }

}  // namespace internal

}  // namespace vencode
