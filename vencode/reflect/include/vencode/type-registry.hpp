#pragma once

#include <cstddef>
#include <memory>
#include <shared_mutex>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

#include "vencode/type-info.hpp"

namespace vencode {

// Process wide table of type descriptors. Lookups take a shared lock, publications an exclusive one.
// Descriptors are built outside of the lock, and the first published descriptor of a type wins.
class TypeRegistry {
 public:
  using Builder = std::unique_ptr<TypeInfo> (*)();

  static TypeRegistry &instance();

  TypeRegistry(const TypeRegistry &) = delete;
  TypeRegistry &operator=(const TypeRegistry &) = delete;

  // Returns the descriptor of type 'typeId', building it with 'builder' if it is not known yet.
  const TypeInfo &publish(std::type_index typeId, Builder builder);

  // Returns the descriptor of type 'typeId' if it has been published, nullptr otherwise.
  [[nodiscard]] const TypeInfo *find(std::type_index typeId) const;

  [[nodiscard]] std::size_t size() const;

 private:
  TypeRegistry() = default;

  mutable std::shared_mutex _mutex;
  std::unordered_map<std::type_index, std::unique_ptr<TypeInfo>> _types;
};

// Readable name of a type.
std::string DemangledTypeName(const std::type_info &typeInfo);

}  // namespace vencode
