#include <charconv>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <string_view>
#include <system_error>

#include "vencode/driver.hpp"
#include "vencode/empty-value.hpp"
#include "vencode/encode-error.hpp"
#include "vencode/encoder.hpp"
#include "vencode/kind.hpp"
#include "vencode/type-info.hpp"
#include "vencode/value-ref.hpp"

namespace vencode {

namespace {

template <class T>
T ParseKey(std::string_view encName, KeyType keyType) {
  T value{};
  const char *last = encName.data() + encName.size();
  const auto [ptr, ec] = std::from_chars(encName.data(), last, value);
  if (ec != std::errc() || ptr != last || encName.empty()) {
    throw EncodeError(EncodeErrc::InvalidKeyEncoding, "field name '{}' is not a valid {} key", encName,
                      KeyTypeName(keyType));
  }
  return value;
}

// Kinds written as nil in array mode when their omit-if-empty field is empty.
constexpr bool NilWhenOmitted(Kind kind) noexcept {
  switch (kind) {
    case Kind::Struct:
      [[fallthrough]];
    case Kind::Interface:
      [[fallthrough]];
    case Kind::Pointer:
      [[fallthrough]];
    case Kind::Array:
      [[fallthrough]];
    case Kind::Map:
      [[fallthrough]];
    case Kind::Slice:
      return true;
    default:
      return false;
  }
}

}  // namespace

MissingFields Encoder::missingFields(ValueRef rv) const {
  const TypeInfo &type = *rv.type();
  if (!type.caps.missingFielder) {
    return {};
  }
  if (!type.caps.missingFielderNeedsAddr || rv.addressable()) {
    return type.ops.missingFields(rv.ptr());
  }
  if (!type.caps.copyable) {
    throw EncodeError(EncodeErrc::UnsupportedValue, "missingFields of {} needs a mutable value", type.name);
  }
  std::shared_ptr<void> copy = type.ops.copy(rv.ptr());
  return type.ops.missingFields(copy.get());
}

void Encoder::encodeStructFieldKey(KeyType keyType, bool encNameAsciiAlphaNum, std::string_view encName) {
  switch (keyType) {
    case KeyType::String:
      _driver->encodeFieldName(encName, encNameAsciiAlphaNum);
      break;
    case KeyType::Int:
      _driver->encodeInt(ParseKey<std::int64_t>(encName, keyType));
      break;
    case KeyType::Uint:
      _driver->encodeUint(ParseKey<std::uint64_t>(encName, keyType));
      break;
    case KeyType::Float:
      _driver->encodeFloat64(ParseKey<double>(encName, keyType));
      break;
  }
}

void Encoder::kStruct(const CodecFnInfo &info, ValueRef rv) {
  const TypeInfo &type = *info.type;
  const bool recursive = options().recursiveEmptyCheck;

  MissingFields extras = missingFields(rv);
  // extra fields can only be written by name
  const bool toMap = type.caps.missingFielder || !(type.toArray || options().structToArray);

  vector<FieldRecord> &records = *_fieldLists.acquire();
  records.clear();

  if (toMap) {
    const auto appendField = [&](const FieldInfo &field) {
      ValueRef value = field.field(rv);
      if (field.omitEmpty && IsEmptyValue(value, recursive)) {
        return;
      }
      records.push_back(FieldRecord{&field, value});
    };
    if (options().canonical) {
      for (const FieldInfo *field : type.fieldsSorted) {
        appendField(*field);
      }
    } else {
      for (const FieldInfo &field : type.fieldsSrc) {
        appendField(field);
      }
    }

    std::erase_if(extras, [&](const auto &entry) {
      return entry.first.empty() || (type.omitEmptyAll && IsEmptyValue(entry.second.ref(), recursive));
    });

    mapStart(records.size() + extras.size());
    for (const FieldRecord &record : records) {
      mapElemKey();
      encodeStructFieldKey(type.keyType, record.field->encNameAsciiAlphaNum, record.field->encName);
      mapElemValue();
      encodeValue(record.value, nullptr);
    }
    for (const auto &[name, value] : extras) {
      mapElemKey();
      encodeStructFieldKey(type.keyType, false, name);
      mapElemValue();
      encodeValue(value.ref(), nullptr);
    }
    mapEnd();
  } else {
    // declaration order, whatever the canonical option
    for (const FieldInfo &field : type.fieldsSrc) {
      ValueRef value = field.field(rv);
      if (field.omitEmpty && IsEmptyValue(value, recursive) && NilWhenOmitted(value.kind())) {
        value = ValueRef{};
      }
      records.push_back(FieldRecord{&field, value});
    }

    arrayStart(records.size());
    for (const FieldRecord &record : records) {
      arrayElem();
      encodeValue(record.value, nullptr);
    }
    arrayEnd();
  }

  _fieldLists.release(&records);
}

}  // namespace vencode
