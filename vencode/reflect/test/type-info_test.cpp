#include "vencode/type-info.hpp"

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <typeindex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "vencode/any.hpp"
#include "vencode/chan.hpp"
#include "vencode/kind.hpp"
#include "vencode/raw.hpp"
#include "vencode/reflect.hpp"
#include "vencode/type-registry.hpp"

namespace vencode {

namespace test {

struct Point {
  int x{};
  int y{};

  bool operator==(const Point &) const = default;
};

struct Node {
  int value{};
  std::shared_ptr<Node> next;
};

struct Base {
  std::string id;
  int level{};
};

struct Derived {
  Base base;
  int level{};
  std::string name;
};

struct WithBasePtr {
  Base *base{nullptr};
  bool flag{};
};

struct AllOmitted {
  int first{};
  int second{};
};

struct Describing {
  std::string marshalText() const { return "text"; }
  RawBytes marshalBinary() { return RawBytes(std::string_view("bin")); }
  bool isCodecEmpty() const { return true; }
};

enum class Color : std::uint8_t { Red, Green };

enum class Offset : std::int16_t { Back = -1, Forward = 1 };

struct Undescribed {
  int value{};
};

struct Payload {
  double amount{};
};

struct Envelope {
  Payload payload;
};

}  // namespace test

template <>
struct StructMeta<test::Envelope> {
  static void describe(StructBuilder<test::Envelope> &builder) { builder.field<&test::Envelope::payload>("payload"); }
};

template <>
struct StructMeta<test::Point> {
  static void describe(StructBuilder<test::Point> &builder) {
    builder.field<&test::Point::y>("y").field<&test::Point::x>("x");
  }
};

template <>
struct StructMeta<test::Node> {
  static void describe(StructBuilder<test::Node> &builder) {
    builder.field<&test::Node::value>("value").field<&test::Node::next>("next", FieldFlag::OmitEmpty);
  }
};

template <>
struct StructMeta<test::Base> {
  static void describe(StructBuilder<test::Base> &builder) {
    builder.field<&test::Base::id>("id").field<&test::Base::level>("level");
  }
};

template <>
struct StructMeta<test::Derived> {
  static void describe(StructBuilder<test::Derived> &builder) {
    builder.embed<&test::Derived::base>()
        .field<&test::Derived::level>("level")
        .field<&test::Derived::name>("name")
        .toArray()
        .keyType(KeyType::Int);
  }
};

template <>
struct StructMeta<test::WithBasePtr> {
  static void describe(StructBuilder<test::WithBasePtr> &builder) {
    builder.embed<&test::WithBasePtr::base>().field<&test::WithBasePtr::flag>("flag");
  }
};

template <>
struct StructMeta<test::AllOmitted> {
  static void describe(StructBuilder<test::AllOmitted> &builder) {
    builder.field<&test::AllOmitted::first>("first").field<&test::AllOmitted::second>("second").omitEmpty();
  }
};

TEST(TypeInfoTest, PrimitiveKinds) {
  EXPECT_EQ(TypeInfoFor<bool>().kind, Kind::Bool);
  EXPECT_EQ(TypeInfoFor<int>().kind, Kind::Int);
  EXPECT_EQ(TypeInfoFor<char>().kind, Kind::Int);
  EXPECT_EQ(TypeInfoFor<std::int8_t>().kind, Kind::Int);
  EXPECT_EQ(TypeInfoFor<std::uint16_t>().kind, Kind::Uint);
  EXPECT_EQ(TypeInfoFor<std::byte>().kind, Kind::Uint);
  EXPECT_EQ(TypeInfoFor<float>().kind, Kind::Float32);
  EXPECT_EQ(TypeInfoFor<double>().kind, Kind::Float64);
  EXPECT_EQ(TypeInfoFor<std::string>().kind, Kind::String);
  EXPECT_EQ(TypeInfoFor<std::string_view>().kind, Kind::String);
  EXPECT_EQ(TypeInfoFor<std::chrono::system_clock::time_point>().kind, Kind::Time);
  EXPECT_EQ(TypeInfoFor<std::uint32_t>().size, sizeof(std::uint32_t));
}

TEST(TypeInfoTest, CompositeKinds) {
  EXPECT_EQ(TypeInfoFor<std::vector<int>>().kind, Kind::Slice);
  EXPECT_EQ(TypeInfoFor<std::deque<bool>>().kind, Kind::Slice);
  EXPECT_EQ(TypeInfoFor<RawBytes>().kind, Kind::Slice);
  EXPECT_EQ((TypeInfoFor<std::array<int, 3>>().kind), Kind::Array);
  EXPECT_EQ((TypeInfoFor<std::array<int, 3>>().arrayLen), 3U);
  EXPECT_EQ(TypeInfoFor<int[4]>().kind, Kind::Array);
  EXPECT_EQ(TypeInfoFor<int[4]>().arrayLen, 4U);
  EXPECT_EQ((TypeInfoFor<std::map<std::string, int>>().kind), Kind::Map);
  EXPECT_EQ((TypeInfoFor<std::unordered_map<int, double>>().kind), Kind::Map);
  EXPECT_EQ(TypeInfoFor<int *>().kind, Kind::Pointer);
  EXPECT_EQ(TypeInfoFor<std::shared_ptr<int>>().kind, Kind::Pointer);
  EXPECT_EQ(TypeInfoFor<std::unique_ptr<int>>().kind, Kind::Pointer);
  EXPECT_EQ(TypeInfoFor<std::optional<int>>().kind, Kind::Pointer);
  EXPECT_EQ(TypeInfoFor<Any>().kind, Kind::Interface);
  EXPECT_EQ(TypeInfoFor<std::function<void()>>().kind, Kind::Func);
  EXPECT_EQ(TypeInfoFor<void (*)(int)>().kind, Kind::Func);
  EXPECT_EQ(TypeInfoFor<test::Point>().kind, Kind::Struct);
  EXPECT_EQ(TypeInfoFor<test::Color>().kind, Kind::Uint);
  EXPECT_EQ(TypeInfoFor<test::Offset>().kind, Kind::Int);
  EXPECT_EQ(TypeInfoFor<const char *>().kind, Kind::String);
  EXPECT_EQ(TypeInfoFor<char *>().kind, Kind::String);
  EXPECT_EQ(TypeInfoFor<test::Undescribed>().kind, Kind::Unsupported);
  EXPECT_EQ(TypeInfoFor<std::vector<bool>>().kind, Kind::Unsupported);
}

TEST(TypeInfoTest, ElementAndKeyTypes) {
  const TypeInfo &mapType = TypeInfoFor<std::map<std::string, std::vector<int>>>();
  EXPECT_EQ(mapType.key(), &TypeInfoFor<std::string>());
  EXPECT_EQ(mapType.elem(), &TypeInfoFor<std::vector<int>>());
  EXPECT_EQ(mapType.elem()->elem(), &TypeInfoFor<int>());
  EXPECT_EQ(TypeInfoFor<const int *>().elem(), &TypeInfoFor<int>());
  EXPECT_TRUE(TypeInfoFor<const int *>().constPointee);
  EXPECT_FALSE(TypeInfoFor<int *>().constPointee);
  EXPECT_TRUE(TypeInfoFor<std::optional<int>>().inlinePointee);
  EXPECT_EQ(TypeInfoFor<int>().elem(), nullptr);
}

TEST(TypeInfoTest, ByteSequences) {
  EXPECT_TRUE(TypeInfoFor<std::vector<std::uint8_t>>().isByteSequence());
  EXPECT_TRUE(TypeInfoFor<RawBytes>().isByteSequence());
  EXPECT_TRUE((TypeInfoFor<std::array<std::byte, 4>>().isByteSequence()));
  EXPECT_FALSE(TypeInfoFor<std::vector<char>>().isByteSequence());
  EXPECT_FALSE(TypeInfoFor<std::deque<std::uint8_t>>().isByteSequence());

  std::vector<std::uint8_t> bytes{1, 2, 3};
  auto span = TypeInfoFor<std::vector<std::uint8_t>>().ops.bytes(&bytes);
  ASSERT_EQ(span.size(), 3U);
  EXPECT_EQ(span[2], std::byte{3});
}

TEST(TypeInfoTest, Channels) {
  EXPECT_EQ(TypeInfoFor<Chan<int>>().kind, Kind::Chan);
  EXPECT_EQ(TypeInfoFor<Chan<int>>().chanDir, ChanDir::Both);
  EXPECT_EQ(TypeInfoFor<RecvChan<int>>().chanDir, ChanDir::Recv);
  EXPECT_EQ(TypeInfoFor<SendChan<int>>().chanDir, ChanDir::Send);
  EXPECT_EQ(TypeInfoFor<SendChan<int>>().ops.drain, nullptr);
  EXPECT_NE(TypeInfoFor<Chan<std::uint8_t>>().ops.drainBytes, nullptr);
  EXPECT_EQ(TypeInfoFor<Chan<int>>().ops.drainBytes, nullptr);
}

TEST(TypeInfoTest, DrainedChannelValuesAreOwned) {
  auto chan = Chan<int>::make();
  chan.send(1);
  chan.send(2);
  OwnedValue drained = TypeInfoFor<Chan<int>>().ops.drain(&chan, std::chrono::milliseconds(0));
  ASSERT_EQ(drained.ref.kind(), Kind::Slice);
  EXPECT_EQ(drained.ref.as<std::deque<int>>(), (std::deque<int>{1, 2}));
  EXPECT_EQ(chan.size(), 0U);
}

TEST(TypeInfoTest, RegistryMemoizes) {
  const TypeInfo &first = TypeInfoFor<std::vector<double>>();
  const TypeInfo &second = TypeInfoFor<std::vector<double>>();
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(TypeRegistry::instance().find(std::type_index(typeid(std::vector<double>))), &first);
  EXPECT_EQ(TypeRegistry::instance().find(std::type_index(typeid(std::vector<std::wstring>))), nullptr);
  EXPECT_NE(first.name.find("vector"), std::string::npos);
}

TEST(TypeInfoTest, RecursiveType) {
  const TypeInfo &node = TypeInfoFor<test::Node>();
  ASSERT_EQ(node.fieldsSrc.size(), 2U);
  const TypeInfo &next = node.fieldsSrc[1].type();
  EXPECT_EQ(next.kind, Kind::Pointer);
  EXPECT_EQ(next.elem(), &node);
}

TEST(TypeInfoTest, StructFieldOrders) {
  const TypeInfo &point = TypeInfoFor<test::Point>();
  ASSERT_EQ(point.fieldsSrc.size(), 2U);
  EXPECT_EQ(point.fieldsSrc[0].encName, "y");
  EXPECT_EQ(point.fieldsSrc[1].encName, "x");
  ASSERT_EQ(point.fieldsSorted.size(), 2U);
  EXPECT_EQ(point.fieldsSorted[0]->encName, "x");
  EXPECT_EQ(point.fieldsSorted[1]->encName, "y");
  EXPECT_TRUE(point.fieldsSrc[0].encNameAsciiAlphaNum);
  EXPECT_FALSE(point.toArray);
  EXPECT_EQ(point.keyType, KeyType::String);
}

TEST(TypeInfoTest, FieldAccess) {
  test::Point point{3, 4};
  ValueRef ref = MutableValueOf(point);
  const TypeInfo &type = *ref.type();
  ValueRef yField = type.fieldsSrc[0].field(ref);
  ASSERT_TRUE(yField.valid());
  EXPECT_EQ(yField.as<int>(), 4);
  EXPECT_TRUE(yField.addressable());
  EXPECT_FALSE(type.fieldsSrc[1].field(ValueOf(point)).addressable());
}

TEST(TypeInfoTest, FieldAccessResolvesFieldTypeOnFirstUse) {
  // the field type descriptor may be built (and allocated) by field() itself
  static_assert(!noexcept(std::declval<const FieldInfo &>().field(ValueRef())));
  const test::Envelope envelope{test::Payload{2.5}};
  ValueRef payload = TypeInfoFor<test::Envelope>().fieldsSrc[0].field(ValueOf(envelope));
  ASSERT_TRUE(payload.valid());
  EXPECT_EQ(payload.kind(), Kind::Unsupported);
  EXPECT_EQ(payload.type(), &TypeInfoFor<test::Payload>());
  EXPECT_EQ(&payload.as<test::Payload>(), &envelope.payload);
}

TEST(TypeInfoTest, EmbeddedFieldsAreFlattenedAndShadowed) {
  const TypeInfo &derived = TypeInfoFor<test::Derived>();
  ASSERT_EQ(derived.fieldsSrc.size(), 3U);
  EXPECT_EQ(derived.fieldsSrc[0].encName, "id");
  EXPECT_EQ(derived.fieldsSrc[0].depth, 1U);
  EXPECT_EQ(derived.fieldsSrc[1].encName, "level");
  EXPECT_EQ(derived.fieldsSrc[1].depth, 0U);
  EXPECT_EQ(derived.fieldsSrc[2].encName, "name");
  EXPECT_TRUE(derived.toArray);
  EXPECT_EQ(derived.keyType, KeyType::Int);

  test::Derived value{{"abc", 1}, 2, "n"};
  EXPECT_EQ(derived.fieldsSrc[0].field(ValueOf(value)).as<std::string>(), "abc");
  EXPECT_EQ(derived.fieldsSrc[1].field(ValueOf(value)).as<int>(), 2);
}

TEST(TypeInfoTest, EmbeddedNilPointerGivesInvalidField) {
  const TypeInfo &type = TypeInfoFor<test::WithBasePtr>();
  ASSERT_EQ(type.fieldsSrc.size(), 3U);

  test::WithBasePtr value;
  EXPECT_FALSE(type.fieldsSrc[0].field(ValueOf(value)).valid());

  test::Base base{"id", 5};
  value.base = &base;
  ValueRef level = type.fieldsSrc[1].field(ValueOf(value));
  ASSERT_TRUE(level.valid());
  EXPECT_EQ(level.as<int>(), 5);
  // reached through a pointer to a mutable object
  EXPECT_TRUE(level.addressable());
}

TEST(TypeInfoTest, StructLevelOmitEmpty) {
  const TypeInfo &type = TypeInfoFor<test::AllOmitted>();
  EXPECT_TRUE(type.omitEmptyAll);
  for (const FieldInfo &fieldInfo : type.fieldsSrc) {
    EXPECT_TRUE(fieldInfo.omitEmpty);
  }
}

TEST(TypeInfoTest, Capabilities) {
  const TypeCapabilities &caps = TypeInfoFor<test::Describing>().caps;
  EXPECT_TRUE(caps.textMarshaler);
  EXPECT_FALSE(caps.textMarshalerNeedsAddr);
  EXPECT_TRUE(caps.binaryMarshaler);
  EXPECT_TRUE(caps.binaryMarshalerNeedsAddr);
  EXPECT_FALSE(caps.jsonMarshaler);
  EXPECT_FALSE(caps.selfer);
  EXPECT_TRUE(caps.codecEmpty);
  EXPECT_TRUE(caps.copyable);

  EXPECT_TRUE(TypeInfoFor<Raw>().caps.raw);
  EXPECT_TRUE(TypeInfoFor<RawExt>().caps.rawExt);
  EXPECT_FALSE(TypeInfoFor<std::unique_ptr<int>>().caps.copyable);
  EXPECT_FALSE(TypeInfoFor<std::vector<std::unique_ptr<int>>>().caps.copyable);
}

TEST(TypeInfoTest, CopyMakesIndependentObject) {
  test::Point point{1, 2};
  std::shared_ptr<void> copy = TypeInfoFor<test::Point>().ops.copy(&point);
  auto *copied = static_cast<test::Point *>(copy.get());
  copied->x = 10;
  EXPECT_EQ(point.x, 1);
}

TEST(TypeInfoTest, PointerElem) {
  int value = 3;
  int *ptr = &value;
  ValueRef elem = ValueOf(ptr).elem();
  ASSERT_TRUE(elem.valid());
  EXPECT_EQ(elem.as<int>(), 3);
  EXPECT_TRUE(elem.addressable());

  const int *constPtr = &value;
  EXPECT_FALSE(ValueOf(constPtr).elem().addressable());

  std::optional<int> opt;
  EXPECT_FALSE(ValueOf(opt).elem().valid());
  opt = 4;
  EXPECT_FALSE(ValueOf(opt).elem().addressable());
  EXPECT_TRUE(MutableValueOf(opt).elem().addressable());
}

TEST(TypeInfoTest, KindNames) {
  EXPECT_EQ(KindName(Kind::Struct), "struct");
  EXPECT_EQ(KindName(Kind::Float32), "float32");
  EXPECT_EQ(KeyTypeName(KeyType::Uint), "uint");
}

TEST(TypeInfoTest, EnumsReadTheirUnderlyingValue) {
  const test::Color green = test::Color::Green;
  const test::Offset back = test::Offset::Back;
  EXPECT_EQ(TypeInfoFor<test::Color>().ops.getUint(&green), 1U);
  EXPECT_EQ(TypeInfoFor<test::Offset>().ops.getInt(&back), -1);
  EXPECT_EQ(TypeInfoFor<test::Color>().size, 1U);
}

TEST(TypeInfoTest, CStrings) {
  const TypeInfo &type = TypeInfoFor<const char *>();
  const char *hello = "hello";
  const char *null = nullptr;
  EXPECT_EQ(type.ops.getString(&hello), "hello");
  EXPECT_EQ(type.ops.len(&hello), 5U);
  EXPECT_FALSE(type.ops.isNil(&hello));
  EXPECT_TRUE(type.ops.isNil(&null));
  EXPECT_EQ(type.ops.len(&null), 0U);
  EXPECT_EQ(type.elem(), nullptr);
}

}  // namespace vencode
