#include "vencode/codec-fn.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "vencode/any.hpp"
#include "vencode/extension.hpp"
#include "vencode/handle.hpp"
#include "vencode/raw-bytes.hpp"
#include "vencode/raw.hpp"
#include "vencode/reflect.hpp"
#include "vencode/trace-handle.hpp"

namespace vencode {

namespace {

struct Money {
  long cents{};
};

struct Marshaled {
  std::string marshalText() { return "t"; }
  RawBytes marshalBinary() const { return {}; }
};

class MoneyExt : public Extension {
 public:
  RawBytes writeExt([[maybe_unused]] ValueRef value) const override { return {}; }
  Any convertExt([[maybe_unused]] ValueRef value) const override { return {}; }
};

}  // namespace

template <>
struct StructMeta<Money> {
  static void describe(StructBuilder<Money> &builder) { builder.field<&Money::cents>("cents"); }
};

TEST(CodecFnTest, StrategyPerKind) {
  test::TraceHandle handle;
  EXPECT_EQ(handle.fn(TypeInfoFor<int>()).name, "int");
  EXPECT_EQ(handle.fn(TypeInfoFor<std::vector<int>>()).name, "slice");
  EXPECT_EQ(handle.fn(TypeInfoFor<Money>()).name, "struct");
  EXPECT_EQ(handle.fn(TypeInfoFor<Raw>()).name, "raw");
  EXPECT_EQ(handle.fn(TypeInfoFor<RawExt>()).name, "rawExt");
  EXPECT_EQ(handle.fn(TypeInfoFor<std::unique_ptr<int>>()).name, "unsupported");
}

TEST(CodecFnTest, StrategyIsMemoized) {
  test::TraceHandle handle;
  const CodecFn &first = handle.fn(TypeInfoFor<Money>());
  const CodecFn &second = handle.fn(TypeInfoFor<Money>());
  EXPECT_EQ(&first, &second);
  EXPECT_EQ(first.info.type, &TypeInfoFor<Money>());
}

TEST(CodecFnTest, ConcurrentLookupsShareEntry) {
  test::TraceHandle handle;
  constexpr std::size_t kNbThreads = 8;
  std::vector<const CodecFn *> results(kNbThreads);
  {
    std::vector<std::jthread> threads;
    for (std::size_t pos = 0; pos < kNbThreads; ++pos) {
      threads.emplace_back([&handle, &results, pos] { results[pos] = &handle.fn(TypeInfoFor<std::vector<Money>>()); });
    }
  }
  for (const CodecFn *fn : results) {
    EXPECT_EQ(fn, results.front());
  }
}

TEST(CodecFnTest, ExtensionOnlyInFullCache) {
  test::TraceHandle handle;
  handle.setExt<Money>(9, std::make_shared<MoneyExt>());
  EXPECT_NE(handle.findExt(TypeInfoFor<Money>()), nullptr);
  EXPECT_TRUE(handle.hasExtensions());

  const CodecFn &withExt = handle.fn(TypeInfoFor<Money>());
  EXPECT_EQ(withExt.name, "ext");
  EXPECT_EQ(withExt.info.extTag, 9U);
  EXPECT_NE(withExt.info.ext, nullptr);

  EXPECT_EQ(handle.fnNoExt(TypeInfoFor<Money>()).name, "struct");
}

TEST(CodecFnTest, RemovingExtension) {
  test::TraceHandle handle;
  handle.setExt<Money>(9, std::make_shared<MoneyExt>());
  handle.setExt<Money>(9, nullptr);
  EXPECT_FALSE(handle.hasExtensions());
  EXPECT_EQ(handle.fn(TypeInfoFor<Money>()).name, "struct");
}

TEST(CodecFnTest, AddressabilityRequirements) {
  test::TraceHandle text(CodecOptions{}, test::TraceMode::Text);
  const CodecFn &textFn = text.fn(TypeInfoFor<Marshaled>());
  EXPECT_EQ(textFn.name, "textMarshal");
  EXPECT_TRUE(textFn.info.addrE);
  EXPECT_TRUE(textFn.info.addrEf);

  test::TraceHandle binary;
  const CodecFn &binaryFn = binary.fn(TypeInfoFor<Marshaled>());
  EXPECT_EQ(binaryFn.name, "binaryMarshal");
  EXPECT_FALSE(binaryFn.info.addrE);
  EXPECT_FALSE(binaryFn.info.addrEf);
}

TEST(CodecFnTest, HandleTraits) {
  test::TraceHandle binary;
  test::TraceHandle json(CodecOptions{}, test::TraceMode::Json);
  EXPECT_TRUE(binary.isBinary());
  EXPECT_FALSE(binary.isJson());
  EXPECT_FALSE(json.isBinary());
  EXPECT_TRUE(json.isJson());
  EXPECT_EQ(binary.name(), "trace-binary");
  EXPECT_EQ(json.name(), "trace-json");
}

}  // namespace vencode
