#include <string>

#include <gtest/gtest.h>

#include <npbridge/converter.hpp>
#include <npbridge/impl/handle_map.hpp>
#include <npbridge/impl/object_registry.hpp>

using namespace npbridge;
using npbridge::impl::HandleMap;
using npbridge::impl::ObjectRegistry;

namespace {
class Counter : public Object
{
public:
  static inline int alive = 0;
  int value = 0;

  Counter() { ++alive; }
  ~Counter() override { --alive; }
};

class Other : public Object
{
};
} // namespace

TEST(HandleMap, AddAndResolve)
{
  HandleMap<std::string> map;
  auto a = map.add("a");
  auto b = map.add("b");
  EXPECT_NE(a, 0u);
  EXPECT_NE(a, b);
  EXPECT_EQ(map.size(), 2u);

  std::string seen;
  EXPECT_TRUE(map.with(b, [&](std::string& s) { seen = s; }));
  EXPECT_EQ(seen, "b");
}

TEST(HandleMap, StaleIdDoesNotResolveAfterReuse)
{
  HandleMap<int> map;
  auto first = map.add(1);
  EXPECT_EQ(map.remove(first), 1);
  EXPECT_FALSE(map.contains(first));

  // the slot is reused with a new generation
  auto second = map.add(2);
  EXPECT_EQ(second & 0xFFFF'FFFFull, first & 0xFFFF'FFFFull);
  EXPECT_NE(second, first);
  EXPECT_FALSE(map.contains(first));
  EXPECT_FALSE(map.remove(first).has_value());
  EXPECT_TRUE(map.contains(second));
}

TEST(HandleMap, UnknownIds)
{
  HandleMap<int> map;
  EXPECT_FALSE(map.contains(0));
  EXPECT_FALSE(map.contains(0x0000'0001'0000'0005ull));
  EXPECT_FALSE(map.with(42, [](int&) {}));
}

TEST(ObjectRegistry, LowerThenTakeTransfersTheReference)
{
  auto& reg = ObjectRegistry::instance();
  {
    auto obj = make_object<Counter>();
    obj->value = 7;
    auto handle = FfiConverter<ObjectPtr<Counter>>::lower(obj);
    EXPECT_TRUE(reg.contains(handle));
    EXPECT_EQ(obj->use_count(), 2u);

    auto back = FfiConverter<ObjectPtr<Counter>>::lift(handle);
    EXPECT_EQ(back, obj);
    EXPECT_EQ(back->value, 7);
    // the only foreign reference was consumed
    EXPECT_FALSE(reg.contains(handle));
    EXPECT_THROW(FfiConverter<ObjectPtr<Counter>>::lift(handle),
                 ConversionFault);
  }
  EXPECT_EQ(Counter::alive, 0);
}

TEST(ObjectRegistry, ForeignReferenceKeepsObjectAlive)
{
  auto& reg = ObjectRegistry::instance();
  uint64_t handle;
  {
    auto obj = make_object<Counter>();
    handle = reg.lower(obj);
  }
  EXPECT_EQ(Counter::alive, 1);

  reg.acquire(handle);
  reg.release(handle);
  EXPECT_EQ(Counter::alive, 1);
  EXPECT_TRUE(reg.contains(handle));

  reg.release(handle);
  EXPECT_EQ(Counter::alive, 0);
  EXPECT_THROW(reg.release(handle), ConversionFault);
  EXPECT_THROW(reg.acquire(handle), ConversionFault);
}

TEST(ObjectRegistry, TypeMismatchKeepsTheReference)
{
  auto& reg = ObjectRegistry::instance();
  auto handle = reg.lower(make_object<Counter>());
  try {
    reg.take<Other>(handle);
    FAIL() << "mismatching type accepted";
  } catch (const ConversionFault& ex) {
    EXPECT_STREQ(ex.what(), "object handle type mismatch");
  }
  EXPECT_TRUE(reg.contains(handle));
  EXPECT_TRUE(reg.take<Counter>(handle));
  EXPECT_EQ(Counter::alive, 0);
}

TEST(ObjectRegistry, NullHandle)
{
  EXPECT_THROW(ObjectRegistry::instance().take<Counter>(0), ConversionFault);
}

TEST(ObjectRegistry, NullObjectCannotBeLowered)
{
  EXPECT_THROW(FfiConverter<ObjectPtr<Counter>>::lower(ObjectPtr<Counter>()),
               UnrecoverableFault);
}
