#include <gtest/gtest.h>

#include <npbridge/converter.hpp>
#include <npbridge/metadata.hpp>

using namespace npbridge;

namespace {
ExportMetadata make_export(std::string module, std::string name,
                           bool is_async = false)
{
  ExportMetadata md;
  md.module = std::move(module);
  md.name = std::move(name);
  md.params = {{"ms", "u16"}, {"who", "string"}};
  md.success_type = "string";
  md.is_async = is_async;
  md.invoke_symbol = "npbridge_" + md.module + "_fn_" + md.name;
  if (is_async) {
    md.executor = "default";
    md.poll_symbol = md.invoke_symbol + "_poll";
    md.release_symbol = md.invoke_symbol + "_release";
  }
  return md;
}
} // namespace

TEST(Metadata, AddAndFind)
{
  MetadataRegistry reg;
  reg.add(make_export("futures", "say_after", true));
  reg.add(make_export("futures", "greet"));
  reg.add(make_export("other", "greet"));

  EXPECT_EQ(reg.size(), 3u);

  auto md = reg.find("futures", "say_after");
  ASSERT_TRUE(md.has_value());
  EXPECT_TRUE(md->is_async);
  EXPECT_EQ(md->poll_symbol, "npbridge_futures_fn_say_after_poll");
  ASSERT_EQ(md->params.size(), 2u);
  EXPECT_EQ(md->params[1].name, "who");

  EXPECT_EQ(reg.find("other", "greet")->invoke_symbol,
            "npbridge_other_fn_greet");
  EXPECT_FALSE(reg.find("futures", "missing").has_value());
}

TEST(Metadata, DuplicateIsRejected)
{
  MetadataRegistry reg;
  reg.add(make_export("futures", "greet"));
  EXPECT_THROW(reg.add(make_export("futures", "greet")), Exception);

  // logged, not thrown
  reg.register_static(make_export("futures", "greet"));
  EXPECT_EQ(reg.size(), 1u);
}

TEST(Metadata, ReadFreezesTheRegistry)
{
  MetadataRegistry reg;
  reg.add(make_export("futures", "greet"));
  EXPECT_FALSE(reg.frozen());

  EXPECT_TRUE(reg.at(0).has_value());
  EXPECT_FALSE(reg.at(1).has_value());
  EXPECT_TRUE(reg.frozen());
  EXPECT_THROW(reg.add(make_export("futures", "late")), Exception);
}

TEST(Metadata, ExplicitFreeze)
{
  MetadataRegistry reg;
  reg.freeze();
  EXPECT_TRUE(reg.frozen());
  EXPECT_THROW(reg.add(make_export("futures", "greet")), Exception);
  EXPECT_EQ(reg.size(), 0u);
}

TEST(Metadata, LowersAsARecord)
{
  auto md = make_export("futures", "sleep", true);
  md.error_type = "record:futures::MyError";

  auto back = lift_from_buffer<ExportMetadata>(lower_into_buffer(md));
  EXPECT_EQ(back.module, "futures");
  EXPECT_EQ(back.name, "sleep");
  EXPECT_EQ(back.receiver, "");
  ASSERT_EQ(back.params.size(), 2u);
  EXPECT_EQ(back.params[0].type, "u16");
  EXPECT_EQ(back.error_type, "record:futures::MyError");
  EXPECT_TRUE(back.is_async);
  EXPECT_EQ(back.executor, "default");
  EXPECT_EQ(back.release_symbol, "npbridge_futures_fn_sleep_release");
}

TEST(Metadata, MethodAndFreeFunctionMayShareAName)
{
  MetadataRegistry reg;
  reg.add(make_export("futures", "say_after", true));
  auto method = make_export("futures", "say_after", true);
  method.receiver = "Megaphone";
  method.invoke_symbol = "npbridge_futures_method_Megaphone_say_after";
  reg.add(method);
  EXPECT_EQ(reg.size(), 2u);

  EXPECT_EQ(reg.find("futures", "say_after")->invoke_symbol,
            "npbridge_futures_fn_say_after");
  EXPECT_EQ(reg.find("futures", "Megaphone::say_after")->invoke_symbol,
            "npbridge_futures_method_Megaphone_say_after");
  EXPECT_FALSE(reg.find("futures", "Other::say_after").has_value());
}
