#include <sstream>

#include <gtest/gtest.h>

#include "c_header_builder.hpp"
#include "classifier.hpp"
#include "cpp_scaffolding_builder.hpp"
#include "loader.hpp"
#include "metadata_builder.hpp"
#include "types.hpp"

using namespace npbgen;

namespace {
constexpr const char* kClockModule = R"({
  "module": "clock",
  "header": "clock.hpp",
  "namespace": "native::clock",
  "functions": [
    {"name": "now", "returns": "u64"},
    {"name": "wait", "async": true,
     "params": [{"name": "ms", "type": "u32"}]},
    {"name": "read_config", "async": true, "executor": "io",
     "params": [{"name": "path", "type": "string"}],
     "returns": "map<string, sequence<i32>>",
     "throws": "record:native::clock::ConfigError"},
    {"name": "poll_sensor", "async": true,
     "params": [{"name": "id", "type": "enum:native::clock::Sensor"}],
     "returns": "map<string,sequence<i32>>",
     "throws": "record:native::clock::ConfigError"}
  ],
  "objects": [
    {"name": "Alarm", "type": "native::clock::Alarm",
     "methods": [
       {"name": "ring", "async": true,
        "params": [{"name": "self", "type": "self"},
                   {"name": "times", "type": "u8"}],
        "returns": "bool"},
       {"name": "armed", "params": [{"name": "self", "type": "self"}],
        "returns": "bool"}
     ]}
  ]
})";

// Loads text into ctx, keeping ctx alive for the returned signatures.
std::vector<ExportedSignature> classify_text(Context& ctx,
                                             const std::string& text)
{
  std::istringstream is(text);
  load_declarations(ctx, is);
  return classify_module(ctx);
}

std::string single_function(const std::string& fn)
{
  return R"({"module": "m", "header": "m.hpp", "functions": [)" + fn + "]}";
}

std::string single_method(const std::string& method)
{
  return R"({"module": "m", "header": "m.hpp", "objects": [
    {"name": "Obj", "type": "m::Obj", "methods": [)" +
         method + "]}]}";
}

// Message of the classification_error raised for text, or "" if none.
std::string classification_failure(const std::string& text)
{
  Context ctx("m.json");
  try {
    classify_text(ctx, text);
  } catch (const classification_error& ex) {
    return ex.what();
  }
  return {};
}

std::string declaration_failure(const std::string& text)
{
  Context ctx("m.json");
  try {
    classify_text(ctx, text);
  } catch (const classification_error&) {
    return "classification_error";
  } catch (const declaration_error& ex) {
    return ex.what();
  }
  return {};
}

template <typename B>
std::string build(Context& ctx, const std::vector<ExportedSignature>& sigs)
{
  B builder(&ctx, std::filesystem::path{});
  builder.emit_module_begin();
  for (const auto& sig : sigs)
    builder.emit_export(sig);
  builder.emit_module_end();
  return builder.str();
}

bool contains(const std::string& text, const std::string& what)
{
  return text.find(what) != std::string::npos;
}
} // namespace

TEST(Types, CanonicalNames)
{
  Context ctx;
  auto canonical = [&](std::string_view s) {
    auto t = parse_type(ctx, s);
    return t ? canonical_name(t) : std::string("<null>");
  };

  EXPECT_EQ(canonical("u8"), "u8");
  EXPECT_EQ(canonical("sequence< i32 >"), "sequence<i32>");
  EXPECT_EQ(canonical("map<string, optional<f64>>"),
            "map<string,optional<f64>>");
  EXPECT_EQ(canonical("map<enum:a::E,sequence<bytes>>"),
            "map<enum:a::E,sequence<bytes>>");
  EXPECT_EQ(canonical("record:a::b::Rec"), "record:a::b::Rec");

  EXPECT_EQ(canonical("u128"), "<null>");
  EXPECT_EQ(canonical("sequence<void>"), "<null>");
  EXPECT_EQ(canonical("optional<self>"), "<null>");
  EXPECT_EQ(canonical("map<sequence<u8>,i32>"), "<null>");
  EXPECT_EQ(canonical("map<i32>"), "<null>");
  EXPECT_EQ(canonical("record:"), "<null>");
  EXPECT_EQ(canonical("record:a::"), "<null>");
  EXPECT_EQ(canonical("object:1abc"), "<null>");
}

TEST(Types, NativeAndBoundaryTypes)
{
  Context ctx;
  EXPECT_EQ(cpp_type(parse_type(ctx, "map<string,sequence<u16>>")),
            "std::map<std::string, std::vector<uint16_t>>");
  EXPECT_EQ(cpp_type(parse_type(ctx, "bytes")), "std::vector<uint8_t>");
  EXPECT_EQ(cpp_type(parse_type(ctx, "object:x::Y")), "npbridge::ObjectPtr<x::Y>");

  EXPECT_EQ(abi_type(parse_type(ctx, "bool")), "int8_t");
  EXPECT_EQ(abi_type(parse_type(ctx, "enum:x::E")), "int32_t");
  EXPECT_EQ(abi_type(parse_type(ctx, "object:x::Y")), "npbridge_object_handle");
  EXPECT_EQ(abi_type(parse_type(ctx, "optional<u8>")), "npbridge_buffer");
  EXPECT_EQ(abi_type(parse_type(ctx, "void")), "void");
  EXPECT_EQ(abi_slot_type(parse_type(ctx, "void")), "int8_t");
}

TEST(Types, Mangle)
{
  EXPECT_EQ(mangle("sequence<i32>"), "sequence_i32");
  EXPECT_EQ(mangle("record:a::B"), "record_a_B");
  EXPECT_EQ(mangle("map<string,optional<f64>>"), "map_string_optional_f64");
}

TEST(Loader, ReadsModule)
{
  Context ctx("clock.json");
  std::istringstream is(kClockModule);
  load_declarations(ctx, is);

  const auto& module = ctx.module;
  EXPECT_EQ(module.name, "clock");
  EXPECT_EQ(module.header, "clock.hpp");
  EXPECT_EQ(module.cpp_namespace, "native::clock");
  ASSERT_EQ(module.fns.size(), 4u);
  ASSERT_EQ(module.objects.size(), 1u);

  auto wait = module.fns[1];
  EXPECT_TRUE(wait->is_async);
  EXPECT_EQ(wait->ret->id, FieldType::Void);
  EXPECT_FALSE(wait->executor.has_value());

  auto read_config = module.fns[2];
  EXPECT_EQ(read_config->executor.value_or(""), "io");
  ASSERT_NE(read_config->error, nullptr);
  EXPECT_EQ(canonical_name(read_config->error),
            "record:native::clock::ConfigError");

  EXPECT_EQ(module.objects[0]->cpp_name, "native::clock::Alarm");
  EXPECT_EQ(module.objects[0]->methods.size(), 2u);
}

TEST(Loader, NamespaceDefaultsToModuleName)
{
  Context ctx;
  std::istringstream is(single_function(R"({"name": "f"})"));
  load_declarations(ctx, is);
  EXPECT_EQ(ctx.module.cpp_namespace, "m");
}

TEST(Loader, Rejections)
{
  EXPECT_EQ(declaration_failure(single_function(
                R"({"name": "f", "params": [{"name": "x", "type": "u128"}]})")),
            "unknown type 'u128'");
  EXPECT_EQ(declaration_failure(single_function(
                R"({"name": "f", "params": [{"name": "x", "type": "void"}]})")),
            "void parameter 'x'");
  EXPECT_EQ(declaration_failure(single_function(
                R"({"name": "f", "params": [{"name": "npb_status", "type": "u8"}]})")),
            "reserved parameter name 'npb_status'");
  EXPECT_EQ(declaration_failure(single_function(
                R"({"name": "f", "returns": "i8", "throws": "void"})")),
            "'void' cannot be an error type");
  EXPECT_EQ(declaration_failure(single_function(R"({"name": "2f"})")),
            "'name' is not an identifier: '2f'");
  EXPECT_EQ(declaration_failure(single_function(R"({"returns": "u8"})")),
            "missing 'name'");
  EXPECT_EQ(declaration_failure(R"({"module": "m"})"), "missing 'header'");
  EXPECT_TRUE(contains(declaration_failure("{\"module\": "), "invalid JSON"));
  // misspelled keys are not silently ignored
  EXPECT_TRUE(contains(
      declaration_failure(single_function(R"({"name": "f", "asynk": true})")),
      "invalid JSON"));
}

TEST(Classifier, Symbols)
{
  Context ctx("clock.json");
  auto sigs = classify_text(ctx, kClockModule);
  ASSERT_EQ(sigs.size(), 6u);

  const auto& now = sigs[0];
  EXPECT_FALSE(now.is_async);
  EXPECT_EQ(now.invoke_symbol, "npbridge_clock_fn_now");
  EXPECT_EQ(now.poll_symbol, "");
  EXPECT_EQ(now.executor, "");
  EXPECT_EQ(now.combo, "");

  const auto& wait = sigs[1];
  EXPECT_EQ(wait.poll_symbol, "npbridge_clock_fn_wait_poll");
  EXPECT_EQ(wait.release_symbol, "npbridge_clock_fn_wait_release");
  EXPECT_EQ(wait.executor, "default");
  EXPECT_EQ(wait.combo, "void");

  const auto& read_config = sigs[2];
  EXPECT_EQ(read_config.executor, "io");
  EXPECT_EQ(read_config.combo,
            "map_string_sequence_i32_or_record_native_clock_ConfigError");
  // same result shape, same combo
  EXPECT_EQ(sigs[3].combo, read_config.combo);

  const auto& ring = sigs[4];
  EXPECT_EQ(ring.qualified_name, "clock::Alarm::ring");
  EXPECT_EQ(ring.invoke_symbol, "npbridge_clock_method_Alarm_ring");
  ASSERT_NE(ring.receiver, nullptr);
  EXPECT_EQ(ring.receiver->name, "Alarm");
  ASSERT_EQ(ring.params.size(), 1u);
  EXPECT_EQ(ring.params[0].name, "times");
  EXPECT_EQ(ring.combo, "bool");

  EXPECT_EQ(sigs[5].invoke_symbol, "npbridge_clock_method_Alarm_armed");
}

TEST(Classifier, MisplacedReceiver)
{
  EXPECT_EQ(classification_failure(single_method(
                R"({"name": "m", "params": [{"name": "x", "type": "u8"},
                                             {"name": "self", "type": "self"}]})")),
            "misplaced receiver");
  EXPECT_EQ(classification_failure(single_method(
                R"({"name": "m", "params": [{"name": "self", "type": "self"},
                                             {"name": "other", "type": "self"}]})")),
            "misplaced receiver");
  EXPECT_EQ(classification_failure(single_function(
                R"({"name": "f", "params": [{"name": "self", "type": "self"}]})")),
            "misplaced receiver");
}

TEST(Classifier, AssociatedFunctionUnsupported)
{
  EXPECT_EQ(classification_failure(single_method(
                R"({"name": "make", "returns": "object:m::Obj"})")),
            "associated functions unsupported");
}

TEST(Classifier, ExecutorDirective)
{
  EXPECT_EQ(classification_failure(
                single_function(R"({"name": "f", "executor": "io"})")),
            "directive only valid on asynchronous exports");
  EXPECT_EQ(classification_failure(single_function(
                R"({"name": "f", "async": true, "executor": ""})")),
            "empty executor name");
  EXPECT_EQ(classification_failure(single_function(
                R"({"name": "f", "async": true, "executor": "gpu"})")),
            "");
}

TEST(Classifier, DuplicateExport)
{
  EXPECT_EQ(classification_failure(
                single_function(R"({"name": "f"}, {"name": "f"})")),
            "duplicate export");
}

TEST(Classifier, ErrorCarriesTheDeclaration)
{
  Context ctx("m.json");
  try {
    classify_text(ctx, single_method(R"({"name": "make"})"));
    FAIL() << "classified an associated function";
  } catch (const classification_error& ex) {
    EXPECT_EQ(ex.file_path, "m.json");
    EXPECT_EQ(ex.declaration, "m::Obj::make");
  }
}

TEST(Builders, CppScaffolding)
{
  Context ctx("clock.json");
  auto sigs = classify_text(ctx, kClockModule);
  auto text = build<builders::CppScaffoldingBuilder>(ctx, sigs);

  EXPECT_TRUE(contains(text, "#include \"clock.hpp\""));
  EXPECT_TRUE(contains(
      text, "uint64_t npbridge_clock_fn_now(npbridge_call_status* npb_status)"));
  EXPECT_TRUE(contains(text, "native::clock::now()"));
  EXPECT_TRUE(contains(
      text, "npbridge_future* npbridge_clock_fn_wait(uint32_t ms, "
            "npbridge_call_status* npb_status)"));
  EXPECT_TRUE(contains(text, "npbridge::start_future<void, npbridge::NoError>"));
  EXPECT_TRUE(contains(text, "npbridge::Executors::instance().get(\"io\")"));
  EXPECT_TRUE(contains(
      text, "npbridge::call_with_result<npbridge::NoError>(npb_status"));
  EXPECT_TRUE(contains(text, "npbridge::lift_arg<npbridge::ObjectPtr<"
                             "native::clock::Alarm>>(\"self\", self)"));
  EXPECT_TRUE(contains(text, "arg_self->armed()"));

  // one shared poll/release pair per result shape
  const std::string combo_poll =
      "bool npbridge_clock_future_poll_map_string_sequence_i32_or_record_"
      "native_clock_ConfigError(";
  auto first = text.find(combo_poll);
  ASSERT_NE(first, std::string::npos);
  EXPECT_EQ(text.find(combo_poll, first + 1), std::string::npos);
  EXPECT_TRUE(contains(text, "npbridge::future_poll<std::map<std::string, "
                             "std::vector<int32_t>>, "
                             "native::clock::ConfigError>"));

  EXPECT_TRUE(contains(text, "npbridge::MetadataRegistrar npbgen_export_5"));
  EXPECT_FALSE(contains(text, "npbgen_export_6"));
}

TEST(Builders, CHeader)
{
  Context ctx("clock.json");
  auto sigs = classify_text(ctx, kClockModule);
  auto text = build<builders::CHeaderBuilder>(ctx, sigs);

  EXPECT_TRUE(contains(text, "#include <npbridge/abi.h>"));
  EXPECT_TRUE(contains(text, "extern \"C\" {"));
  EXPECT_TRUE(contains(
      text, "NPBRIDGE_IMPORT_ATTR bool npbridge_clock_fn_wait_poll("
            "npbridge_future* handle, npbridge_completion_callback callback, "
            "void* callback_env, int8_t* out, "
            "npbridge_call_status* npb_status);"));
  EXPECT_TRUE(contains(
      text, "NPBRIDGE_IMPORT_ATTR npbridge_future* "
            "npbridge_clock_method_Alarm_ring(npbridge_object_handle self, "
            "uint8_t times, npbridge_call_status* npb_status);"));
  EXPECT_TRUE(contains(text, "void npbridge_clock_future_release_bool("));
  EXPECT_TRUE(contains(
      text, "npbridge_future* npbridge_clock_fn_poll_sensor(int32_t id, "));
}

TEST(Builders, Metadata)
{
  Context ctx("clock.json");
  auto sigs = classify_text(ctx, kClockModule);

  builders::MetadataBuilder builder(&ctx, std::filesystem::path{});
  builder.emit_module_begin();
  for (const auto& sig : sigs)
    builder.emit_export(sig);
  builder.emit_module_end();

  const auto& record = builder.record();
  EXPECT_EQ(record.version, 1);
  EXPECT_EQ(record.module, "clock");
  ASSERT_EQ(record.exports.size(), 6u);

  const auto& now = record.exports[0];
  EXPECT_FALSE(now.async);
  EXPECT_EQ(now.success_type, "u64");
  EXPECT_EQ(now.error_type, "");
  EXPECT_FALSE(now.poll_symbol.has_value());

  const auto& read_config = record.exports[2];
  EXPECT_EQ(read_config.name, "read_config");
  EXPECT_EQ(read_config.success_type, "map<string,sequence<i32>>");
  EXPECT_EQ(read_config.error_type, "record:native::clock::ConfigError");
  EXPECT_TRUE(read_config.async);
  EXPECT_EQ(read_config.executor, "io");
  ASSERT_EQ(read_config.params.size(), 1u);
  EXPECT_EQ(read_config.params.front().type, "string");

  const auto& ring = record.exports[4];
  EXPECT_EQ(ring.receiver, "Alarm");
  EXPECT_EQ(ring.poll_symbol, "npbridge_clock_method_Alarm_ring_poll");

  auto json = glz::write_json(record);
  ASSERT_TRUE(json.has_value());
  EXPECT_TRUE(contains(*json, R"("invoke_symbol":"npbridge_clock_fn_now")"));
  EXPECT_TRUE(contains(*json, R"("release_symbol":"npbridge_clock_fn_wait_release")"));
}
