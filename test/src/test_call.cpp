#include <stdexcept>

#include <gtest/gtest.h>

#include <boost/fusion/include/adapt_struct.hpp>

#include <npbridge/call.hpp>

namespace calltest {
struct ParseError {
  uint32_t position;
  std::string message;
};
} // namespace calltest

BOOST_FUSION_ADAPT_STRUCT(calltest::ParseError, position, message)

using namespace npbridge;

namespace {
std::string payload_text(npbridge_call_status& status)
{
  auto buf = flat_buffer::adopt(status.payload);
  status.payload = npbridge_buffer{0, 0, nullptr};
  return std::string(reinterpret_cast<const char*>(buf.data_ptr()),
                     buf.size());
}

npbridge_call_status fresh_status()
{
  // garbage the entry must overwrite
  return npbridge_call_status{77, npbridge_buffer{0, 0, nullptr}};
}
} // namespace

TEST(Call, SuccessResetsStatus)
{
  auto status = fresh_status();
  auto v = call_with_output(&status, [] { return 41 + 1; });
  EXPECT_EQ(v, 42);
  EXPECT_EQ(status.code, NPBRIDGE_CALL_SUCCESS);
  EXPECT_EQ(status.payload.len, 0u);
  EXPECT_EQ(status.payload.data, nullptr);
}

TEST(Call, DeclaredErrorBecomesTypedError)
{
  auto status = fresh_status();
  auto v = call_with_result<calltest::ParseError>(&status, []() -> int32_t {
    throw calltest::ParseError{12, "unexpected token"};
  });
  EXPECT_EQ(v, 0);
  ASSERT_EQ(status.code, NPBRIDGE_CALL_TYPED_ERROR);

  auto err = lift_from_buffer<calltest::ParseError>(status.payload);
  EXPECT_EQ(err.position, 12u);
  EXPECT_EQ(err.message, "unexpected token");
}

TEST(Call, UndeclaredExceptionBecomesFault)
{
  auto status = fresh_status();
  call_with_result<calltest::ParseError>(
      &status, [] { throw std::runtime_error("disk on fire"); });
  ASSERT_EQ(status.code, NPBRIDGE_CALL_UNRECOVERABLE_FAULT);
  EXPECT_EQ(payload_text(status), "disk on fire");
}

TEST(Call, PanicIsContained)
{
  auto status = fresh_status();
  auto v = call_with_output(&status, []() -> uint64_t {
    panic("invariant violated");
  });
  EXPECT_EQ(v, 0u);
  ASSERT_EQ(status.code, NPBRIDGE_CALL_UNRECOVERABLE_FAULT);
  EXPECT_EQ(payload_text(status), "panic: invariant violated");
}

TEST(Call, NonStandardExceptionIsContained)
{
  auto status = fresh_status();
  call_with_output(&status, [] { throw 5; });
  ASSERT_EQ(status.code, NPBRIDGE_CALL_UNRECOVERABLE_FAULT);
  EXPECT_EQ(payload_text(status), "unknown exception");
}

TEST(Call, LiftFailureNamesTheArgument)
{
  auto status = fresh_status();
  call_with_output(&status, [] {
    auto flag = lift_arg<bool>("do_fail", int8_t{9});
    return flag;
  });
  ASSERT_EQ(status.code, NPBRIDGE_CALL_UNRECOVERABLE_FAULT);
  EXPECT_EQ(payload_text(status),
            "failed to convert arg 'do_fail': unexpected byte for Boolean");
}

TEST(Call, ConversionFaultIsNotATypedError)
{
  // a malformed argument is never reported as the declared error
  auto status = fresh_status();
  call_with_result<calltest::ParseError>(&status, [] {
    return lift_arg<std::string>("text", npbridge_buffer{1, 2, nullptr});
  });
  ASSERT_EQ(status.code, NPBRIDGE_CALL_UNRECOVERABLE_FAULT);
  EXPECT_EQ(payload_text(status),
            "failed to convert arg 'text': buffer length exceeds capacity");
}

TEST(Call, VoidBody)
{
  auto status = fresh_status();
  bool ran = false;
  call_with_output(&status, [&] { ran = true; });
  EXPECT_TRUE(ran);
  EXPECT_EQ(status.code, NPBRIDGE_CALL_SUCCESS);
}
