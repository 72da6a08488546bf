#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/context.hpp>
#include <lambdalocal/emulator/log_tail.hpp>

#include <thread>

#include <gtest/gtest.h>
#include <json/json.h>

using namespace lambdalocal::emulator;
using namespace std::chrono_literals;

class ContextTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    function.set_defaults();
  }

  config::Function function;
};

Json::Value parse_json(const std::string& str)
{
  Json::Value root;
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader{builder.newCharReader()};
  std::string errors;
  EXPECT_TRUE(reader->parse(str.data(), str.data() + str.size(), &root, &errors)) << errors;
  return root;
}

TEST(InvocationType, Parse)
{
  EXPECT_EQ(parse_invocation_type(""), InvocationType::REQUEST_RESPONSE);
  EXPECT_EQ(parse_invocation_type("RequestResponse"), InvocationType::REQUEST_RESPONSE);
  EXPECT_EQ(parse_invocation_type("Event"), InvocationType::EVENT);
  EXPECT_EQ(parse_invocation_type("DryRun"), InvocationType::DRY_RUN);
  EXPECT_FALSE(parse_invocation_type("Later").has_value());
  EXPECT_FALSE(parse_invocation_type("event").has_value());
}

TEST(InvocationErrorTest, Parse)
{
  auto error = InvocationError::parse(
      ErrorKind::UNHANDLED,
      R"({"errorMessage": "boom", "errorType": "ValueError", "stackTrace": ["a.py:1", "b.py:2"]})",
      std::nullopt
  );
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::UNHANDLED);
  EXPECT_EQ(error->message, "boom");
  EXPECT_EQ(error->type, "ValueError");
  ASSERT_EQ(error->stack_trace.size(), 2);
  EXPECT_EQ(error->stack_trace[1], "b.py:2");
  EXPECT_EQ(error->cause, nullptr);
}

TEST(InvocationErrorTest, TypeFromHeader)
{
  auto error =
      InvocationError::parse(ErrorKind::UNHANDLED, R"({"errorMessage": "boom"})", "Header.Type");
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->type, "Header.Type");

  // The body wins over the header.
  error = InvocationError::parse(
      ErrorKind::UNHANDLED, R"({"errorMessage": "boom", "errorType": "Body.Type"})", "Header.Type"
  );
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->type, "Body.Type");
}

TEST(InvocationErrorTest, Malformed)
{
  EXPECT_FALSE(InvocationError::parse(ErrorKind::UNHANDLED, "not json", std::nullopt));
  EXPECT_FALSE(InvocationError::parse(ErrorKind::UNHANDLED, R"("string")", std::nullopt));
  EXPECT_FALSE(InvocationError::parse(ErrorKind::UNHANDLED, "[1, 2]", std::nullopt));
  EXPECT_FALSE(
      InvocationError::parse(ErrorKind::UNHANDLED, R"({"errorMessage": 5})", std::nullopt)
  );
  EXPECT_FALSE(
      InvocationError::parse(ErrorKind::UNHANDLED, R"({"stackTrace": "line"})", std::nullopt)
  );
}

TEST(InvocationErrorTest, Cause)
{
  auto error = InvocationError::parse(
      ErrorKind::UNHANDLED,
      R"({"errorMessage": "outer", "cause": {"errorMessage": "inner", "errorType": "IOError"}})",
      std::nullopt
  );
  ASSERT_TRUE(error.has_value());
  ASSERT_NE(error->cause, nullptr);
  EXPECT_EQ(error->cause->message, "inner");
  EXPECT_EQ(error->cause->type, "IOError");

  auto json = error->json();
  EXPECT_EQ(json["cause"]["errorMessage"].asString(), "inner");
}

TEST(InvocationErrorTest, CauseDepthLimited)
{
  std::string body = R"({"errorMessage": "leaf"})";
  for (int i = 0; i <= InvocationError::MAX_CAUSE_DEPTH; ++i) {
    body = fmt::format(R"({{"errorMessage": "level", "cause": {}}})", body);
  }
  EXPECT_FALSE(InvocationError::parse(ErrorKind::UNHANDLED, body, std::nullopt).has_value());
}

TEST(InvocationErrorTest, Crash)
{
  auto error = InvocationError::crash("abcd");
  auto json = parse_json(error.serialize());

  EXPECT_EQ(
      json["errorMessage"].asString(),
      "RequestId: abcd Error: Runtime exited without providing a reason"
  );
  EXPECT_EQ(json["errorType"].asString(), "Runtime.ExitError");
  EXPECT_FALSE(json.isMember("stackTrace"));
}

TEST(InvocationErrorTest, Timeout)
{
  // 2021-01-01T00:00:00.250Z
  std::chrono::system_clock::time_point now{std::chrono::milliseconds{1609459200250}};
  auto error = InvocationError::timeout("abcd", 3, now);

  EXPECT_EQ(error.kind, ErrorKind::TIMEOUT);
  EXPECT_EQ(error.message, "2021-01-01T00:00:00.250Z abcd Task timed out after 3.00 seconds");
  EXPECT_FALSE(error.type.has_value());

  auto json = parse_json(error.serialize());
  EXPECT_FALSE(json.isMember("errorType"));
}

TEST_F(ContextTest, Identity)
{
  function.timeout = 7;
  function.trace_id = "Root=1-00000000-000000000000000000000000";

  Context first{function, nullptr};
  Context second{function, nullptr};

  EXPECT_NE(first.request_id, second.request_id);
  EXPECT_EQ(first.function_arn, "arn:aws:lambda:us-east-1:000000000000:function:test");
  EXPECT_EQ(first.version, "$LATEST");
  EXPECT_EQ(first.trace_id, "Root=1-00000000-000000000000000000000000");
  EXPECT_EQ(first.deadline(), first.start + 7s);
  EXPECT_FALSE(first.has_expired());
  EXPECT_TRUE(first.has_expired(first.start + 7s));
}

TEST_F(ContextTest, CompleteOnce)
{
  Context ctx{function, nullptr};
  EXPECT_FALSE(ctx.completed());
  EXPECT_FALSE(ctx.wait_until(Context::clock_t::now() + 10ms));

  ctx.set_reply("first");
  EXPECT_TRUE(ctx.complete());
  EXPECT_TRUE(ctx.completed());
  EXPECT_TRUE(ctx.wait_until(Context::clock_t::now()));

  EXPECT_FALSE(ctx.complete(InvocationError::crash(ctx.request_id)));
  ctx.set_reply("second");

  EXPECT_EQ(ctx.reply(), "first");
  EXPECT_FALSE(ctx.error().has_value());
}

TEST_F(ContextTest, CompleteWakesWaiters)
{
  auto ctx = std::make_shared<Context>(function, nullptr);

  std::thread waiter{[ctx]() { ctx->wait(); }};
  std::this_thread::sleep_for(20ms);
  ctx->complete(InvocationError::crash(ctx->request_id));
  waiter.join();

  ASSERT_TRUE(ctx->error().has_value());
  EXPECT_EQ(ctx->error()->kind, ErrorKind::CRASH);
}

TEST_F(ContextTest, ExpiredBecomesTimeout)
{
  function.timeout = 1;
  Context ctx{function, nullptr, Context::clock_t::now() - 2s};

  ctx.set_reply("late");
  EXPECT_TRUE(ctx.complete());

  auto error = ctx.error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::TIMEOUT);
  EXPECT_NE(error->message.find(ctx.request_id), std::string::npos);
  EXPECT_NE(error->message.find("Task timed out after 1.00 seconds"), std::string::npos);
}

TEST_F(ContextTest, LogTail)
{
  Context ctx{function, nullptr};
  EXPECT_FALSE(ctx.log_result().has_value());

  ctx.record_log_tail("hello");
  EXPECT_EQ(ctx.log_tail(), "hello");
  EXPECT_EQ(ctx.log_result(), "aGVsbG8=");

  std::string large(Context::MAX_LOG_TAIL + 10, 'a');
  large.back() = 'z';
  ctx.record_log_tail(large);
  ASSERT_TRUE(ctx.log_tail().has_value());
  EXPECT_EQ(ctx.log_tail()->size(), Context::MAX_LOG_TAIL);
  EXPECT_EQ(ctx.log_tail()->back(), 'z');
}

TEST_F(ContextTest, Report)
{
  auto tail = std::make_shared<LogTail>();
  auto logger = create_report_logger(tail);

  function.memory_size = 256;
  Context ctx{function, logger};
  ctx.record_worker_start(ctx.start);
  ctx.log_start();
  ctx.set_reply("{}");
  ctx.complete();

  auto contents = tail->contents();
  EXPECT_NE(
      contents.find(fmt::format("START RequestId: {} Version: $LATEST", ctx.request_id)),
      std::string::npos
  );
  EXPECT_NE(contents.find(fmt::format("END RequestId: {}", ctx.request_id)), std::string::npos);
  EXPECT_NE(contents.find(fmt::format("REPORT RequestId: {}", ctx.request_id)), std::string::npos);
  EXPECT_NE(contents.find("Init Duration: "), std::string::npos);
  EXPECT_NE(contents.find("Billed Duration: "), std::string::npos);
  EXPECT_NE(contents.find("Memory Size: 256 MB"), std::string::npos);
}

TEST_F(ContextTest, ReportWithoutColdStart)
{
  auto tail = std::make_shared<LogTail>();
  Context ctx{function, create_report_logger(tail)};
  ctx.complete();

  auto contents = tail->contents();
  EXPECT_NE(contents.find("REPORT RequestId: "), std::string::npos);
  EXPECT_EQ(contents.find("Init Duration: "), std::string::npos);
}
