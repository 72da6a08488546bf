#include "../sandbox.hpp"

#include <lambdalocal/common/exceptions.hpp>
#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/dispatcher.hpp>
#include <lambdalocal/emulator/handoff.hpp>
#include <lambdalocal/emulator/log_tail.hpp>
#include <lambdalocal/emulator/runtime.hpp>
#include <lambdalocal/emulator/state.hpp>
#include <lambdalocal/emulator/supervisor.hpp>

#include <thread>

#include <gtest/gtest.h>

using namespace lambdalocal::emulator;
using namespace std::chrono_literals;

// The bootstrap only keeps a process alive, the tests drive the runtime
// protocol directly in place of a real worker.
class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    cfg.set_defaults();
    cfg.stay_open = true;
    cfg.function.timeout = 2;
    cfg.bootstrap.paths = {sandbox.path("bootstrap")};
    sandbox.write("bootstrap", "#!/bin/sh\nexec sleep 30\n");
  }

  void TearDown() override
  {
    handoff.close();
    if (worker.joinable()) {
      worker.join();
    }
  }

  void start()
  {
    supervisor = std::make_unique<Supervisor>(cfg, state, tail);
    dispatcher =
        std::make_unique<Dispatcher>(cfg, state, handoff, *supervisor, tail, report_logger);
  }

  ContextPtr fetch(std::chrono::milliseconds timeout = 5000ms)
  {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    ContextPtr ctx;
    auto error = runtime.next(ctx, [deadline]() {
      return std::chrono::steady_clock::now() > deadline;
    });
    EXPECT_FALSE(error.has_value());
    return ctx;
  }

  // Answers the given number of invocations by echoing their payload.
  void echo_worker(int invocations)
  {
    worker = std::thread{[this, invocations]() {
      for (int i = 0; i < invocations; ++i) {
        auto ctx = fetch();
        if (!ctx) {
          return;
        }
        EXPECT_FALSE(runtime.respond(ctx->request_id, ctx->payload, WorkerHeaders{}).has_value());
      }
    }};
  }

  Sandbox sandbox;
  config::Emulator cfg;
  std::shared_ptr<LogTail> tail = std::make_shared<LogTail>();
  std::shared_ptr<spdlog::logger> report_logger = create_report_logger(tail);
  RuntimeState state;
  Handoff handoff;
  Runtime runtime{state, handoff, 6 * 1024 * 1024};
  std::unique_ptr<Supervisor> supervisor;
  std::unique_ptr<Dispatcher> dispatcher;
  std::thread worker;
};

TEST_F(DispatcherTest, CreateContext)
{
  start();
  auto ctx = dispatcher->create_context(
      "{}", InvocationType::EVENT, std::string{"eyJhIjoxfQ=="}, LogType::TAIL
  );

  EXPECT_EQ(ctx->payload, "{}");
  EXPECT_EQ(ctx->type, InvocationType::EVENT);
  EXPECT_EQ(ctx->log_type, LogType::TAIL);
  EXPECT_EQ(ctx->client_context, "eyJhIjoxfQ==");
  EXPECT_EQ(ctx->timeout, 2s);
  EXPECT_FALSE(ctx->completed());
}

TEST_F(DispatcherTest, Invoke)
{
  start();
  echo_worker(2);

  auto ctx = dispatcher->create_context(R"({"n": 1})");
  dispatcher->invoke(ctx);

  ASSERT_TRUE(ctx->completed());
  EXPECT_EQ(ctx->reply(), R"({"n": 1})");
  EXPECT_FALSE(ctx->error().has_value());
  EXPECT_EQ(state.inflight(), nullptr);
  EXPECT_TRUE(supervisor->running());

  // The second invocation reuses the warm worker.
  auto pid = supervisor->pid();
  ctx = dispatcher->create_context(R"({"n": 2})");
  dispatcher->invoke(ctx);

  EXPECT_EQ(ctx->reply(), R"({"n": 2})");
  EXPECT_EQ(supervisor->pid(), pid);
}

TEST_F(DispatcherTest, SerializesConcurrentInvocations)
{
  start();
  echo_worker(2);

  auto first = dispatcher->create_context("first");
  auto second = dispatcher->create_context("second");

  std::thread other{[&]() { dispatcher->invoke(second); }};
  dispatcher->invoke(first);
  other.join();

  EXPECT_EQ(first->reply(), "first");
  EXPECT_EQ(second->reply(), "second");
}

TEST_F(DispatcherTest, Timeout)
{
  cfg.function.timeout = 1;
  start();

  // The worker fetches the invocation and never answers.
  worker = std::thread{[this]() { fetch(); }};

  auto begin = std::chrono::steady_clock::now();
  auto ctx = dispatcher->create_context("{}");
  dispatcher->invoke(ctx);
  auto elapsed = std::chrono::steady_clock::now() - begin;

  EXPECT_GE(elapsed, 900ms);
  EXPECT_LT(elapsed, 3s);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::TIMEOUT);
  EXPECT_NE(error->message.find("Task timed out after 1.00 seconds"), std::string::npos);

  // A timed out worker is replaced on the next invocation.
  EXPECT_FALSE(supervisor->running());
  EXPECT_EQ(state.state(), State::INIT);
}

TEST_F(DispatcherTest, TimeoutWithoutFetch)
{
  cfg.function.timeout = 1;
  start();

  auto ctx = dispatcher->create_context("{}");
  dispatcher->invoke(ctx);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::TIMEOUT);

  // Nothing stays behind in the handoff.
  Message msg = handoff.receive([]() { return true; });
  EXPECT_TRUE(std::holds_alternative<WakeUp>(msg));
}

TEST_F(DispatcherTest, WorkerCrash)
{
  sandbox.write("bootstrap", "#!/bin/sh\nexit 1\n");
  start();

  auto ctx = dispatcher->create_context("{}");
  dispatcher->invoke(ctx);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::CRASH);
  EXPECT_EQ(
      error->message,
      fmt::format("RequestId: {} Error: Runtime exited without providing a reason", ctx->request_id)
  );
  EXPECT_EQ(state.inflight(), nullptr);
}

TEST_F(DispatcherTest, MissingBootstrap)
{
  cfg.bootstrap.paths = {sandbox.path("missing")};
  start();

  auto ctx = dispatcher->create_context("{}");
  EXPECT_THROW(dispatcher->invoke(ctx), lambdalocal::common::BootstrapNotFound);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::BOOTSTRAP_NOT_FOUND);
  EXPECT_EQ(error->type, "Runtime.InvalidEntrypoint");
  EXPECT_EQ(state.inflight(), nullptr);
}

TEST_F(DispatcherTest, InitError)
{
  start();
  worker = std::thread{[this]() {
    bool well_formed = false;
    auto error = runtime.init_error(
        R"({"errorMessage": "bad handler", "errorType": "Runtime.HandlerNotFound"})",
        WorkerHeaders{}, nullptr, well_formed
    );
    EXPECT_FALSE(error.has_value());
  }};

  auto ctx = dispatcher->create_context("{}");
  dispatcher->invoke(ctx);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::INIT_ERROR);
  EXPECT_EQ(error->message, "bad handler");
  EXPECT_EQ(error->type, "Runtime.HandlerNotFound");

  // The failed worker is discarded.
  EXPECT_FALSE(supervisor->running());
  EXPECT_EQ(state.state(), State::INIT);
}

TEST_F(DispatcherTest, LogTail)
{
  sandbox.write("bootstrap", "#!/bin/sh\necho from-worker\nexec sleep 30\n");
  start();

  worker = std::thread{[this]() {
    auto ctx = fetch();
    ASSERT_NE(ctx, nullptr);
    EXPECT_TRUE(wait_for(
        [this]() { return tail->contents().find("from-worker") != std::string::npos; }, 2000ms
    ));
    EXPECT_FALSE(runtime.respond(ctx->request_id, "{}", WorkerHeaders{}).has_value());
  }};

  auto ctx = dispatcher->create_context(
      "{}", InvocationType::REQUEST_RESPONSE, std::nullopt, LogType::TAIL
  );
  dispatcher->invoke(ctx);

  auto log = ctx->log_tail();
  ASSERT_TRUE(log.has_value());
  EXPECT_NE(log->find("from-worker"), std::string::npos);
  EXPECT_NE(log->find(fmt::format("START RequestId: {}", ctx->request_id)), std::string::npos);
  EXPECT_NE(log->find(fmt::format("REPORT RequestId: {}", ctx->request_id)), std::string::npos);
  EXPECT_TRUE(ctx->log_result().has_value());
}

TEST_F(DispatcherTest, ExternalWorker)
{
  cfg.bootstrap.external = true;
  cfg.bootstrap.paths = {sandbox.path("missing")};
  start();
  echo_worker(1);

  auto ctx = dispatcher->create_context(
      R"({"n": 1})", InvocationType::REQUEST_RESPONSE, std::nullopt, LogType::TAIL
  );
  dispatcher->invoke(ctx);

  ASSERT_TRUE(ctx->completed());
  EXPECT_EQ(ctx->reply(), R"({"n": 1})");
  EXPECT_FALSE(supervisor->running());
  // The external runtime reports its own tail, nothing is captured here.
  EXPECT_FALSE(ctx->log_tail().has_value());
}

TEST_F(DispatcherTest, Shutdown)
{
  start();
  handoff.close();

  auto ctx = dispatcher->create_context("{}");
  dispatcher->invoke(ctx);

  auto error = ctx->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->kind, ErrorKind::CRASH);
  EXPECT_FALSE(supervisor->running());
}
