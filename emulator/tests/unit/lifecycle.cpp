#include "../sandbox.hpp"

#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/lifecycle.hpp>
#include <lambdalocal/emulator/log_tail.hpp>
#include <lambdalocal/emulator/state.hpp>
#include <lambdalocal/emulator/supervisor.hpp>

#include <csignal>

#include <gtest/gtest.h>

using namespace lambdalocal::emulator;
using namespace std::chrono_literals;

class LifecycleTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    cfg.set_defaults();
    cfg.bootstrap.paths = {sandbox.write("bootstrap", "#!/bin/sh\nexec sleep 30\n")};
  }

  void create()
  {
    supervisor = std::make_unique<Supervisor>(cfg, state, tail);
    lifecycle = std::make_unique<Lifecycle>(cfg, state, *supervisor);
  }

  void TearDown() override
  {
    lifecycle.reset();
    supervisor.reset();
  }

  ContextPtr make_context()
  {
    return std::make_shared<Context>(cfg.function, nullptr);
  }

  Sandbox sandbox;
  config::Emulator cfg;
  RuntimeState state;
  std::shared_ptr<LogTail> tail = std::make_shared<LogTail>();
  std::unique_ptr<Supervisor> supervisor;
  std::unique_ptr<Lifecycle> lifecycle;
};

TEST_F(LifecycleTest, FirstExitCodeWins)
{
  create();
  lifecycle->start();

  lifecycle->shutdown(3);
  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 3);
}

TEST_F(LifecycleTest, ShutdownKillsWorker)
{
  create();
  auto ctx = make_context();
  state.dispatch(ctx);
  ASSERT_TRUE(supervisor->ensure_running(ctx));
  lifecycle->start();

  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 0);

  EXPECT_FALSE(supervisor->running());
  ASSERT_TRUE(ctx->error().has_value());
  EXPECT_EQ(ctx->error()->kind, ErrorKind::CRASH);
}

TEST_F(LifecycleTest, RestartWithoutStayOpenExits)
{
  create();
  lifecycle->start();

  lifecycle->restart();
  EXPECT_EQ(lifecycle->wait(), Lifecycle::EXIT_RESTART);
}

TEST_F(LifecycleTest, RestartWithStayOpen)
{
  cfg.stay_open = true;
  create();

  auto ctx = make_context();
  state.dispatch(ctx);
  ASSERT_TRUE(supervisor->ensure_running(ctx));
  ASSERT_FALSE(state.transition(State::INVOKE_NEXT).has_value());

  lifecycle->handle_restart();

  EXPECT_FALSE(supervisor->running());
  EXPECT_EQ(state.state(), State::INIT);
  ASSERT_TRUE(ctx->error().has_value());
  EXPECT_EQ(ctx->error()->kind, ErrorKind::CRASH);

  // The emulator itself keeps running.
  lifecycle->start();
  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 0);
}

TEST_F(LifecycleTest, RestartExternalRuntimeExits)
{
  cfg.stay_open = true;
  cfg.bootstrap.external = true;
  create();
  lifecycle->start();

  lifecycle->restart();
  EXPECT_EQ(lifecycle->wait(), Lifecycle::EXIT_RESTART);
}

TEST_F(LifecycleTest, WorkerExitInOneShot)
{
  create();
  lifecycle->start();

  // Intentional exits and exits between invocations are ignored.
  lifecycle->worker_exited(0, true, false);
  lifecycle->worker_exited(0, false, false);

  state.dispatch(make_context());
  lifecycle->worker_exited(0, false, true);
  EXPECT_EQ(lifecycle->wait(), 1);
}

TEST_F(LifecycleTest, WorkerExitAfterReplyInOneShot)
{
  create();
  lifecycle->start();

  auto ctx = make_context();
  state.dispatch(ctx);
  ctx->set_reply("{\"n\":2}");
  ASSERT_TRUE(ctx->complete());

  // The watcher lost the race against the reply, the invocation result decides.
  lifecycle->worker_exited(0, false, false);
  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 0);
}

TEST_F(LifecycleTest, WorkerExitInStayOpen)
{
  cfg.stay_open = true;
  create();
  lifecycle->start();

  state.dispatch(make_context());
  lifecycle->worker_exited(0, false, true);

  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 0);
}

TEST_F(LifecycleTest, SignalRestart)
{
  create();
  Lifecycle::install_signal_handlers(lifecycle.get());
  lifecycle->start();

  std::raise(SIGHUP);
  EXPECT_EQ(lifecycle->wait(), Lifecycle::EXIT_RESTART);
}

TEST_F(LifecycleTest, SignalShutdown)
{
  cfg.stay_open = true;
  create();
  Lifecycle::install_signal_handlers(lifecycle.get());
  lifecycle->start();

  std::raise(SIGTERM);
  EXPECT_EQ(lifecycle->wait(), 0);
}

TEST_F(LifecycleTest, WatchRestartsWorker)
{
  Sandbox code;
  std::filesystem::create_directories(code.root / "nested" / "deeper");

  cfg.stay_open = true;
  cfg.watch.enabled = true;
  cfg.watch.paths = {code.root.string(), code.path("missing")};
  cfg.watch.debounce = 50;
  create();

  EXPECT_EQ(lifecycle->watched_directories(), 3);

  ASSERT_TRUE(supervisor->ensure_running(nullptr));
  lifecycle->start();

  code.write("nested/deeper/handler.py", "print('changed')\n", false);
  EXPECT_TRUE(wait_for([this]() { return !supervisor->running(); }, 3000ms));

  lifecycle->shutdown(0);
  EXPECT_EQ(lifecycle->wait(), 0);
}
