#include <lambdalocal/emulator/config.hpp>
#include <lambdalocal/emulator/state.hpp>

#include <gtest/gtest.h>

using namespace lambdalocal::emulator;

class RuntimeStateTest : public ::testing::Test {
protected:
  void SetUp() override
  {
    function.set_defaults();
  }

  ContextPtr make_context()
  {
    return std::make_shared<Context>(function, nullptr);
  }

  config::Function function;
  RuntimeState state;
};

TEST(StateTransitions, Table)
{
  EXPECT_TRUE(is_valid_transition(State::INIT, State::INIT_ERROR));
  EXPECT_TRUE(is_valid_transition(State::INIT, State::INVOKE_NEXT));
  EXPECT_TRUE(is_valid_transition(State::INVOKE_NEXT, State::INVOKE_NEXT));
  EXPECT_TRUE(is_valid_transition(State::INVOKE_NEXT, State::INVOKE_RESPONSE));
  EXPECT_TRUE(is_valid_transition(State::INVOKE_NEXT, State::INVOKE_ERROR));
  EXPECT_TRUE(is_valid_transition(State::INVOKE_RESPONSE, State::INVOKE_NEXT));
  EXPECT_TRUE(is_valid_transition(State::INVOKE_ERROR, State::INVOKE_NEXT));

  EXPECT_FALSE(is_valid_transition(State::INIT, State::INVOKE_RESPONSE));
  EXPECT_FALSE(is_valid_transition(State::INIT, State::INVOKE_ERROR));
  EXPECT_FALSE(is_valid_transition(State::INVOKE_NEXT, State::INIT_ERROR));
  EXPECT_FALSE(is_valid_transition(State::INVOKE_RESPONSE, State::INVOKE_RESPONSE));
  EXPECT_FALSE(is_valid_transition(State::INVOKE_RESPONSE, State::INVOKE_ERROR));
  EXPECT_FALSE(is_valid_transition(State::INVOKE_ERROR, State::INVOKE_RESPONSE));
  EXPECT_FALSE(is_valid_transition(State::INIT_ERROR, State::INVOKE_NEXT));
  EXPECT_FALSE(is_valid_transition(State::INIT_ERROR, State::INIT_ERROR));

  for (auto from : {State::INIT, State::INIT_ERROR, State::INVOKE_NEXT, State::INVOKE_RESPONSE,
                    State::INVOKE_ERROR}) {
    EXPECT_FALSE(is_valid_transition(from, State::INIT));
  }
}

TEST(StateTransitions, ErrorMessage)
{
  auto error = ProtocolError::invalid_transition(State::INIT, State::INVOKE_RESPONSE);
  EXPECT_EQ(error.status, 403);
  EXPECT_EQ(error.type, "InvalidStateTransition");
  EXPECT_EQ(
      error.message, "Transition from STATE_INIT to STATE_INVOKE_RESPONSE is not allowed."
  );
}

TEST_F(RuntimeStateTest, Transition)
{
  EXPECT_EQ(state.state(), State::INIT);

  auto error = state.transition(State::INVOKE_RESPONSE);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->status, 403);
  EXPECT_EQ(state.state(), State::INIT);

  EXPECT_FALSE(state.transition(State::INVOKE_NEXT).has_value());
  EXPECT_EQ(state.state(), State::INVOKE_NEXT);

  EXPECT_FALSE(state.transition(State::INVOKE_NEXT).has_value());
  EXPECT_EQ(state.state(), State::INVOKE_NEXT);
}

TEST_F(RuntimeStateTest, RequestIdChecked)
{
  auto ctx = make_context();
  ContextPtr served;

  // Nothing fetched yet.
  auto error = state.transition(State::INVOKE_RESPONSE, ctx->request_id, served);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->status, 400);
  EXPECT_EQ(error->type, "InvalidRequestID");

  ASSERT_FALSE(state.transition(State::INVOKE_NEXT).has_value());
  state.serve(ctx);

  error = state.transition(State::INVOKE_RESPONSE, "other-id", served);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->status, 400);
  EXPECT_EQ(served, nullptr);
  EXPECT_EQ(state.state(), State::INVOKE_NEXT);

  error = state.transition(State::INVOKE_RESPONSE, ctx->request_id, served);
  EXPECT_FALSE(error.has_value());
  EXPECT_EQ(served, ctx);
  EXPECT_EQ(state.state(), State::INVOKE_RESPONSE);

  // Second response for the same invocation.
  served = nullptr;
  error = state.transition(State::INVOKE_ERROR, ctx->request_id, served);
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->status, 403);
  EXPECT_EQ(served, nullptr);
}

TEST_F(RuntimeStateTest, Reset)
{
  auto ctx = make_context();
  ASSERT_FALSE(state.transition(State::INVOKE_NEXT).has_value());
  state.serve(ctx);

  state.reset();
  EXPECT_EQ(state.state(), State::INIT);
  EXPECT_EQ(state.served(), nullptr);

  EXPECT_FALSE(state.transition(State::INIT_ERROR).has_value());
  EXPECT_TRUE(state.transition(State::INVOKE_NEXT).has_value());
}

TEST_F(RuntimeStateTest, Inflight)
{
  auto first = make_context();
  auto second = make_context();

  state.dispatch(first);
  EXPECT_EQ(state.inflight(), first);

  state.finish(second);
  EXPECT_EQ(state.inflight(), first);

  state.finish(first);
  EXPECT_EQ(state.inflight(), nullptr);
}
