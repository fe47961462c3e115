#include <gtest/gtest.h>
#include "framework/application/application.hpp"
#include "framework/context/application_call.hpp"
#include "framework/exception/pipeline_exceptions.hpp"
#include "framework/pipeline/pipeline.hpp"
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace kpipeline::framework;

class PipelineExecutionTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    req.version(11);
    req.method(boost::beast::http::verb::get);
    req.target("/test");
    for (int i = 0; i < 5; ++i)
    {
      phases.push_back(make_phase("P" + std::to_string(i + 1)));
    }
    call = std::make_unique<ApplicationCall>(application, req, res);
  }

  // Registers an interceptor that records `name` and proceeds.
  void record(Pipeline& pipeline, const PhasePtr& phase, const std::string& name)
  {
    pipeline.intercept(phase, [this, name](PipelineContext& context)
    {
      log.push_back(name);
      context.proceed();
    });
  }

  Application application;
  ApplicationCall::Request req;
  ApplicationCall::Response res;
  std::unique_ptr<ApplicationCall> call;
  std::vector<PhasePtr> phases;
  std::vector<std::string> log;
};

TEST_F(PipelineExecutionTest, RunsEveryInterceptorOnceInPhaseOrder)
{
  Pipeline pipeline("Test", phases);
  record(pipeline, phases[2], "c1");
  record(pipeline, phases[0], "a1");
  record(pipeline, phases[4], "e1");
  record(pipeline, phases[0], "a2");
  record(pipeline, phases[2], "c2");

  pipeline.execute(*call, std::any{});

  EXPECT_EQ(log, (std::vector<std::string>{"a1", "a2", "c1", "c2", "e1"}));
}

TEST_F(PipelineExecutionTest, EmptyPipelineReturnsSubjectUnchanged)
{
  Pipeline pipeline("Test", phases);

  const std::any result = pipeline.execute(*call, std::string("subject"));

  EXPECT_EQ(std::any_cast<std::string>(result), "subject");
}

TEST_F(PipelineExecutionTest, ReturningWithoutProceedingEndsTheChain)
{
  Pipeline pipeline("Test", phases);
  record(pipeline, phases[0], "first");
  pipeline.intercept(phases[1], [this](PipelineContext&)
  {
    log.push_back("stopper");
  });
  record(pipeline, phases[1], "after-stopper");
  record(pipeline, phases[3], "later-phase");

  ExecutionState state = ExecutionState::NotStarted;
  pipeline.intercept(phases[0], [&state](PipelineContext& context)
  {
    context.proceed();
    state = context.state();
  });

  pipeline.execute(*call, std::any{});

  EXPECT_EQ(log, (std::vector<std::string>{"first", "stopper"}));
  EXPECT_EQ(state, ExecutionState::Running);
}

TEST_F(PipelineExecutionTest, ShortCircuitedRunFinishes)
{
  Pipeline pipeline("Test", phases);
  pipeline.intercept(phases[0], [](PipelineContext&)
  {
  });

  PipelineContext context(*call, std::any{}, pipeline.interceptors(), call->cancellation().make_child());
  context.execute();

  EXPECT_EQ(context.state(), ExecutionState::Finished);
  EXPECT_TRUE(context.is_finished());
}

TEST_F(PipelineExecutionTest, FinishStopsAllLaterPhases)
{
  Pipeline pipeline("Test", phases);
  record(pipeline, phases[0], "p1");
  pipeline.intercept(phases[1], [this](PipelineContext& context)
  {
    log.push_back("p2-finish");
    context.finish();
    context.proceed();
  });
  record(pipeline, phases[1], "p2-late");
  record(pipeline, phases[2], "p3");
  record(pipeline, phases[3], "p4");
  record(pipeline, phases[4], "p5");

  pipeline.execute(*call, std::any{});

  EXPECT_EQ(log, (std::vector<std::string>{"p1", "p2-finish"}));
}

TEST_F(PipelineExecutionTest, ProceedWithReplacesSubjectDownstream)
{
  Pipeline pipeline("Test", phases);
  std::string seen_upstream_after;
  pipeline.intercept(phases[0], [&seen_upstream_after](PipelineContext& context)
  {
    context.proceed_with(std::string("converted"));
    seen_upstream_after = *context.subject_as<std::string>();
  });
  std::string seen_downstream;
  pipeline.intercept(phases[1], [&seen_downstream](PipelineContext& context)
  {
    seen_downstream = *context.subject_as<std::string>();
    context.proceed();
  });

  const std::any result = pipeline.execute(*call, std::string("raw"));

  EXPECT_EQ(seen_downstream, "converted");
  EXPECT_EQ(seen_upstream_after, "converted");
  EXPECT_EQ(std::any_cast<std::string>(result), "converted");
}

TEST_F(PipelineExecutionTest, ExceptionIsVisibleOnlyToEarlierInterceptors)
{
  Pipeline pipeline("Test", phases);
  bool earlier_caught = false;
  bool later_ran = false;
  pipeline.intercept(phases[0], [&earlier_caught](PipelineContext& context)
  {
    try
    {
      context.proceed();
    }
    catch (const std::runtime_error& e)
    {
      earlier_caught = std::string(e.what()) == "boom";
    }
  });
  pipeline.intercept(phases[1], [](PipelineContext&)
  {
    throw std::runtime_error("boom");
  });
  pipeline.intercept(phases[2], [&later_ran](PipelineContext& context)
  {
    later_ran = true;
    context.proceed();
  });

  EXPECT_NO_THROW(pipeline.execute(*call, std::any{}));
  EXPECT_TRUE(earlier_caught);
  EXPECT_FALSE(later_ran);
}

TEST_F(PipelineExecutionTest, CaughtExceptionDoesNotResumeDownstream)
{
  Pipeline pipeline("Test", phases);
  pipeline.intercept(phases[0], [this](PipelineContext& context)
  {
    try
    {
      context.proceed();
    }
    catch (const std::exception&)
    {
      log.push_back("caught");
      context.proceed();
    }
  });
  pipeline.intercept(phases[1], [](PipelineContext&)
  {
    throw std::logic_error("fail");
  });
  record(pipeline, phases[2], "downstream");

  pipeline.execute(*call, std::any{});

  EXPECT_EQ(log, (std::vector<std::string>{"caught"}));
}

TEST_F(PipelineExecutionTest, UncaughtExceptionFailsTheRun)
{
  Pipeline pipeline("Test", phases);
  pipeline.intercept(phases[0], [](PipelineContext& context)
  {
    context.proceed();
  });
  pipeline.intercept(phases[1], [](PipelineContext&)
  {
    throw NotFoundError("missing");
  });

  PipelineContext context(*call, std::any{}, pipeline.interceptors(), call->cancellation().make_child());

  EXPECT_THROW(context.execute(), NotFoundError);
  EXPECT_EQ(context.state(), ExecutionState::Failed);
  EXPECT_THROW(context.execute(), std::logic_error);
}

TEST_F(PipelineExecutionTest, ContextCannotBeExecutedTwice)
{
  Pipeline pipeline("Test", phases);
  PipelineContext context(*call, std::any{}, pipeline.interceptors(), call->cancellation().make_child());

  context.execute();

  EXPECT_EQ(context.state(), ExecutionState::Finished);
  EXPECT_THROW(context.execute(), std::logic_error);
}

TEST_F(PipelineExecutionTest, CurrentPhaseTracksRunningInterceptor)
{
  Pipeline pipeline("Test", phases);
  std::vector<PhasePtr> seen;
  pipeline.intercept(phases[0], [&seen](PipelineContext& context)
  {
    seen.push_back(context.current_phase());
    context.proceed();
    seen.push_back(context.current_phase());
  });
  pipeline.intercept(phases[3], [&seen](PipelineContext& context)
  {
    seen.push_back(context.current_phase());
    context.proceed();
  });

  pipeline.execute(*call, std::any{});

  EXPECT_EQ(seen, (std::vector<PhasePtr>{phases[0], phases[3], phases[0]}));
}

TEST_F(PipelineExecutionTest, NestedRunKeepsParentPosition)
{
  Pipeline outer("Outer", phases);
  Pipeline inner("Inner", {phases[0]});
  record(inner, phases[0], "inner");

  outer.intercept(phases[0], [this, &inner](PipelineContext& context)
  {
    log.push_back("outer-1");
    inner.execute(context.call(), std::any{});
    context.proceed();
  });
  record(outer, phases[1], "outer-2");

  outer.execute(*call, std::any{});

  EXPECT_EQ(log, (std::vector<std::string>{"outer-1", "inner", "outer-2"}));
}

TEST_F(PipelineExecutionTest, NestedRunCanBeCancelledAlone)
{
  Pipeline outer("Outer", phases);
  Pipeline inner("Inner", {phases[0]});
  inner.intercept(phases[0], [](PipelineContext& context)
  {
    context.cancellation().cancel("inner only");
    context.proceed();
  });
  bool inner_cancelled = false;
  outer.intercept(phases[0], [&inner, &inner_cancelled](PipelineContext& context)
  {
    try
    {
      inner.execute(context.call(), std::any{});
    }
    catch (const CancellationError&)
    {
      inner_cancelled = true;
    }
    context.proceed();
  });
  record(outer, phases[1], "outer-continues");

  EXPECT_NO_THROW(outer.execute(*call, std::any{}));
  EXPECT_TRUE(inner_cancelled);
  EXPECT_EQ(log, (std::vector<std::string>{"outer-continues"}));
  EXPECT_FALSE(call->cancellation().is_cancelled());
}

TEST_F(PipelineExecutionTest, CancelledCallNeverRunsInterceptors)
{
  Pipeline pipeline("Test", phases);
  record(pipeline, phases[0], "never");
  call->cancellation().cancel();

  EXPECT_THROW(pipeline.execute(*call, std::any{}), CancellationError);
  EXPECT_TRUE(log.empty());
}

TEST_F(PipelineExecutionTest, CancellationUnwindsLikeAnException)
{
  Pipeline pipeline("Test", phases);
  bool cleaned_up = false;
  pipeline.intercept(phases[0], [&cleaned_up](PipelineContext& context)
  {
    struct Cleanup
    {
      bool& flag;
      ~Cleanup() { flag = true; }
    } cleanup{cleaned_up};
    context.proceed();
  });
  pipeline.intercept(phases[1], [](PipelineContext& context)
  {
    context.cancellation().cancel("stop");
    context.proceed();
  });
  record(pipeline, phases[2], "after-cancel");

  PipelineContext context(*call, std::any{}, pipeline.interceptors(), call->cancellation().make_child());

  EXPECT_THROW(context.execute(), CancellationError);
  EXPECT_TRUE(cleaned_up);
  EXPECT_TRUE(log.empty());
  EXPECT_EQ(context.state(), ExecutionState::Failed);
  EXPECT_THROW(context.proceed(), CancellationError);
  EXPECT_TRUE(log.empty());
}

TEST_F(PipelineExecutionTest, SwallowedCancellationStillFailsTheRun)
{
  Pipeline pipeline("Test", phases);
  pipeline.intercept(phases[0], [](PipelineContext& context)
  {
    try
    {
      context.proceed();
    }
    catch (const CancellationError&)
    {
    }
  });
  pipeline.intercept(phases[1], [](PipelineContext& context)
  {
    context.cancellation().cancel();
    context.proceed();
  });

  EXPECT_THROW(pipeline.execute(*call, std::any{}), CancellationError);
}

TEST_F(PipelineExecutionTest, SuspendingOutsideACoroutineIsRejected)
{
  Pipeline pipeline("Test", phases);
  pipeline.intercept(phases[0], [](PipelineContext& context)
  {
    EXPECT_FALSE(context.is_async());
    context.suspend_for(std::chrono::milliseconds(1));
  });

  EXPECT_THROW(pipeline.execute(*call, std::any{}), std::logic_error);
}
