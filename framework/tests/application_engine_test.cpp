#include "framework/engine/application_engine.hpp"
#include "framework/engine/default_transformations.hpp"
#include "framework/plugin/application_plugin.hpp"
#include "framework/router/routing.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace http = boost::beast::http;
namespace kp_fw = kpipeline::framework;

namespace
{
  using Request = kp_fw::ApplicationEngine::Request;
  using Response = kp_fw::ApplicationEngine::Response;
  using AsyncResult = std::pair<std::exception_ptr, Response>;

  Request make_request(http::verb method, const std::string& target, const std::string& body = "")
  {
    Request req{method, target, 11};
    req.set(http::field::host, "localhost");
    if (!body.empty())
    {
      req.body() = body;
      req.prepare_payload();
    }
    return req;
  }

  std::string header(const Response& res, http::field field)
  {
    const auto value = res[field];
    return std::string(value.data(), value.size());
  }
}

class ApplicationEngineTest : public ::testing::Test
{
protected:
  void SetUp() override
  {
    routing = std::make_shared<kp_fw::Routing>();
    config.application_name = "EngineTest";
  }

  void start()
  {
    config.modules.emplace_back([routing = routing](kp_fw::Application& application)
    {
      application.install(*routing);
    });
    engine = std::make_unique<kp_fw::ApplicationEngine>(config);
    engine->start();
  }

  // Runs `request` asynchronously and waits for its completion.
  AsyncResult run_async(Request request)
  {
    std::promise<AsyncResult> done;
    auto future = done.get_future();
    engine->execute_async(std::move(request), [&done](std::exception_ptr error, Response res)
    {
      done.set_value({error, std::move(res)});
    });
    return future.get();
  }

  kp_fw::EngineConfig config;
  std::shared_ptr<kp_fw::Routing> routing;
  std::unique_ptr<kp_fw::ApplicationEngine> engine;
};

TEST_F(ApplicationEngineTest, RespondsWithRenderedText)
{
  routing->get("/hello/:name", [](kp_fw::ApplicationCall& call)
  {
    call.respond("Hello, " + call.get_path_param("name").value_or("") + "!");
  });
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/hello/pipeline"));

  ASSERT_EQ(res.result(), http::status::ok);
  ASSERT_EQ(res.body(), "Hello, pipeline!");
  ASSERT_EQ(header(res, http::field::content_type), "text/plain; charset=UTF-8");
}

TEST_F(ApplicationEngineTest, UnroutedCallIsNotFound)
{
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/nowhere"));

  ASSERT_EQ(res.result(), http::status::not_found);
  ASSERT_TRUE(res.body().empty());
}

TEST_F(ApplicationEngineTest, WrongMethodIsMethodNotAllowed)
{
  routing->post("/echo", [](kp_fw::ApplicationCall& call) { call.respond(call.receive<std::string>()); });
  start();

  const auto res = engine->execute(make_request(http::verb::put, "/echo"));

  ASSERT_EQ(res.result(), http::status::method_not_allowed);
  ASSERT_EQ(header(res, http::field::allow), "POST");
}

TEST_F(ApplicationEngineTest, StatusSetWithoutRespondingIsSentByFallback)
{
  routing->del("/items/:id", [](kp_fw::ApplicationCall& call) { call.set_status(http::status::no_content); });
  start();

  const auto res = engine->execute(make_request(http::verb::delete_, "/items/3"));

  ASSERT_EQ(res.result(), http::status::no_content);
}

TEST_F(ApplicationEngineTest, DuplicateHostHeaderIsBadRequest)
{
  bool routed = false;
  routing->get("/", [&routed](kp_fw::ApplicationCall& call)
  {
    routed = true;
    call.respond(std::string("root"));
  });
  start();
  auto request = make_request(http::verb::get, "/");
  request.insert(http::field::host, "evil.example");

  const auto res = engine->execute(std::move(request));

  ASSERT_EQ(res.result(), http::status::bad_request);
  ASSERT_FALSE(routed);
}

TEST_F(ApplicationEngineTest, ReceivesStringAndBytes)
{
  std::size_t byte_count = 0;
  routing->post("/echo", [](kp_fw::ApplicationCall& call) { call.respond(call.receive<std::string>()); });
  routing->post("/bytes", [&byte_count](kp_fw::ApplicationCall& call)
  {
    byte_count = call.receive<std::vector<std::uint8_t>>().size();
    call.respond(http::status::accepted);
  });
  start();

  const auto echo = engine->execute(make_request(http::verb::post, "/echo", "ping"));
  const auto bytes = engine->execute(make_request(http::verb::post, "/bytes", "12345"));

  ASSERT_EQ(echo.body(), "ping");
  ASSERT_EQ(bytes.result(), http::status::accepted);
  ASSERT_EQ(byte_count, 5u);
}

TEST_F(ApplicationEngineTest, UnsupportedReceiveTypeIsUnsupportedMediaType)
{
  routing->post("/number", [](kp_fw::ApplicationCall& call) { call.respond(std::to_string(call.receive<int>())); });
  start();

  const auto res = engine->execute(make_request(http::verb::post, "/number", "42"));

  ASSERT_EQ(res.result(), http::status::unsupported_media_type);
}

TEST_F(ApplicationEngineTest, UnrenderedResponseIsNotAcceptable)
{
  routing->get("/int", [](kp_fw::ApplicationCall& call) { call.respond(42); });
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/int"));

  ASSERT_EQ(res.result(), http::status::not_acceptable);
}

TEST_F(ApplicationEngineTest, UnhandledErrorsMapToStatuses)
{
  routing->get("/boom", [](kp_fw::ApplicationCall&) { throw std::runtime_error("boom"); });
  routing->get("/gone", [](kp_fw::ApplicationCall&) { throw kp_fw::NotFoundError("gone"); });
  routing->get("/bad", [](kp_fw::ApplicationCall&) { throw kp_fw::BadRequestError("bad"); });
  start();

  const auto boom = engine->execute(make_request(http::verb::get, "/boom"));
  ASSERT_EQ(boom.result(), http::status::internal_server_error);
  ASSERT_TRUE(boom.body().empty());
  ASSERT_EQ(engine->execute(make_request(http::verb::get, "/gone")).result(), http::status::not_found);
  ASSERT_EQ(engine->execute(make_request(http::verb::get, "/bad")).result(), http::status::bad_request);
}

TEST_F(ApplicationEngineTest, NonStandardThrowableIsInternalServerError)
{
  routing->get("/int", [](kp_fw::ApplicationCall&) { throw 42; });
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/int"));

  ASSERT_EQ(res.result(), http::status::internal_server_error);
}

TEST_F(ApplicationEngineTest, DevelopmentModeExposesErrorMessage)
{
  config.development = true;
  routing->get("/boom", [](kp_fw::ApplicationCall&) { throw std::runtime_error("database offline"); });
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/boom"));

  ASSERT_EQ(res.result(), http::status::internal_server_error);
  ASSERT_EQ(res.body(), "database offline");
}

TEST_F(ApplicationEngineTest, CustomCollaboratorsAreUsed)
{
  std::vector<std::string> written;
  config.response_writer = [&written](kp_fw::ApplicationCall& call, const kp_fw::OutgoingContent& content)
  {
    written.push_back(content.body);
    kp_fw::write_response(call, content);
  };
  config.receive_source = [](kp_fw::ApplicationCall&) -> std::any { return std::string("from source"); };
  routing->post("/echo", [](kp_fw::ApplicationCall& call) { call.respond(call.receive<std::string>()); });
  start();

  const auto res = engine->execute(make_request(http::verb::post, "/echo", "ignored"));

  ASSERT_EQ(res.body(), "from source");
  ASSERT_EQ(written, std::vector<std::string>{"from source"});
}

TEST_F(ApplicationEngineTest, EnginePipelinesAreMergedIntoTheApplication)
{
  start();

  const kp_fw::Application& application = engine->application();
  ASSERT_EQ(application.send_pipeline().interceptors_count(kp_fw::SendPhases::Engine), 1u);
  ASSERT_EQ(application.receive_pipeline().interceptors_count(kp_fw::ReceivePhases::Before), 1u);
  ASSERT_EQ(engine->pipeline().interceptors_count(kp_fw::EnginePhases::Call), 1u);
  ASSERT_TRUE(application.has_plugin(kp_fw::Routing::Key));
}

TEST_F(ApplicationEngineTest, LifecycleIsChecked)
{
  engine = std::make_unique<kp_fw::ApplicationEngine>(config);

  ASSERT_FALSE(engine->is_started());
  ASSERT_THROW(engine->execute(make_request(http::verb::get, "/")), std::logic_error);
  ASSERT_THROW(engine->reload(), std::logic_error);

  engine->start();
  ASSERT_THROW(engine->start(), std::logic_error);

  engine->stop();
  ASSERT_THROW(engine->execute_async(make_request(http::verb::get, "/"), [](std::exception_ptr, Response) {}),
               std::logic_error);
}

TEST_F(ApplicationEngineTest, StartAndReloadAreLoggedPerEngine)
{
  auto shutdowns = std::make_shared<std::vector<std::string>>();
  config.modules.emplace_back([shutdowns](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Tracker", [shutdowns](kp_fw::PluginBuilder& builder)
    {
      builder.on_application_shutdown([shutdowns]() { shutdowns->push_back("tracker"); });
    }));
  });

  testing::internal::CaptureStdout();
  start();
  const kp_fw::Application* first = &engine->application();
  engine->reload();
  const std::string output = testing::internal::GetCapturedStdout();

  ASSERT_NE(output.find("Application started in"), std::string::npos);
  ASSERT_NE(output.find("Application auto-reloaded in"), std::string::npos);
  ASSERT_NE(first, &engine->application());
  ASSERT_EQ(*shutdowns, std::vector<std::string>{"tracker"});

  kp_fw::ApplicationEngine other(config);
  testing::internal::CaptureStdout();
  other.start();
  const std::string other_output = testing::internal::GetCapturedStdout();
  ASSERT_NE(other_output.find("Application started in"), std::string::npos);

  engine->stop();
  ASSERT_EQ(*shutdowns, (std::vector<std::string>{"tracker", "tracker"}));
}

TEST_F(ApplicationEngineTest, AsyncCallCompletesWithResponse)
{
  routing->get("/async", [](kp_fw::ApplicationCall& call) { call.respond(std::string("async body")); });
  start();

  const auto [error, res] = run_async(make_request(http::verb::get, "/async"));

  ASSERT_FALSE(error);
  ASSERT_EQ(res.result(), http::status::ok);
  ASSERT_EQ(res.body(), "async body");
}

TEST_F(ApplicationEngineTest, SuspensionKeepsInterceptorOrder)
{
  std::mutex mutex;
  std::vector<std::string> events;
  const auto record = [&mutex, &events](const std::string& event)
  {
    std::lock_guard<std::mutex> lock(mutex);
    events.push_back(event);
  };
  config.modules.emplace_back([record](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Delay", [record](kp_fw::PluginBuilder& builder)
    {
      builder.on_call([record](kp_fw::CallContext& context, kp_fw::ApplicationCall& call)
      {
        if (call.path() == "/slow")
        {
          record("slow:before");
          context.pipeline().suspend_for(std::chrono::milliseconds(200));
          record("slow:after");
        }
      });
    }));
  });
  routing->get("/slow", [record](kp_fw::ApplicationCall& call)
  {
    record("slow:route");
    call.respond(std::string("slow"));
  });
  routing->get("/fast", [record](kp_fw::ApplicationCall& call)
  {
    record("fast:route");
    call.respond(std::string("fast"));
  });
  start();

  std::promise<AsyncResult> slow_done;
  std::promise<AsyncResult> fast_done;
  engine->execute_async(make_request(http::verb::get, "/slow"), [&slow_done](std::exception_ptr e, Response res)
  {
    slow_done.set_value({e, std::move(res)});
  });
  engine->execute_async(make_request(http::verb::get, "/fast"), [&fast_done](std::exception_ptr e, Response res)
  {
    fast_done.set_value({e, std::move(res)});
  });
  const auto fast = fast_done.get_future().get();
  const auto slow = slow_done.get_future().get();

  ASSERT_FALSE(fast.first);
  ASSERT_FALSE(slow.first);
  ASSERT_EQ(slow.second.body(), "slow");
  std::lock_guard<std::mutex> lock(mutex);
  ASSERT_EQ(events, (std::vector<std::string>{"slow:before", "fast:route", "slow:after", "slow:route"}));
}

TEST_F(ApplicationEngineTest, CancelledCallUnwindsAndReportsCancellation)
{
  auto started = std::make_shared<std::promise<void>>();
  auto cleaned_up = std::make_shared<std::atomic<bool>>(false);
  auto route_ran = std::make_shared<std::atomic<bool>>(false);
  config.modules.emplace_back([started, cleaned_up](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Wait", [started, cleaned_up](kp_fw::PluginBuilder& builder)
    {
      builder.on_call([started, cleaned_up](kp_fw::CallContext& context, kp_fw::ApplicationCall&)
      {
        struct Cleanup
        {
          std::shared_ptr<std::atomic<bool>> flag;
          ~Cleanup() { flag->store(true); }
        } cleanup{cleaned_up};
        started->set_value();
        context.pipeline().suspend_for(std::chrono::seconds(10));
      });
    }));
  });
  routing->get("/wait", [route_ran](kp_fw::ApplicationCall& call)
  {
    route_ran->store(true);
    call.respond(std::string("never"));
  });
  start();

  std::promise<AsyncResult> done;
  const auto handle = engine->execute_async(make_request(http::verb::get, "/wait"),
                                            [&done](std::exception_ptr e, Response res)
                                            {
                                              done.set_value({e, std::move(res)});
                                            });
  started->get_future().wait();
  handle.cancel("client disconnected");
  const auto result = done.get_future().get();

  ASSERT_TRUE(result.first);
  ASSERT_EQ(kp_fw::error_kind_of(result.first), kp_fw::ErrorKind::Cancellation);
  ASSERT_EQ(kp_fw::describe_exception(result.first), "client disconnected (Cancellation)");
  ASSERT_TRUE(cleaned_up->load());
  ASSERT_FALSE(route_ran->load());
  ASSERT_TRUE(handle.cancellation().is_cancelled());
  ASSERT_TRUE(result.second.body().empty());
}

TEST_F(ApplicationEngineTest, TimedOutCallIsCancelled)
{
  config.call_timeout = std::chrono::milliseconds(50);
  config.modules.emplace_back([](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Stall", [](kp_fw::PluginBuilder& builder)
    {
      builder.on_call([](kp_fw::CallContext& context, kp_fw::ApplicationCall&)
      {
        context.pipeline().suspend_for(std::chrono::seconds(10));
      });
    }));
  });
  start();

  const auto started_at = std::chrono::steady_clock::now();
  const auto [error, res] = run_async(make_request(http::verb::get, "/stall"));

  ASSERT_TRUE(error);
  ASSERT_EQ(kp_fw::describe_exception(error), "Call timed out (Cancellation)");
  ASSERT_LT(std::chrono::steady_clock::now() - started_at, std::chrono::seconds(5));
}

TEST_F(ApplicationEngineTest, SynchronousCallCannotSuspend)
{
  config.modules.emplace_back([](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Suspender", [](kp_fw::PluginBuilder& builder)
    {
      builder.on_call([](kp_fw::CallContext& context, kp_fw::ApplicationCall&)
      {
        context.pipeline().suspend_for(std::chrono::milliseconds(1));
      });
    }));
  });
  start();

  const auto res = engine->execute(make_request(http::verb::get, "/"));

  ASSERT_EQ(res.result(), http::status::internal_server_error);
}

TEST_F(ApplicationEngineTest, StopCancelsRunningCalls)
{
  auto started = std::make_shared<std::promise<bool>>();
  config.modules.emplace_back([started](kp_fw::Application& application)
  {
    application.install(kp_fw::LambdaApplicationPlugin("Idle", [started](kp_fw::PluginBuilder& builder)
    {
      builder.on_call([started](kp_fw::CallContext& context, kp_fw::ApplicationCall&)
      {
        started->set_value(static_cast<bool>(context.pipeline().executor()));
        context.pipeline().suspend_for(std::chrono::hours(1));
      });
    }));
  });
  start();

  std::promise<AsyncResult> done;
  auto result = done.get_future();
  engine->execute_async(make_request(http::verb::get, "/idle"), [&done](std::exception_ptr e, Response res)
  {
    done.set_value({e, std::move(res)});
  });
  ASSERT_TRUE(started->get_future().get());

  const auto stopping_at = std::chrono::steady_clock::now();
  engine->stop();

  ASSERT_LT(std::chrono::steady_clock::now() - stopping_at, std::chrono::seconds(5));
  ASSERT_EQ(result.wait_for(std::chrono::seconds(0)), std::future_status::ready);
  const auto [error, res] = result.get();
  ASSERT_EQ(kp_fw::describe_exception(error), "Engine is stopping (Cancellation)");
  ASSERT_THROW(engine->execute_async(make_request(http::verb::get, "/"), [](std::exception_ptr, Response) {}),
               std::logic_error);
}

TEST_F(ApplicationEngineTest, StopFromACompletionIsRejected)
{
  routing->get("/", [](kp_fw::ApplicationCall& call) { call.respond(std::string("ok")); });
  start();

  std::promise<bool> rejected;
  engine->execute_async(make_request(http::verb::get, "/"), [this, &rejected](std::exception_ptr, Response)
  {
    try
    {
      engine->stop();
      rejected.set_value(false);
    }
    catch (const std::logic_error&)
    {
      rejected.set_value(true);
    }
  });

  ASSERT_TRUE(rejected.get_future().get());
  engine->stop();
  ASSERT_THROW(engine->execute_async(make_request(http::verb::get, "/"), [](std::exception_ptr, Response) {}),
               std::logic_error);
}
