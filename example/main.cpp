#include "CallLoggingPlugin.hpp"
#include "engine/application_engine.hpp"
#include "plugins/status_pages.hpp"
#include "router/routing.hpp"
#include <fmt/core.h>
#include <chrono>
#include <future>
#include <memory>

using namespace kpipeline::framework;
namespace http = boost::beast::http;

namespace
{
  ApplicationCall::Request make_request(http::verb method, const std::string& target, std::string body = {})
  {
    ApplicationCall::Request req{method, target, 11};
    req.set(http::field::host, "localhost");
    req.body() = std::move(body);
    req.prepare_payload();
    return req;
  }

  void print_response(const std::string& label, const ApplicationCall::Response& res)
  {
    fmt::print("[{}] {} {}\n", label, static_cast<unsigned>(res.result()), res.body());
  }
}

int main()
{
  auto routing = std::make_shared<Routing>();
  routing->get("/hello/:name", [](ApplicationCall& call)
  {
    call.respond(fmt::format("Hello, {}!", call.get_path_param("name").value_or("world")));
  });
  routing->post("/echo", [](ApplicationCall& call)
  {
    call.respond(call.receive<std::string>());
  });
  routing->get("/fail", [](ApplicationCall&)
  {
    throw NotFoundError("Nothing to see here");
  });

  auto status_pages = std::make_shared<StatusPages>();
  status_pages->exception(ErrorKind::NotFound, [](ApplicationCall& call, std::exception_ptr)
  {
    call.respond(OutgoingContent{http::status::not_found, "text/plain; charset=UTF-8", "Custom not found page"});
  });

  // Delays slow calls without blocking the worker thread.
  auto throttle = create_application_plugin("Throttle", [](PluginBuilder& builder)
  {
    builder.after({CallLoggingPlugin::Key}).on_call([](CallContext& context, ApplicationCall& call)
    {
      if (call.path().rfind("/hello/slow", 0) == 0 && context.pipeline().is_async())
      {
        context.pipeline().suspend_for(std::chrono::milliseconds(200));
      }
    });
  });

  EngineConfig config;
  config.application_name = "kpipeline-example";
  config.threads = 2;
  config.call_timeout = std::chrono::seconds(5);
  config.modules.emplace_back([status_pages, routing, throttle](Application& application)
  {
    application.install(CallLoggingPlugin());
    application.install(*status_pages);
    application.install(*throttle);
    application.install(*routing);
  });

  ApplicationEngine engine(std::move(config));
  try
  {
    engine.start();

    print_response("hello", engine.execute(make_request(http::verb::get, "/hello/kpipeline")));
    print_response("echo", engine.execute(make_request(http::verb::post, "/echo", "ping")));
    print_response("fail", engine.execute(make_request(http::verb::get, "/fail")));
    print_response("missing", engine.execute(make_request(http::verb::get, "/missing")));
    print_response("method", engine.execute(make_request(http::verb::put, "/echo")));

    std::promise<ApplicationCall::Response> slow;
    engine.execute_async(make_request(http::verb::get, "/hello/slow"),
                         [&slow](std::exception_ptr error, ApplicationCall::Response res)
                         {
                           if (error)
                           {
                             slow.set_exception(error);
                             return;
                           }
                           slow.set_value(std::move(res));
                         });
    print_response("async", slow.get_future().get());

    engine.reload();
    print_response("reloaded", engine.execute(make_request(http::verb::get, "/hello/again")));
  }
  catch (const std::exception& e)
  {
    fmt::print(stderr, "Example failed: {}\n", e.what());
    engine.stop();
    return 1;
  }

  engine.stop();
  return 0;
}
