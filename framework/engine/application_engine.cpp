// framework/engine/application_engine.cpp
#include "application_engine.hpp"
#include "engine/default_transformations.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <boost/asio/bind_executor.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/spawn.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/strand.hpp>
#include <boost/coroutine/exceptions.hpp>
#include <fmt/core.h>
#include <chrono>
#include <stdexcept>

namespace kpipeline::framework
{
  namespace http = boost::beast::http;

  namespace
  {
    void on_coroutine_exit()
    {
    }

    std::string describe_request(const ApplicationCall::Request& request)
    {
      const auto method = request.method_string();
      const auto target = request.target();
      return fmt::format("{} {}", std::string(method.data(), method.size()),
                         std::string(target.data(), target.size()));
    }

    std::shared_ptr<boost::asio::steady_timer> arm_call_timeout(const boost::asio::any_io_executor& executor,
                                                                const CancellationToken& token,
                                                                const std::chrono::milliseconds timeout)
    {
      if (timeout.count() <= 0)
      {
        return nullptr;
      }
      auto timer = std::make_shared<boost::asio::steady_timer>(executor, timeout);
      timer->async_wait([token](const boost::system::error_code& ec)
      {
        if (!ec)
        {
          token.cancel("Call timed out");
        }
      });
      return timer;
    }
  }

  CallHandle::CallHandle(boost::asio::any_io_executor executor, CancellationToken token)
    : executor_(std::move(executor)), token_(std::move(token))
  {
  }

  void CallHandle::cancel(const std::string& reason) const
  {
    boost::asio::post(executor_, [token = token_, reason]()
    {
      token.cancel(reason);
    });
  }

  ApplicationEngine::ApplicationEngine(EngineConfig config)
    : config_(std::move(config)),
      pool_(config_.threads),
      pipeline_("EnginePipeline", EnginePhases::all()),
      receive_pipeline_("EngineReceivePipeline", ReceivePhases::all()),
      send_pipeline_("EngineSendPipeline", SendPhases::all())
  {
    setup_send_pipeline(send_pipeline_, config_.response_writer);
    setup_receive_pipeline(receive_pipeline_, config_.receive_source);

    pipeline_.intercept(EnginePhases::Call, [development = config_.development](PipelineContext& context)
    {
      ApplicationCall& call = context.call();
      try
      {
        call.application().execute(call);
      }
      catch (const CancellationError&)
      {
        throw;
      }
      catch (const boost::coroutines::detail::forced_unwind&)
      {
        throw;
      }
      catch (...)
      {
        handle_failure(call, std::current_exception(), development);
      }
      context.proceed();
    });
  }

  ApplicationEngine::~ApplicationEngine()
  {
    stop();
  }

  void ApplicationEngine::start()
  {
    if (application_)
    {
      throw std::logic_error("Engine is already started");
    }
    load_application();
  }

  void ApplicationEngine::reload()
  {
    if (!application_)
    {
      throw std::logic_error("Engine is not started");
    }
    load_application();
  }

  void ApplicationEngine::stop()
  {
    if (pool_.running_in_this_thread())
    {
      throw std::logic_error("Engine cannot be stopped from one of its own threads");
    }
    std::vector<CallHandle> running;
    {
      std::lock_guard<std::mutex> lock(calls_mutex_);
      if (stopped_)
      {
        return;
      }
      stopped_ = true;
      for (const auto& entry : running_calls_)
      {
        running.push_back(entry.second);
      }
    }
    if (!running.empty())
    {
      fmt::print("Engine for {} cancelling {} running call(s).\n", config_.application_name, running.size());
    }
    for (const auto& handle : running)
    {
      handle.cancel("Engine is stopping");
    }
    pool_.stop();
    if (application_)
    {
      application_->shutdown();
    }
    fmt::print("Engine for {} stopped.\n", config_.application_name);
  }

  Application& ApplicationEngine::application() const
  {
    return *require_application();
  }

  void ApplicationEngine::load_application()
  {
    const auto started_at = std::chrono::steady_clock::now();

    auto application = std::make_shared<Application>(config_.application_name);
    application->receive_pipeline().merge(receive_pipeline_);
    application->send_pipeline().merge(send_pipeline_);
    install_default_transformations(application->receive_pipeline(), application->send_pipeline());
    install_default_interceptors(*application);
    install_default_transformation_checker(*application);
    for (const auto& module : config_.modules)
    {
      module(*application);
    }

    if (application_)
    {
      application_->shutdown();
    }
    application_ = std::move(application);

    const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started_at;
    if (first_loading_)
    {
      fmt::print("Application started in {:.3f} seconds.\n", elapsed.count());
      first_loading_ = false;
    }
    else
    {
      fmt::print("Application auto-reloaded in {:.3f} seconds.\n", elapsed.count());
    }
  }

  std::shared_ptr<Application> ApplicationEngine::require_application() const
  {
    if (!application_)
    {
      throw std::logic_error("Engine is not started");
    }
    return application_;
  }

  void ApplicationEngine::run_call(ApplicationCall& call) const
  {
    pipeline_.execute(call, std::any{});
  }

  http::status ApplicationEngine::status_for(const ErrorKind kind)
  {
    if (is_kind_of(kind, ErrorKind::CannotTransformContent))
    {
      return http::status::unsupported_media_type;
    }
    if (is_kind_of(kind, ErrorKind::BadRequest))
    {
      return http::status::bad_request;
    }
    if (is_kind_of(kind, ErrorKind::NotFound))
    {
      return http::status::not_found;
    }
    return http::status::internal_server_error;
  }

  void ApplicationEngine::handle_failure(ApplicationCall& call, const std::exception_ptr eptr, const bool development)
  {
    const ErrorKind kind = error_kind_of(eptr);
    const std::string message = describe_exception(eptr);
    fmt::print(stderr, "Unhandled {} error for {}: {}\n", to_string(kind), describe_request(call.get_request()),
               message);
    if (call.is_committed())
    {
      return;
    }

    OutgoingContent content = OutgoingContent::status_only(status_for(kind));
    if (development)
    {
      content.content_type = "text/plain; charset=UTF-8";
      content.body = message;
    }
    call.respond(std::move(content));
  }

  ApplicationEngine::Response ApplicationEngine::execute(Request request)
  {
    const auto application = require_application();
    Response response;
    ApplicationCall call(*application, request, response);
    run_call(call);
    return response;
  }

  CallHandle ApplicationEngine::execute_async(Request request, Completion completion)
  {
    if (!completion)
    {
      throw std::invalid_argument("Completion handler cannot be null");
    }
    auto application = require_application();
    const boost::asio::any_io_executor executor = boost::asio::make_strand(pool_.get_io_context());
    const CancellationToken token;
    std::uint64_t call_id = 0;
    {
      std::lock_guard<std::mutex> lock(calls_mutex_);
      if (stopped_)
      {
        throw std::logic_error("Engine is stopped");
      }
      call_id = next_call_id_++;
      running_calls_.emplace(call_id, CallHandle(executor, token));
    }

    boost::asio::spawn(
      boost::asio::bind_executor(executor, &on_coroutine_exit),
      [this, call_id, application, executor, token, request = std::move(request), completion = std::move(completion)](
      boost::asio::yield_context yield) mutable
      {
        const std::string description = describe_request(request);
        const auto timer = arm_call_timeout(executor, token, config_.call_timeout);
        const AsyncScope scope{executor, &yield};
        Response response;
        std::exception_ptr error;
        try
        {
          ApplicationCall call(*application, request, response);
          call.set_cancellation(token);
          call.set_async_scope(&scope);
          run_call(call);
        }
        catch (const CancellationError& e)
        {
          fmt::print(stderr, "Call {} cancelled: {}\n", description, e.what());
          error = std::current_exception();
        }
        catch (const boost::coroutines::detail::forced_unwind&)
        {
          throw;
        }
        catch (...)
        {
          error = std::current_exception();
          fmt::print(stderr, "Call {} failed: {}\n", description, describe_exception(error));
        }
        if (timer)
        {
          timer->cancel();
        }

        try
        {
          completion(error, std::move(response));
        }
        catch (const std::exception& e)
        {
          fmt::print(stderr, "Completion handler of {} threw: {}\n", description, e.what());
        }

        std::lock_guard<std::mutex> lock(calls_mutex_);
        running_calls_.erase(call_id);
      });

    return CallHandle(executor, token);
  }
}
