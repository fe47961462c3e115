// framework/plugins/status_pages.cpp
#include "status_pages.hpp"
#include "application/application.hpp"
#include "context/application_call.hpp"
#include <boost/coroutine/exceptions.hpp>
#include <fmt/core.h>
#include <optional>

namespace kpipeline::framework
{
  namespace
  {
    const std::string StatusPagesHandledKey = "StatusPagesHandled";

    std::optional<boost::beast::http::status> status_of(const std::any& message)
    {
      if (const auto* content = std::any_cast<OutgoingContent>(&message))
      {
        return content->status;
      }
      if (const auto* status = std::any_cast<boost::beast::http::status>(&message))
      {
        return *status;
      }
      return std::nullopt;
    }
  }

  StatusPages::StatusPages()
    : ApplicationPlugin(Key), state_(std::make_shared<State>())
  {
  }

  void StatusPages::exception(const ErrorKind kind, ErrorDispatcher::Handler handler)
  {
    state_->exceptions.on(kind, std::move(handler));
  }

  void StatusPages::status(const std::initializer_list<boost::beast::http::status> codes,
                           const StatusHandler& handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Status handler cannot be null");
    }
    for (const auto code : codes)
    {
      state_->statuses[code] = handler;
    }
  }

  void StatusPages::setup(PluginBuilder& builder) const
  {
    const std::shared_ptr<const State> state = state_;

    if (!state->statuses.empty())
    {
      builder.intercept(InterceptionCategory::AfterTransform, SendPhases::After, [state](PipelineContext& context)
      {
        ApplicationCall& call = context.call();
        if (call.has_attribute(StatusPagesHandledKey))
        {
          context.proceed();
          return;
        }
        const auto status = status_of(context.subject());
        const auto handler = status ? state->statuses.find(*status) : state->statuses.end();
        if (handler == state->statuses.end())
        {
          context.proceed();
          return;
        }

        call.set_attribute(StatusPagesHandledKey, true);
        handler->second(call, *status);
        if (call.is_committed())
        {
          context.finish();
          return;
        }
        context.proceed();
      });
    }

    if (!state->exceptions.empty())
    {
      builder.intercept(InterceptionCategory::Call, ApplicationCallPhases::Monitoring, [state](PipelineContext& context)
      {
        try
        {
          context.proceed();
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
          const std::exception_ptr eptr = std::current_exception();
          ApplicationCall& call = context.call();
          if (call.is_committed() || !state->exceptions.try_handle(eptr, call))
          {
            throw;
          }
          fmt::print(stderr, "StatusPages handled {} for {}: {}\n", to_string(error_kind_of(eptr)), call.path(),
                     describe_exception(eptr));
          if (call.is_committed())
          {
            context.finish();
          }
        }
      });
    }
  }
}
