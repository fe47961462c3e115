// framework/engine/default_transformations.cpp
#include "default_transformations.hpp"
#include "application/application.hpp"
#include "context/application_call.hpp"
#include "exception/pipeline_exceptions.hpp"
#include "router/routing.hpp"
#include <fmt/core.h>
#include <cstdint>
#include <typeindex>
#include <vector>

namespace kpipeline::framework
{
  namespace http = boost::beast::http;

  void write_response(ApplicationCall& call, const OutgoingContent& content)
  {
    call.set_status(content.status.value_or(http::status::ok));
    if (!content.content_type.empty())
    {
      call.set_content_type(content.content_type);
    }
    call.set_body(content.body);
  }

  std::any read_request_body(ApplicationCall& call)
  {
    return call.body();
  }

  void setup_send_pipeline(Pipeline& send_pipeline, ResponseWriter writer)
  {
    if (!writer)
    {
      writer = write_response;
    }
    send_pipeline.intercept(SendPhases::Engine, [writer = std::move(writer)](PipelineContext& context)
    {
      const auto* content = context.subject_as<OutgoingContent>();
      if (content == nullptr)
      {
        throw HandlerError(fmt::format("Response of type {} was not rendered to content",
                                       context.subject().type().name()));
      }
      ApplicationCall& call = context.call();
      call.commit(*content);
      writer(call, *content);
      context.proceed();
    });
  }

  void setup_receive_pipeline(Pipeline& receive_pipeline, ReceiveSource source)
  {
    if (!source)
    {
      source = read_request_body;
    }
    receive_pipeline.intercept(ReceivePhases::Before, [source = std::move(source)](PipelineContext& context)
    {
      if (auto* request = context.subject_as<ReceiveRequest>(); request != nullptr && !request->value.has_value())
      {
        request->value = source(context.call());
      }
      context.proceed();
    });
  }

  void install_default_transformations(Pipeline& receive_pipeline, Pipeline& send_pipeline)
  {
    send_pipeline.intercept(SendPhases::Render, [](PipelineContext& context)
    {
      if (const auto* text = context.subject_as<std::string>())
      {
        context.proceed_with(OutgoingContent::text(*text));
        return;
      }
      if (const auto* status = context.subject_as<http::status>())
      {
        context.proceed_with(OutgoingContent::status_only(*status));
        return;
      }
      context.proceed();
    });

    receive_pipeline.intercept(ReceivePhases::Transform, [](PipelineContext& context)
    {
      auto* request = context.subject_as<ReceiveRequest>();
      if (request != nullptr && request->value.has_value() && std::type_index(request->value.type()) != request->type)
      {
        using Bytes = std::vector<std::uint8_t>;
        if (request->type == std::type_index(typeid(Bytes)))
        {
          if (const auto* text = std::any_cast<std::string>(&request->value))
          {
            request->value = Bytes(text->begin(), text->end());
          }
        }
        else if (request->type == std::type_index(typeid(std::string)))
        {
          if (const auto* bytes = std::any_cast<Bytes>(&request->value))
          {
            request->value = std::string(bytes->begin(), bytes->end());
          }
        }
      }
      context.proceed();
    });
  }

  void install_default_interceptors(Application& application)
  {
    application.send_pipeline().intercept(SendPhases::Before, [](PipelineContext& context)
    {
      context.call().set_attribute(SendPipelineExecutedKey, true);
      context.proceed();
    });

    application.intercept(ApplicationCallPhases::Call, [](PipelineContext& context)
    {
      ApplicationCall& call = context.call();
      if (call.get_headers(http::field::host).size() > 1)
      {
        fmt::print(stderr, "Rejecting {}: multiple Host headers\n", call.path());
        call.respond(http::status::bad_request);
        context.finish();
        return;
      }
      context.proceed();
    });

    application.intercept(ApplicationCallPhases::Fallback, [](PipelineContext& context)
    {
      ApplicationCall& call = context.call();
      if (call.has_attribute(SendPipelineExecutedKey))
      {
        context.proceed();
        return;
      }
      const http::status status = call.response_status()
                                      .value_or(call.get_attribute_as<http::status>(RoutingFailureStatusKey)
                                                    .value_or(http::status::not_found));
      call.respond(status);
      context.proceed();
    });
  }

  void install_default_transformation_checker(Application& application)
  {
    application.intercept(ApplicationCallPhases::Plugins, [](PipelineContext& context)
    {
      try
      {
        context.proceed();
      }
      catch (const CannotTransformContentError& e)
      {
        fmt::print(stderr, "Cannot receive request body for {}: {}\n", context.call().path(), e.what());
        context.call().respond(http::status::unsupported_media_type);
      }
    });

    application.send_pipeline().intercept(SendPhases::After, [](PipelineContext& context)
    {
      if (context.subject_as<OutgoingContent>() == nullptr)
      {
        context.proceed_with(OutgoingContent::status_only(http::status::not_acceptable));
        return;
      }
      context.proceed();
    });
  }
}
