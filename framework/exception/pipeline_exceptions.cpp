// framework/exception/pipeline_exceptions.cpp
#include "pipeline_exceptions.hpp"
#include <fmt/core.h>

namespace kpipeline::framework
{
  ErrorKind parent_of(const ErrorKind kind)
  {
    switch (kind)
    {
    case ErrorKind::PhaseNotFound:
    case ErrorKind::MissingDependency:
    case ErrorKind::PhaseOrderConflict:
    case ErrorKind::DuplicatePlugin:
      return ErrorKind::Framework;
    case ErrorKind::CannotTransformContent:
      return ErrorKind::BadRequest;
    case ErrorKind::BadRequest:
    case ErrorKind::NotFound:
    case ErrorKind::ResponseAlreadySent:
      return ErrorKind::Handler;
    case ErrorKind::Cancellation:
    case ErrorKind::Framework:
    case ErrorKind::Handler:
    case ErrorKind::Any:
      return ErrorKind::Any;
    }
    return ErrorKind::Any;
  }

  bool is_kind_of(ErrorKind kind, const ErrorKind ancestor)
  {
    while (true)
    {
      if (kind == ancestor)
      {
        return true;
      }
      if (kind == ErrorKind::Any)
      {
        return false;
      }
      kind = parent_of(kind);
    }
  }

  const char* to_string(const ErrorKind kind)
  {
    switch (kind)
    {
    case ErrorKind::Any: return "Any";
    case ErrorKind::Cancellation: return "Cancellation";
    case ErrorKind::Framework: return "Framework";
    case ErrorKind::PhaseNotFound: return "PhaseNotFound";
    case ErrorKind::MissingDependency: return "MissingDependency";
    case ErrorKind::PhaseOrderConflict: return "PhaseOrderConflict";
    case ErrorKind::DuplicatePlugin: return "DuplicatePlugin";
    case ErrorKind::Handler: return "Handler";
    case ErrorKind::BadRequest: return "BadRequest";
    case ErrorKind::CannotTransformContent: return "CannotTransformContent";
    case ErrorKind::NotFound: return "NotFound";
    case ErrorKind::ResponseAlreadySent: return "ResponseAlreadySent";
    }
    return "Unknown";
  }

  ErrorKind error_kind_of(const std::exception_ptr& eptr)
  {
    if (!eptr)
    {
      return ErrorKind::Any;
    }
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const PipelineError& e)
    {
      return e.kind();
    }
    catch (const std::exception&)
    {
      return ErrorKind::Handler;
    }
    catch (...)
    {
      return ErrorKind::Any;
    }
  }

  std::string describe_exception(const std::exception_ptr& eptr)
  {
    if (!eptr)
    {
      return "no exception";
    }
    try
    {
      std::rethrow_exception(eptr);
    }
    catch (const PipelineError& e)
    {
      return fmt::format("{} ({})", e.what(), to_string(e.kind()));
    }
    catch (const std::exception& e)
    {
      return e.what();
    }
    catch (...)
    {
      return "unknown exception";
    }
  }

  PipelineError::PipelineError(const ErrorKind kind, const std::string& message)
    : std::runtime_error(message), kind_(kind)
  {
  }

  PhaseNotFoundError::PhaseNotFoundError(const std::string& phase_name)
    : PipelineError(ErrorKind::PhaseNotFound, fmt::format("Phase {} was not registered for this pipeline", phase_name)),
      phase_name_(phase_name)
  {
  }

  MissingDependencyError::MissingDependencyError(const std::string& plugin_key)
    : PipelineError(ErrorKind::MissingDependency,
                    fmt::format("Plugin '{}' is required but was not installed in this pipeline", plugin_key)),
      plugin_key_(plugin_key)
  {
  }

  PhaseOrderConflictError::PhaseOrderConflictError(const std::string& message)
    : PipelineError(ErrorKind::PhaseOrderConflict, message)
  {
  }

  DuplicatePluginError::DuplicatePluginError(const std::string& plugin_key)
    : PipelineError(ErrorKind::DuplicatePlugin, fmt::format("Plugin '{}' is already installed", plugin_key))
  {
  }

  CancellationError::CancellationError(const std::string& reason)
    : PipelineError(ErrorKind::Cancellation, reason)
  {
  }

  HandlerError::HandlerError(const std::string& message)
    : PipelineError(ErrorKind::Handler, message)
  {
  }

  HandlerError::HandlerError(const ErrorKind kind, const std::string& message)
    : PipelineError(kind, message)
  {
  }

  BadRequestError::BadRequestError(const std::string& message)
    : HandlerError(ErrorKind::BadRequest, message)
  {
  }

  BadRequestError::BadRequestError(const ErrorKind kind, const std::string& message)
    : HandlerError(kind, message)
  {
  }

  CannotTransformContentError::CannotTransformContentError(const std::string& type_name)
    : BadRequestError(ErrorKind::CannotTransformContent,
                      fmt::format("Cannot transform this request's content to {}", type_name))
  {
  }

  NotFoundError::NotFoundError(const std::string& message)
    : HandlerError(ErrorKind::NotFound, message)
  {
  }

  ResponseAlreadySentError::ResponseAlreadySentError()
    : HandlerError(ErrorKind::ResponseAlreadySent, "Response has already been sent")
  {
  }
}
