// framework/exception/pipeline_exceptions.hpp
#ifndef KPIPELINE_FRAMEWORK_EXCEPTION_PIPELINE_EXCEPTIONS_HPP_
#define KPIPELINE_FRAMEWORK_EXCEPTION_PIPELINE_EXCEPTIONS_HPP_

#include <exception>
#include <stdexcept>
#include <string>

namespace kpipeline::framework
{
  // Closed error hierarchy. Every kind except Any has exactly one parent.
  enum class ErrorKind
  {
    Any,
    Cancellation,
    Framework,
    PhaseNotFound,
    MissingDependency,
    PhaseOrderConflict,
    DuplicatePlugin,
    Handler,
    BadRequest,
    CannotTransformContent,
    NotFound,
    ResponseAlreadySent
  };

  ErrorKind parent_of(ErrorKind kind);

  // True when `kind` is `ancestor` or one of its descendants.
  bool is_kind_of(ErrorKind kind, ErrorKind ancestor);

  const char* to_string(ErrorKind kind);

  /**
   * @brief Classifies anything thrown.
   * PipelineError subclasses report their own kind, other std::exception
   * types are Handler errors, everything else is Any.
   */
  ErrorKind error_kind_of(const std::exception_ptr& eptr);

  std::string describe_exception(const std::exception_ptr& eptr);

  class PipelineError : public std::runtime_error
  {
  public:
    PipelineError(ErrorKind kind, const std::string& message);

    ErrorKind kind() const { return kind_; }

  private:
    ErrorKind kind_;
  };

  class PhaseNotFoundError : public PipelineError
  {
  public:
    explicit PhaseNotFoundError(const std::string& phase_name);

    const std::string& phase_name() const { return phase_name_; }

  private:
    std::string phase_name_;
  };

  class MissingDependencyError : public PipelineError
  {
  public:
    explicit MissingDependencyError(const std::string& plugin_key);

    const std::string& plugin_key() const { return plugin_key_; }

  private:
    std::string plugin_key_;
  };

  class PhaseOrderConflictError : public PipelineError
  {
  public:
    explicit PhaseOrderConflictError(const std::string& message);
  };

  class DuplicatePluginError : public PipelineError
  {
  public:
    explicit DuplicatePluginError(const std::string& plugin_key);
  };

  // Raised at the next suspension or proceed() point of a cancelled call.
  class CancellationError : public PipelineError
  {
  public:
    explicit CancellationError(const std::string& reason = "Call was cancelled");
  };

  // Base for errors raised by interceptors and route handlers.
  class HandlerError : public PipelineError
  {
  public:
    explicit HandlerError(const std::string& message);

  protected:
    HandlerError(ErrorKind kind, const std::string& message);
  };

  class BadRequestError : public HandlerError
  {
  public:
    explicit BadRequestError(const std::string& message);

  protected:
    BadRequestError(ErrorKind kind, const std::string& message);
  };

  class CannotTransformContentError : public BadRequestError
  {
  public:
    explicit CannotTransformContentError(const std::string& type_name);
  };

  class NotFoundError : public HandlerError
  {
  public:
    explicit NotFoundError(const std::string& message = "Resource not found");
  };

  class ResponseAlreadySentError : public HandlerError
  {
  public:
    ResponseAlreadySentError();
  };
}

#endif // KPIPELINE_FRAMEWORK_EXCEPTION_PIPELINE_EXCEPTIONS_HPP_
