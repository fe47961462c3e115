#ifndef KPIPELINE_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_
#define KPIPELINE_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_

#include "exception/pipeline_exceptions.hpp"
#include <exception>
#include <functional>
#include <map>

namespace kpipeline::framework
{
  class ApplicationCall;

  class ExceptionHandlerBase
  {
  public:
    virtual ~ExceptionHandlerBase() = default;

    /**
     * @brief Tries to handle the exception.
     * @param eptr The exception pointer to handle.
     * @param call The call the exception was raised for.
     * @return true if the exception was handled, false otherwise.
     */
    virtual bool try_handle(std::exception_ptr eptr, ApplicationCall& call) const
    {
      return false;
    }
  };

  /**
   * @brief Dispatches exceptions to handlers registered per error kind.
   * Lookup starts at the kind of the thrown exception and walks up the kind
   * hierarchy, so the most specific registration wins. Cancellation is never
   * dispatched.
   */
  class ErrorDispatcher : public ExceptionHandlerBase
  {
  public:
    using Handler = std::function<void(ApplicationCall&, std::exception_ptr)>;

    void on(ErrorKind kind, Handler handler)
    {
      if (!handler)
      {
        throw std::invalid_argument("Error handler cannot be null");
      }
      handlers_[kind] = std::move(handler);
    }

    // Typed variant: the handler receives the exception as E.
    template <typename E>
    void on(ErrorKind kind, std::function<void(const E&, ApplicationCall&)> handler)
    {
      if (!handler)
      {
        throw std::invalid_argument("Error handler cannot be null");
      }
      on(kind, [handler](ApplicationCall& call, std::exception_ptr eptr)
      {
        try
        {
          std::rethrow_exception(eptr);
        }
        catch (const E& e)
        {
          handler(e, call);
        }
      });
    }

    const Handler* find(ErrorKind kind) const
    {
      if (is_kind_of(kind, ErrorKind::Cancellation))
      {
        return nullptr;
      }
      while (true)
      {
        if (const auto it = handlers_.find(kind); it != handlers_.end())
        {
          return &it->second;
        }
        if (kind == ErrorKind::Any)
        {
          return nullptr;
        }
        kind = parent_of(kind);
      }
    }

    bool try_handle(std::exception_ptr eptr, ApplicationCall& call) const override
    {
      const Handler* handler = find(error_kind_of(eptr));
      if (handler == nullptr)
      {
        return false;
      }
      (*handler)(call, eptr);
      return true;
    }

    bool empty() const { return handlers_.empty(); }

  private:
    std::map<ErrorKind, Handler> handlers_;
  };
}

#endif // KPIPELINE_FRAMEWORK_EXCEPTION_EXCEPTION_HANDLER_HPP_
