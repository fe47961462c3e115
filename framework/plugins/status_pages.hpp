// framework/plugins/status_pages.hpp
#ifndef KPIPELINE_FRAMEWORK_PLUGINS_STATUS_PAGES_HPP_
#define KPIPELINE_FRAMEWORK_PLUGINS_STATUS_PAGES_HPP_

#include "exception/exception_handler.hpp"
#include "plugin/application_plugin.hpp"
#include <boost/beast/http/status.hpp>
#include <functional>
#include <initializer_list>
#include <map>
#include <memory>

namespace kpipeline::framework
{
  /**
   * @brief Turns errors and selected response statuses into responses.
   *
   * Exception handlers wrap the rest of the call at the Monitoring phase and
   * are looked up by error kind, most specific first. They only run while
   * nothing was sent yet; cancellation is never handled. Status handlers run
   * at the send After phase, once per call, for content carrying a
   * registered status.
   */
  class StatusPages : public ApplicationPlugin
  {
  public:
    static constexpr const char* Key = "StatusPages";

    using StatusHandler = std::function<void(ApplicationCall&, boost::beast::http::status)>;

    StatusPages();

    void exception(ErrorKind kind, ErrorDispatcher::Handler handler);

    template <typename E>
    void exception(ErrorKind kind, std::function<void(const E&, ApplicationCall&)> handler)
    {
      state_->exceptions.on<E>(kind, std::move(handler));
    }

    void status(std::initializer_list<boost::beast::http::status> codes, const StatusHandler& handler);

    void setup(PluginBuilder& builder) const override;

  private:
    struct State
    {
      ErrorDispatcher exceptions;
      std::map<boost::beast::http::status, StatusHandler> statuses;
    };

    std::shared_ptr<State> state_;
  };
}

#endif // KPIPELINE_FRAMEWORK_PLUGINS_STATUS_PAGES_HPP_
