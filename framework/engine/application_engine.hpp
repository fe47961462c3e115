// framework/engine/application_engine.hpp
#ifndef KPIPELINE_FRAMEWORK_ENGINE_APPLICATION_ENGINE_HPP_
#define KPIPELINE_FRAMEWORK_ENGINE_APPLICATION_ENGINE_HPP_

#include "application/application.hpp"
#include "context/application_call.hpp"
#include "engine/engine_config.hpp"
#include "engine/io_context_pool.hpp"
#include "exception/pipeline_exceptions.hpp"
#include "pipeline/pipeline.hpp"
#include <boost/asio/any_io_executor.hpp>
#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace kpipeline::framework
{
  struct EnginePhases
  {
    static inline const PhasePtr Before = make_phase("Before");
    static inline const PhasePtr Call = make_phase("Call");

    static std::vector<PhasePtr> all() { return {Before, Call}; }
  };

  // Handle to an asynchronous call.
  class CallHandle
  {
  public:
    CallHandle(boost::asio::any_io_executor executor, CancellationToken token);

    // Cancels the call on its own executor.
    void cancel(const std::string& reason = "Call was cancelled") const;

    const CancellationToken& cancellation() const { return token_; }

  private:
    boost::asio::any_io_executor executor_;
    CancellationToken token_;
  };

  /**
   * @brief Loads the application and runs calls through it.
   *
   * The engine pipeline (Before, Call) wraps the application's call
   * pipeline and turns errors nothing handled into error responses. The
   * engine also owns the receive and send pipelines that connect the
   * application to the transport; they are merged into every loaded
   * application.
   */
  class ApplicationEngine
  {
  public:
    using Request = ApplicationCall::Request;
    using Response = ApplicationCall::Response;
    using Completion = std::function<void(std::exception_ptr, Response)>;

    explicit ApplicationEngine(EngineConfig config);
    ~ApplicationEngine();

    ApplicationEngine(const ApplicationEngine&) = delete;
    ApplicationEngine& operator=(const ApplicationEngine&) = delete;

    void start();

    // Replaces the application by a freshly loaded one. Not to be called while calls are running.
    void reload();

    /**
     * @brief Cancels running asynchronous calls, waits for them to complete,
     * then shuts the application down.
     * @throws std::logic_error when called from one of the engine's threads.
     */
    void stop();

    bool is_started() const { return application_ != nullptr; }

    Application& application() const;

    Pipeline& pipeline() { return pipeline_; }
    Pipeline& receive_pipeline() { return receive_pipeline_; }
    Pipeline& send_pipeline() { return send_pipeline_; }

    const EngineConfig& config() const { return config_; }

    /**
     * @brief Runs one call on the calling thread.
     * Interceptors cannot suspend in this mode.
     */
    Response execute(Request request);

    /**
     * @brief Runs one call as a coroutine on the engine's threads.
     * `completion` receives the response, or the error that ended the call
     * when no response could be produced (e.g. CancellationError).
     */
    CallHandle execute_async(Request request, Completion completion);

  private:
    void load_application();
    std::shared_ptr<Application> require_application() const;
    void run_call(ApplicationCall& call) const;

    static boost::beast::http::status status_for(ErrorKind kind);
    static void handle_failure(ApplicationCall& call, std::exception_ptr eptr, bool development);

    EngineConfig config_;
    IoContextPool pool_;
    Pipeline pipeline_;
    Pipeline receive_pipeline_;
    Pipeline send_pipeline_;
    std::shared_ptr<Application> application_;
    bool first_loading_ = true;

    std::mutex calls_mutex_;
    std::map<std::uint64_t, CallHandle> running_calls_;
    std::uint64_t next_call_id_ = 0;
    bool stopped_ = false;
  };
}

#endif // KPIPELINE_FRAMEWORK_ENGINE_APPLICATION_ENGINE_HPP_
