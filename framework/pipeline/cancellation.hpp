#ifndef KPIPELINE_FRAMEWORK_PIPELINE_CANCELLATION_HPP_
#define KPIPELINE_FRAMEWORK_PIPELINE_CANCELLATION_HPP_

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace kpipeline::framework
{
  namespace detail
  {
    struct CancellationState;
  }

  // Removes its callback from the token when destroyed.
  class CancellationRegistration
  {
  public:
    CancellationRegistration() = default;
    ~CancellationRegistration();

    CancellationRegistration(CancellationRegistration&& other) noexcept;
    CancellationRegistration& operator=(CancellationRegistration&& other) noexcept;
    CancellationRegistration(const CancellationRegistration&) = delete;
    CancellationRegistration& operator=(const CancellationRegistration&) = delete;

    void reset();

  private:
    friend class CancellationToken;

    CancellationRegistration(std::weak_ptr<detail::CancellationState> state, std::uint64_t id);

    std::weak_ptr<detail::CancellationState> state_;
    std::uint64_t id_ = 0;
  };

  /**
   * @brief Shared cancellation flag of one call or one pipeline run.
   *
   * Copies share the same state. A child token is cancelled together with its
   * parent, but cancelling the child leaves the parent untouched, which keeps
   * nested pipeline runs independently cancellable.
   */
  class CancellationToken
  {
  public:
    CancellationToken();

    CancellationToken make_child() const;

    // Idempotent. Callbacks run on the cancelling thread, once.
    void cancel(const std::string& reason = "Call was cancelled") const;

    bool is_cancelled() const;
    std::string reason() const;

    // Throws CancellationError when cancelled.
    void throw_if_cancelled() const;

    // Runs `callback` immediately if already cancelled.
    CancellationRegistration on_cancel(std::function<void()> callback) const;

  private:
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state);

    std::shared_ptr<detail::CancellationState> state_;
  };
}

#endif // KPIPELINE_FRAMEWORK_PIPELINE_CANCELLATION_HPP_
