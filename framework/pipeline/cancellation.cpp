// framework/pipeline/cancellation.cpp
#include "cancellation.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <algorithm>
#include <atomic>
#include <map>
#include <mutex>
#include <vector>

namespace kpipeline::framework
{
  namespace detail
  {
    struct CancellationState
    {
      std::atomic<bool> cancelled{false};
      std::mutex mutex;
      std::string reason;
      std::uint64_t next_id = 1;
      std::map<std::uint64_t, std::function<void()>> callbacks;
      std::vector<std::weak_ptr<CancellationState>> children;
    };

    namespace
    {
      void cancel_state(const std::shared_ptr<CancellationState>& state, const std::string& reason)
      {
        std::map<std::uint64_t, std::function<void()>> callbacks;
        std::vector<std::weak_ptr<CancellationState>> children;
        {
          std::lock_guard<std::mutex> lock(state->mutex);
          if (state->cancelled.load())
          {
            return;
          }
          state->reason = reason;
          state->cancelled.store(true);
          callbacks.swap(state->callbacks);
          children.swap(state->children);
        }

        for (auto& [id, callback] : callbacks)
        {
          callback();
        }
        for (const auto& weak_child : children)
        {
          if (auto child = weak_child.lock())
          {
            cancel_state(child, reason);
          }
        }
      }
    }
  }

  CancellationRegistration::CancellationRegistration(std::weak_ptr<detail::CancellationState> state,
                                                     const std::uint64_t id)
    : state_(std::move(state)), id_(id)
  {
  }

  CancellationRegistration::~CancellationRegistration()
  {
    reset();
  }

  CancellationRegistration::CancellationRegistration(CancellationRegistration&& other) noexcept
    : state_(std::move(other.state_)), id_(other.id_)
  {
    other.id_ = 0;
  }

  CancellationRegistration& CancellationRegistration::operator=(CancellationRegistration&& other) noexcept
  {
    if (this != &other)
    {
      reset();
      state_ = std::move(other.state_);
      id_ = other.id_;
      other.id_ = 0;
    }
    return *this;
  }

  void CancellationRegistration::reset()
  {
    if (id_ == 0)
    {
      return;
    }
    if (const auto state = state_.lock())
    {
      std::lock_guard<std::mutex> lock(state->mutex);
      state->callbacks.erase(id_);
    }
    state_.reset();
    id_ = 0;
  }

  CancellationToken::CancellationToken()
    : state_(std::make_shared<detail::CancellationState>())
  {
  }

  CancellationToken::CancellationToken(std::shared_ptr<detail::CancellationState> state)
    : state_(std::move(state))
  {
  }

  CancellationToken CancellationToken::make_child() const
  {
    auto child = std::make_shared<detail::CancellationState>();
    std::string parent_reason;
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (state_->cancelled.load())
      {
        parent_reason = state_->reason;
      }
      else
      {
        auto& children = state_->children;
        children.erase(std::remove_if(children.begin(), children.end(),
                                      [](const std::weak_ptr<detail::CancellationState>& c) { return c.expired(); }),
                       children.end());
        children.push_back(child);
        return CancellationToken(child);
      }
    }
    detail::cancel_state(child, parent_reason);
    return CancellationToken(child);
  }

  void CancellationToken::cancel(const std::string& reason) const
  {
    detail::cancel_state(state_, reason);
  }

  bool CancellationToken::is_cancelled() const
  {
    return state_->cancelled.load();
  }

  std::string CancellationToken::reason() const
  {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->reason;
  }

  void CancellationToken::throw_if_cancelled() const
  {
    if (is_cancelled())
    {
      throw CancellationError(reason());
    }
  }

  CancellationRegistration CancellationToken::on_cancel(std::function<void()> callback) const
  {
    {
      std::lock_guard<std::mutex> lock(state_->mutex);
      if (!state_->cancelled.load())
      {
        const std::uint64_t id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(callback));
        return CancellationRegistration(state_, id);
      }
    }
    callback();
    return {};
  }
}
