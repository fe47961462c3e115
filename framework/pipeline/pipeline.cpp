// framework/pipeline/pipeline.cpp
#include "pipeline.hpp"
#include "context/application_call.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <algorithm>
#include <stdexcept>

namespace kpipeline::framework
{
  Pipeline::Pipeline(std::string name, const std::vector<PhasePtr>& phases)
    : name_(std::move(name)), chain_(std::make_shared<const InterceptorChain>())
  {
    for (const auto& phase : phases)
    {
      add_phase(phase);
    }
  }

  std::vector<Pipeline::PhaseContent>::iterator Pipeline::find_content(const PhasePtr& phase)
  {
    return std::find_if(phases_.begin(), phases_.end(),
                        [&phase](const PhaseContent& content) { return content.phase == phase; });
  }

  std::vector<Pipeline::PhaseContent>::const_iterator Pipeline::find_content(const PhasePtr& phase) const
  {
    return std::find_if(phases_.begin(), phases_.end(),
                        [&phase](const PhaseContent& content) { return content.phase == phase; });
  }

  std::vector<Pipeline::PhaseContent>::iterator Pipeline::require_content(const PhasePtr& phase)
  {
    if (!phase)
    {
      throw std::invalid_argument("Phase cannot be null");
    }
    const auto it = find_content(phase);
    if (it == phases_.end())
    {
      throw PhaseNotFoundError(phase->name());
    }
    return it;
  }

  void Pipeline::add_phase(PhasePtr phase)
  {
    if (!phase)
    {
      throw std::invalid_argument("Phase cannot be null");
    }
    if (contains(phase))
    {
      return;
    }
    phases_.push_back(PhaseContent{std::move(phase), {}});
  }

  void Pipeline::insert_phase_before(const PhasePtr& reference, PhasePtr phase)
  {
    insert_relative(reference, std::move(phase), false);
  }

  void Pipeline::insert_phase_after(const PhasePtr& reference, PhasePtr phase)
  {
    insert_relative(reference, std::move(phase), true);
  }

  void Pipeline::insert_relative(const PhasePtr& reference, PhasePtr phase, const bool after)
  {
    if (!phase)
    {
      throw std::invalid_argument("Phase cannot be null");
    }
    auto anchor = require_content(reference);
    if (contains(phase))
    {
      return;
    }
    if (after)
    {
      ++anchor;
    }
    phases_.insert(anchor, PhaseContent{std::move(phase), {}});
  }

  bool Pipeline::contains(const PhasePtr& phase) const
  {
    return find_content(phase) != phases_.end();
  }

  std::optional<std::size_t> Pipeline::index_of(const PhasePtr& phase) const
  {
    const auto it = find_content(phase);
    if (it == phases_.end())
    {
      return std::nullopt;
    }
    return static_cast<std::size_t>(std::distance(phases_.begin(), it));
  }

  std::vector<PhasePtr> Pipeline::items() const
  {
    std::vector<PhasePtr> result;
    result.reserve(phases_.size());
    for (const auto& content : phases_)
    {
      result.push_back(content.phase);
    }
    return result;
  }

  PhasePtr Pipeline::find_phase(const std::string& name) const
  {
    const auto it = std::find_if(phases_.begin(), phases_.end(),
                                 [&name](const PhaseContent& content) { return content.phase->name() == name; });
    return it != phases_.end() ? it->phase : nullptr;
  }

  Pipeline::Snapshot Pipeline::snapshot() const
  {
    Snapshot snapshot;
    snapshot.phases_ = phases_;
    return snapshot;
  }

  void Pipeline::restore(Snapshot snapshot)
  {
    phases_ = std::move(snapshot.phases_);
    rebuild_chain();
  }

  void Pipeline::intercept(const PhasePtr& phase, Interceptor interceptor)
  {
    if (!interceptor)
    {
      throw std::invalid_argument("Interceptor cannot be null");
    }
    auto content = require_content(phase);
    content->interceptors.push_back(std::make_shared<const InterceptorEntry>(InterceptorEntry{
      content->phase, std::move(interceptor)
    }));
    rebuild_chain();
  }

  void Pipeline::merge(const Pipeline& from)
  {
    if (&from == this)
    {
      return;
    }

    const auto& source = from.phases_;
    for (std::size_t i = 0; i < source.size(); ++i)
    {
      const PhasePtr& phase = source[i].phase;
      if (contains(phase))
      {
        continue;
      }
      if (i > 0)
      {
        // The predecessor is present: it was either here already or merged just before.
        insert_relative(source[i - 1].phase, phase, true);
        continue;
      }
      const auto successor = std::find_if(source.begin() + 1, source.end(),
                                          [this](const PhaseContent& content) { return contains(content.phase); });
      if (successor != source.end())
      {
        insert_relative(successor->phase, phase, false);
      }
      else
      {
        add_phase(phase);
      }
    }

    for (const auto& content : from.phases_)
    {
      auto target = find_content(content.phase);
      for (const auto& entry : content.interceptors)
      {
        const bool known = std::find(target->interceptors.begin(), target->interceptors.end(), entry)
          != target->interceptors.end();
        if (!known)
        {
          target->interceptors.push_back(entry);
        }
      }
    }

    rebuild_chain();
  }

  std::size_t Pipeline::interceptors_count() const
  {
    return chain_->size();
  }

  std::size_t Pipeline::interceptors_count(const PhasePtr& phase) const
  {
    const auto it = find_content(phase);
    return it != phases_.end() ? it->interceptors.size() : 0;
  }

  bool Pipeline::is_empty() const
  {
    return chain_->empty();
  }

  void Pipeline::rebuild_chain()
  {
    auto chain = std::make_shared<InterceptorChain>();
    for (const auto& content : phases_)
    {
      chain->insert(chain->end(), content.interceptors.begin(), content.interceptors.end());
    }
    chain_ = std::move(chain);
  }

  std::any Pipeline::execute(ApplicationCall& call, std::any subject) const
  {
    PipelineContext context(call, std::move(subject), chain_, call.cancellation().make_child());
    return std::move(context.execute());
  }
}
