// framework/pipeline/pipeline.hpp
#ifndef KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_HPP_
#define KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_HPP_

#include "pipeline/pipeline_context.hpp"
#include "pipeline/pipeline_phase.hpp"
#include <any>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kpipeline::framework
{
  class ApplicationCall;

  /**
   * @brief Ordered list of phases, each holding its interceptors.
   *
   * Mutated only while the application installs plugins. Every mutation
   * rebuilds the flattened interceptor chain, so execute() only reads.
   */
  class Pipeline
  {
    struct PhaseContent
    {
      PhasePtr phase;
      std::vector<InterceptorEntryPtr> interceptors;
    };

  public:
    // Saved phases and registrations of a pipeline, see snapshot().
    class Snapshot
    {
      friend class Pipeline;
      std::vector<PhaseContent> phases_;
    };

    explicit Pipeline(std::string name = "Pipeline", const std::vector<PhasePtr>& phases = {});

    Pipeline(const Pipeline&) = delete;
    Pipeline& operator=(const Pipeline&) = delete;

    const std::string& name() const { return name_; }

    // Adding a phase that is already present is a no-op.
    void add_phase(PhasePtr phase);
    void insert_phase_before(const PhasePtr& reference, PhasePtr phase);
    void insert_phase_after(const PhasePtr& reference, PhasePtr phase);

    bool contains(const PhasePtr& phase) const;
    std::optional<std::size_t> index_of(const PhasePtr& phase) const;
    std::vector<PhasePtr> items() const;
    PhasePtr find_phase(const std::string& name) const;

    void intercept(const PhasePtr& phase, Interceptor interceptor);

    /**
     * @brief Merges the phases and interceptors of `from` into this pipeline.
     * A missing phase is inserted right after its predecessor in `from`, or
     * before the first later phase of `from` already present here, so the
     * relative order of `from` is kept. Registrations already present are
     * skipped: merging twice is the same as merging once.
     */
    void merge(const Pipeline& from);

    std::size_t interceptors_count() const;
    std::size_t interceptors_count(const PhasePtr& phase) const;
    bool is_empty() const;

    std::shared_ptr<const InterceptorChain> interceptors() const { return chain_; }

    // Undoes every mutation made after `snapshot` was taken.
    Snapshot snapshot() const;
    void restore(Snapshot snapshot);

    /**
     * @brief Runs all interceptors for `call` with `subject`.
     * The run gets a child of the call's cancellation token.
     * @return The final subject.
     */
    std::any execute(ApplicationCall& call, std::any subject) const;

  private:
    std::vector<PhaseContent>::iterator find_content(const PhasePtr& phase);
    std::vector<PhaseContent>::const_iterator find_content(const PhasePtr& phase) const;
    std::vector<PhaseContent>::iterator require_content(const PhasePtr& phase);

    void insert_relative(const PhasePtr& reference, PhasePtr phase, bool after);
    void rebuild_chain();

    std::string name_;
    std::vector<PhaseContent> phases_;
    std::shared_ptr<const InterceptorChain> chain_;
  };
}

#endif // KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_HPP_
