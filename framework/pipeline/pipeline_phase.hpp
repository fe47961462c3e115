#ifndef KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_PHASE_HPP_
#define KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_PHASE_HPP_

#include <memory>
#include <string>

namespace kpipeline::framework
{
  /**
   * @brief A named slot in a pipeline.
   * Phases compare by identity: two phases with the same name are different
   * phases. Always held through PhasePtr.
   */
  class PipelinePhase
  {
  public:
    explicit PipelinePhase(std::string name) : name_(std::move(name))
    {
    }

    PipelinePhase(const PipelinePhase&) = delete;
    PipelinePhase& operator=(const PipelinePhase&) = delete;

    const std::string& name() const { return name_; }

  private:
    const std::string name_;
  };

  using PhasePtr = std::shared_ptr<const PipelinePhase>;

  inline PhasePtr make_phase(std::string name)
  {
    return std::make_shared<const PipelinePhase>(std::move(name));
  }
}

#endif // KPIPELINE_FRAMEWORK_PIPELINE_PIPELINE_PHASE_HPP_
