// framework/plugin/relative_plugin_builder.cpp
#include "relative_plugin_builder.hpp"
#include "application/application.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <optional>

namespace kpipeline::framework
{
  namespace
  {
    struct Boundary
    {
      std::optional<std::size_t> index;
      std::vector<PhasePtr> dependencies;
    };

    // Positions of another plugin's phases in `pipeline`, sorted.
    std::vector<std::size_t> sorted_positions(const PluginBuilder& other,
                                              const InterceptionCategory category,
                                              const Pipeline& pipeline)
    {
      std::vector<std::size_t> positions;
      for (const auto& phase : other.phases(category))
      {
        const auto index = pipeline.index_of(phase);
        if (!index)
        {
          throw MissingDependencyError(other.key());
        }
        positions.push_back(*index);
      }
      std::sort(positions.begin(), positions.end());
      return positions;
    }

    Boundary find_boundary(const Application& application,
                           const std::vector<std::string>& other_keys,
                           const InterceptionCategory category,
                           const Pipeline& pipeline,
                           const RelativePluginBuilder::Placement placement)
    {
      const bool after = placement == RelativePluginBuilder::Placement::After;
      Boundary boundary;
      for (const auto& key : other_keys)
      {
        const auto other = application.find_plugin(key);
        if (!other)
        {
          throw MissingDependencyError(key);
        }
        const auto positions = sorted_positions(*other, category, pipeline);
        if (positions.empty())
        {
          continue;
        }
        const std::size_t candidate = after ? positions.back() : positions.front();
        if (!boundary.index || (after ? candidate > *boundary.index : candidate < *boundary.index))
        {
          boundary.index = candidate;
        }
        const auto phases = other->phases(category);
        boundary.dependencies.insert(boundary.dependencies.end(), phases.begin(), phases.end());
      }
      return boundary;
    }

    void verify_order(const Pipeline& pipeline,
                      const PhasePtr& phase,
                      const std::vector<PhasePtr>& dependencies,
                      const RelativePluginBuilder::Placement placement)
    {
      const std::size_t position = *pipeline.index_of(phase);
      for (const auto& dependency : dependencies)
      {
        const std::size_t other = *pipeline.index_of(dependency);
        const bool satisfied = placement == RelativePluginBuilder::Placement::After
                                 ? position > other
                                 : position < other;
        if (!satisfied)
        {
          throw PhaseOrderConflictError(fmt::format(
            "Phase '{}' cannot be placed {} phase '{}'", phase->name(),
            placement == RelativePluginBuilder::Placement::After ? "after" : "before", dependency->name()));
        }
      }
    }
  }

  RelativePluginBuilder::RelativePluginBuilder(PluginBuilder& current,
                                               std::vector<std::string> other_keys,
                                               const Placement placement)
    : current_(current), other_keys_(std::move(other_keys)), placement_(placement)
  {
    if (std::find(other_keys_.begin(), other_keys_.end(), current_.key()) != other_keys_.end())
    {
      throw PhaseOrderConflictError(fmt::format("Plugin '{}' cannot be ordered relative to itself", current_.key()));
    }
  }

  void RelativePluginBuilder::register_interceptor(const InterceptionCategory category, Interceptor interceptor)
  {
    PhasePtr phase = current_.new_phase();
    Application& application = current_.application();

    current_.add_interception(category, Interception{
                                phase,
                                [&application, category, phase, others = other_keys_, placement = placement_,
                                  interceptor = std::move(interceptor)](Pipeline& pipeline)
                                {
                                  const Boundary boundary = find_boundary(application, others, category, pipeline,
                                                                          placement);
                                  if (!boundary.index)
                                  {
                                    pipeline.insert_phase_after(default_phase(category), phase);
                                  }
                                  else
                                  {
                                    const PhasePtr anchor = pipeline.items()[*boundary.index];
                                    if (placement == Placement::After)
                                    {
                                      pipeline.insert_phase_after(anchor, phase);
                                    }
                                    else
                                    {
                                      pipeline.insert_phase_before(anchor, phase);
                                    }
                                  }
                                  verify_order(pipeline, phase, boundary.dependencies, placement);
                                  pipeline.intercept(phase, interceptor);
                                }
                              });
  }
}
