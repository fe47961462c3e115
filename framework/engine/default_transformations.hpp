// framework/engine/default_transformations.hpp
#ifndef KPIPELINE_FRAMEWORK_ENGINE_DEFAULT_TRANSFORMATIONS_HPP_
#define KPIPELINE_FRAMEWORK_ENGINE_DEFAULT_TRANSFORMATIONS_HPP_

#include "engine/engine_config.hpp"
#include "pipeline/pipeline.hpp"
#include <string>

namespace kpipeline::framework
{
  class Application;

  // Call attribute set once the send pipeline started for the call.
  inline const std::string SendPipelineExecutedKey = "SendPipelineExecuted";

  void write_response(ApplicationCall& call, const OutgoingContent& content);
  std::any read_request_body(ApplicationCall& call);

  // Engine-side send pipeline: commits the final content at the Engine phase.
  void setup_send_pipeline(Pipeline& send_pipeline, ResponseWriter writer);

  // Engine-side receive pipeline: loads the raw body at the Before phase.
  void setup_receive_pipeline(Pipeline& receive_pipeline, ReceiveSource source);

  /**
   * @brief Renders std::string and status values into OutgoingContent, and
   * serves std::string and byte vector requests from the raw body.
   */
  void install_default_transformations(Pipeline& receive_pipeline, Pipeline& send_pipeline);

  /**
   * @brief Host header validation at Call, and the Fallback response for
   * calls nothing responded to.
   */
  void install_default_interceptors(Application& application);

  // 415 for bodies that cannot be received, 406 for responses that were not rendered.
  void install_default_transformation_checker(Application& application);
}

#endif // KPIPELINE_FRAMEWORK_ENGINE_DEFAULT_TRANSFORMATIONS_HPP_
