#ifndef KPIPELINE_FRAMEWORK_CONTEXT_OUTGOING_CONTENT_HPP_
#define KPIPELINE_FRAMEWORK_CONTEXT_OUTGOING_CONTENT_HPP_

#include <boost/beast/http/status.hpp>
#include <any>
#include <optional>
#include <string>
#include <typeindex>

namespace kpipeline::framework
{
  /**
   * @brief Final representation of a response, produced by the send pipeline
   * and handed to the response writer.
   * A missing status means 200 OK.
   */
  struct OutgoingContent
  {
    std::optional<boost::beast::http::status> status;
    std::string content_type;
    std::string body;

    static OutgoingContent text(std::string body, std::string content_type = "text/plain; charset=UTF-8")
    {
      return OutgoingContent{std::nullopt, std::move(content_type), std::move(body)};
    }

    static OutgoingContent status_only(const boost::beast::http::status status)
    {
      return OutgoingContent{status, {}, {}};
    }
  };

  // Subject of the receive pipeline.
  struct ReceiveRequest
  {
    std::type_index type;
    std::any value;
  };
}

#endif // KPIPELINE_FRAMEWORK_CONTEXT_OUTGOING_CONTENT_HPP_
