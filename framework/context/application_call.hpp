#ifndef KPIPELINE_FRAMEWORK_CONTEXT_APPLICATION_CALL_HPP_
#define KPIPELINE_FRAMEWORK_CONTEXT_APPLICATION_CALL_HPP_

#include "context/outgoing_content.hpp"
#include "pipeline/async_scope.hpp"
#include "pipeline/cancellation.hpp"
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/status.hpp>
#include <boost/beast/http/string_body.hpp>
#include <any>
#include <map>
#include <optional>
#include <string>
#include <typeindex>
#include <typeinfo>
#include <vector>

namespace kpipeline::framework
{
  class Application;

  /**
   * @brief One request/response exchange flowing through the application.
   *
   * Wraps the Beast request and response owned by the engine, carries
   * call-scoped attributes, and is the entry point for nested receive and
   * send pipeline runs.
   */
  class ApplicationCall
  {
  public:
    using Request = boost::beast::http::request<boost::beast::http::string_body>;
    using Response = boost::beast::http::response<boost::beast::http::string_body>;

    ApplicationCall(Application& application, Request& req, Response& res);

    ApplicationCall(const ApplicationCall&) = delete;
    ApplicationCall& operator=(const ApplicationCall&) = delete;

    Application& application() const { return application_; }

    const std::string& path() const;
    boost::beast::http::verb method() const;
    std::string body() const;
    std::optional<std::string> get_path_param(const std::string& key) const;
    std::optional<std::string> get_header(boost::beast::string_view name) const;
    std::optional<std::string> get_header(boost::beast::http::field name) const;
    std::vector<std::string> get_headers(boost::beast::http::field name) const;

    void set_status(boost::beast::http::status status);
    void set_body(std::string body) const;
    void set_header(boost::beast::string_view name, boost::beast::string_view value) const;
    void set_header(boost::beast::http::field name, boost::beast::string_view value) const;
    void set_content_type(boost::beast::string_view type) const;

    // Status set on the response so far, either explicitly or by a commit.
    std::optional<boost::beast::http::status> response_status() const { return response_status_; }

    Request& get_request() const { return req_; }
    Response& get_response() const { return res_; }

    void set_path_params(std::map<std::string, std::string> params);

    void set_attribute(const std::string& key, std::any value)
    {
      attributes_[key] = std::move(value);
    }

    std::any get_attribute(const std::string& key) const
    {
      auto it = attributes_.find(key);
      if (it != attributes_.end())
      {
        return it->second;
      }
      return {};
    }

    template <typename T>
    std::optional<T> get_attribute_as(const std::string& key) const
    {
      auto it = attributes_.find(key);
      if (it != attributes_.end())
      {
        if (const T* value = std::any_cast<T>(&it->second))
        {
          return *value;
        }
      }
      return std::nullopt;
    }

    bool has_attribute(const std::string& key) const
    {
      return attributes_.count(key) != 0;
    }

    void remove_attribute(const std::string& key)
    {
      attributes_.erase(key);
    }

    /**
     * @brief Runs the application's send pipeline with `message` as subject.
     * Strings, status codes and OutgoingContent are understood by the
     * default transformations.
     */
    void respond(std::any message);

    /**
     * @brief Runs the application's receive pipeline for a value of type T.
     * @throws CannotTransformContentError if no interceptor produced a T.
     */
    template <typename T>
    T receive()
    {
      std::any value = receive(std::type_index(typeid(T)));
      return std::any_cast<T>(std::move(value));
    }

    std::any receive(std::type_index type);

    /**
     * @brief Marks the response as sent with `content`.
     * @throws ResponseAlreadySentError on a second commit.
     */
    void commit(const OutgoingContent& content);
    bool is_committed() const { return committed_; }

    const CancellationToken& cancellation() const { return cancellation_; }
    void set_cancellation(CancellationToken token) { cancellation_ = std::move(token); }

    // Null unless the call runs inside a coroutine.
    const AsyncScope* async_scope() const { return async_scope_; }
    void set_async_scope(const AsyncScope* scope) { async_scope_ = scope; }

  private:
    Application& application_;
    Request& req_;
    Response& res_;
    mutable std::string cached_path_;
    mutable bool path_parsed_ = false;

    std::map<std::string, std::string> path_params_;
    std::map<std::string, std::any> attributes_;

    std::optional<boost::beast::http::status> response_status_;
    bool committed_ = false;
    CancellationToken cancellation_;
    const AsyncScope* async_scope_ = nullptr;
  };
}

#endif // KPIPELINE_FRAMEWORK_CONTEXT_APPLICATION_CALL_HPP_
