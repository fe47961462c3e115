// framework/context/application_call.cpp
#include "application_call.hpp"
#include "application/application.hpp"
#include "exception/pipeline_exceptions.hpp"
#include <boost/beast/version.hpp>

namespace kpipeline::framework
{
  ApplicationCall::ApplicationCall(Application& application, Request& req, Response& res)
    : application_(application), req_(req), res_(res)
  {
    res_.version(req_.version());
    res_.keep_alive(req_.keep_alive());
    res_.set(boost::beast::http::field::server, BOOST_BEAST_VERSION_STRING);
  }

  const std::string& ApplicationCall::path() const
  {
    if (!path_parsed_)
    {
      const boost::beast::string_view target = req_.target();
      const boost::beast::string_view path = target.substr(0, target.find('?'));
      cached_path_.assign(path.data(), path.size());
      if (cached_path_.empty())
      {
        cached_path_ = "/";
      }
      path_parsed_ = true;
    }
    return cached_path_;
  }

  boost::beast::http::verb ApplicationCall::method() const
  {
    return req_.method();
  }

  std::string ApplicationCall::body() const
  {
    return req_.body();
  }

  std::optional<std::string> ApplicationCall::get_path_param(const std::string& key) const
  {
    if (const auto it = path_params_.find(key); it != path_params_.end())
    {
      return it->second;
    }
    return std::nullopt;
  }

  std::optional<std::string> ApplicationCall::get_header(const boost::beast::string_view name) const
  {
    if (const auto it = req_.find(name); it != req_.end())
    {
      return std::string(it->value().data(), it->value().size());
    }
    return std::nullopt;
  }

  std::optional<std::string> ApplicationCall::get_header(const boost::beast::http::field name) const
  {
    return get_header(boost::beast::http::to_string(name));
  }

  std::vector<std::string> ApplicationCall::get_headers(const boost::beast::http::field name) const
  {
    std::vector<std::string> values;
    const auto range = req_.equal_range(name);
    for (auto it = range.first; it != range.second; ++it)
    {
      values.emplace_back(it->value().data(), it->value().size());
    }
    return values;
  }

  void ApplicationCall::set_status(const boost::beast::http::status status)
  {
    res_.result(status);
    response_status_ = status;
  }

  void ApplicationCall::set_body(std::string body) const
  {
    res_.body() = std::move(body);
    res_.prepare_payload();
  }

  void ApplicationCall::set_header(const boost::beast::string_view name, const boost::beast::string_view value) const
  {
    res_.set(name, value);
  }

  void ApplicationCall::set_header(const boost::beast::http::field name, const boost::beast::string_view value) const
  {
    res_.set(name, value);
  }

  void ApplicationCall::set_content_type(const boost::beast::string_view type) const
  {
    res_.set(boost::beast::http::field::content_type, type);
  }

  void ApplicationCall::set_path_params(std::map<std::string, std::string> params)
  {
    path_params_ = std::move(params);
  }

  void ApplicationCall::respond(std::any message)
  {
    application_.send_pipeline().execute(*this, std::move(message));
  }

  std::any ApplicationCall::receive(const std::type_index type)
  {
    std::any result = application_.receive_pipeline().execute(*this, ReceiveRequest{type, {}});
    auto* request = std::any_cast<ReceiveRequest>(&result);
    if (request == nullptr || !request->value.has_value() || std::type_index(request->value.type()) != type)
    {
      throw CannotTransformContentError(type.name());
    }
    return std::move(request->value);
  }

  void ApplicationCall::commit(const OutgoingContent& content)
  {
    if (committed_)
    {
      throw ResponseAlreadySentError();
    }
    committed_ = true;
    response_status_ = content.status.value_or(boost::beast::http::status::ok);
  }
}
