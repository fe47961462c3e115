// framework/router/routing.cpp
#include "routing.hpp"
#include "application/application.hpp"
#include <fmt/core.h>
#include <algorithm>

namespace kpipeline::framework
{
  namespace
  {
    std::string escape_regex(const std::string& literal)
    {
      static const std::regex special(R"([\.\+\*\?\|\(\)\[\]\{\}\^\$\\])");
      return std::regex_replace(literal, special, "\\$&");
    }

    std::string verb_name(const boost::beast::http::verb method)
    {
      const auto name = boost::beast::http::to_string(method);
      return std::string(name.data(), name.size());
    }
  }

  Routing::Routing()
    : ApplicationPlugin(Key), routes_(std::make_shared<RouteTable>())
  {
  }

  std::tuple<std::regex, std::vector<std::string>, int, int> Routing::parse_path_pattern(
    const std::string& path_pattern)
  {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (start <= path_pattern.size())
    {
      const std::size_t found = path_pattern.find('/', start);
      const std::size_t end = found == std::string::npos ? path_pattern.size() : found;
      segments.push_back(path_pattern.substr(start, end - start));
      if (found == std::string::npos)
      {
        break;
      }
      start = found + 1;
    }

    const auto is_param = [](const std::string& segment)
    {
      return segment.size() > 1 && segment[0] == ':';
    };
    std::size_t last_param = segments.size();
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
      if (is_param(segments[i]))
      {
        last_param = i;
      }
    }

    std::string regex_str = "^";
    std::vector<std::string> param_names;
    int literal_segments = 0;
    int dynamic_segments = 0;
    for (std::size_t i = 0; i < segments.size(); ++i)
    {
      const std::string& segment = segments[i];
      if (i > 0)
      {
        regex_str += '/';
      }
      if (is_param(segment))
      {
        param_names.push_back(segment.substr(1));
        ++dynamic_segments;
        // The last parameter swallows the rest of the path.
        regex_str += i == last_param ? "(.*)" : "([^/]+)";
      }
      else
      {
        if (!segment.empty())
        {
          ++literal_segments;
        }
        regex_str += escape_regex(segment);
      }
    }
    regex_str += "$";

    return {std::regex(regex_str), param_names, literal_segments, dynamic_segments};
  }

  void Routing::add_route(const std::string& path_pattern, const boost::beast::http::verb method,
                          RouteHandler handler)
  {
    if (!handler)
    {
      throw std::invalid_argument("Route handler cannot be null");
    }
    for (auto& entry : *routes_)
    {
      if (entry.original_path == path_pattern)
      {
        entry.handlers[method] = std::move(handler);
        fmt::print("Updated handler for route: {} {}\n", verb_name(method), path_pattern);
        return;
      }
    }

    RouteEntry new_entry;
    new_entry.original_path = path_pattern;
    auto [regex, params, literal_count, dynamic_count] = parse_path_pattern(path_pattern);
    new_entry.path_regex = std::move(regex);
    new_entry.param_names = std::move(params);
    new_entry.literal_segments_count = literal_count;
    new_entry.dynamic_segments_count = dynamic_count;
    new_entry.handlers[method] = std::move(handler);

    routes_->push_back(std::move(new_entry));
    std::stable_sort(routes_->begin(), routes_->end(), RouteEntry::compare_specificity);
    fmt::print("Registered route: {} {} (literal:{}, dynamic:{})\n",
               verb_name(method), path_pattern, literal_count, dynamic_count);
  }

  void Routing::get(const std::string& path, RouteHandler handler)
  {
    add_route(path, boost::beast::http::verb::get, std::move(handler));
  }

  void Routing::post(const std::string& path, RouteHandler handler)
  {
    add_route(path, boost::beast::http::verb::post, std::move(handler));
  }

  void Routing::put(const std::string& path, RouteHandler handler)
  {
    add_route(path, boost::beast::http::verb::put, std::move(handler));
  }

  void Routing::del(const std::string& path, RouteHandler handler)
  {
    add_route(path, boost::beast::http::verb::delete_, std::move(handler));
  }

  void Routing::options(const std::string& path, RouteHandler handler)
  {
    add_route(path, boost::beast::http::verb::options, std::move(handler));
  }

  bool Routing::dispatch(ApplicationCall& call) const
  {
    return dispatch(*routes_, call);
  }

  bool Routing::dispatch(const RouteTable& routes, ApplicationCall& call)
  {
    const std::string request_path = call.path();
    const boost::beast::http::verb request_method = call.method();

    for (const auto& entry : routes)
    {
      if (std::smatch matches; std::regex_match(request_path, matches, entry.path_regex))
      {
        if (const auto method_it = entry.handlers.find(request_method); method_it != entry.handlers.end())
        {
          std::map<std::string, std::string> path_params;
          for (size_t i = 0; i < entry.param_names.size(); ++i)
          {
            if (i + 1 < matches.size())
            {
              path_params[entry.param_names[i]] = matches[i + 1].str();
            }
          }
          call.set_path_params(std::move(path_params));

          method_it->second(call);
          return true;
        }
        if (request_method != boost::beast::http::verb::get && request_method != boost::beast::http::verb::head)
        {
          handle_method_not_allowed(call, entry.handlers);
          return false;
        }
      }
    }

    handle_not_found(call);
    return false;
  }

  void Routing::setup(PluginBuilder& builder) const
  {
    builder.intercept(InterceptionCategory::Call, ApplicationCallPhases::Call,
                      [routes = routes_](PipelineContext& context)
                      {
                        dispatch(*routes, context.call());
                        context.proceed();
                      });
  }

  void Routing::handle_not_found(ApplicationCall& call)
  {
    call.set_attribute(RoutingFailureStatusKey, boost::beast::http::status::not_found);
    fmt::print(stderr, "404 Not Found: {}\n", call.path());
  }

  void Routing::handle_method_not_allowed(ApplicationCall& call,
                                          const std::map<boost::beast::http::verb, RouteHandler>& allowed_methods)
  {
    call.set_attribute(RoutingFailureStatusKey, boost::beast::http::status::method_not_allowed);

    std::string allowed_methods_str;
    bool first = true;
    for (const auto& pair : allowed_methods)
    {
      if (!first) allowed_methods_str += ", ";
      allowed_methods_str += verb_name(pair.first);
      first = false;
    }
    call.set_header(boost::beast::http::field::allow, allowed_methods_str);
    fmt::print(stderr, "405 Method Not Allowed: {} {}\n", verb_name(call.method()), call.path());
  }
}
