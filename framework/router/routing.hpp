// framework/router/routing.hpp
#ifndef KPIPELINE_FRAMEWORK_ROUTER_ROUTING_HPP_
#define KPIPELINE_FRAMEWORK_ROUTER_ROUTING_HPP_

#include "context/application_call.hpp"
#include "plugin/application_plugin.hpp"
#include <functional>
#include <map>
#include <memory>
#include <regex>
#include <string>
#include <tuple>
#include <vector>

namespace kpipeline::framework
{
  using RouteHandler = std::function<void(ApplicationCall&)>;

  // Call attribute holding the status routing failed with (boost::beast::http::status).
  inline const std::string RoutingFailureStatusKey = "RoutingFailureStatusCode";

  // 路由条目结构
  struct RouteEntry
  {
    std::string original_path;
    std::regex path_regex;
    std::vector<std::string> param_names;
    std::map<boost::beast::http::verb, RouteHandler> handlers;
    int literal_segments_count = 0;
    int dynamic_segments_count = 0;

    // True when a is more specific than b: more literal segments, then fewer dynamic ones.
    static bool compare_specificity(const RouteEntry& a, const RouteEntry& b)
    {
      if (a.literal_segments_count != b.literal_segments_count)
      {
        return a.literal_segments_count > b.literal_segments_count;
      }
      return a.dynamic_segments_count < b.dynamic_segments_count;
    }
  };

  /**
   * @brief Path-pattern routing, installed as a plugin at the Call phase.
   *
   * Patterns use `:name` segments. A matching handler runs with the path
   * parameters set on the call. Unmatched calls are left to the Fallback
   * phase with the failure status recorded under RoutingFailureStatusKey:
   * 405 when the path matched with a wrong non GET/HEAD method, else 404.
   */
  class Routing : public ApplicationPlugin
  {
  public:
    static constexpr const char* Key = "Routing";

    Routing();

    void get(const std::string& path, RouteHandler handler);
    void post(const std::string& path, RouteHandler handler);
    void put(const std::string& path, RouteHandler handler);
    void del(const std::string& path, RouteHandler handler);
    void options(const std::string& path, RouteHandler handler);

    std::size_t route_count() const { return routes_->size(); }

    // Returns true if a route handler ran.
    bool dispatch(ApplicationCall& call) const;

    void setup(PluginBuilder& builder) const override;

  private:
    using RouteTable = std::vector<RouteEntry>;

    std::shared_ptr<RouteTable> routes_;

    void add_route(const std::string& path_pattern, boost::beast::http::verb method, RouteHandler handler);

    static bool dispatch(const RouteTable& routes, ApplicationCall& call);

    static std::tuple<std::regex, std::vector<std::string>, int, int> parse_path_pattern(
      const std::string& path_pattern);

    static void handle_not_found(ApplicationCall& call);
    static void handle_method_not_allowed(ApplicationCall& call,
                                          const std::map<boost::beast::http::verb, RouteHandler>& allowed_methods);
  };
}

#endif // KPIPELINE_FRAMEWORK_ROUTER_ROUTING_HPP_
