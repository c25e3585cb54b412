#pragma once

#include <cstddef>
#include <functional>
#include <json/json.h>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include "log.hpp"
#include "service.hpp"

namespace kb_bridge {

inline constexpr std::string_view route_prefix = "/api/kb";

struct Request
{
  std::string method;
  std::string path;
  std::map<std::string, std::string> query;
  std::string body;
};

struct Response
{
  int status = 200;
  Json::Value body;

  // Compact JSON, for writing to the wire
  [[nodiscard]] std::string text() const
  {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, body);
  }
};

namespace detail {

// Request body could not be used; becomes a 422
struct BadRequest
{
  std::string detail;
};

inline Response error_response(int status, const std::string& detail)
{
  Response response{ .status = status, .body = Json::Value(Json::objectValue) };
  response.body["detail"] = detail;
  return response;
}

inline Response result_response(const std::string& result)
{
  Response response{ .status = 200, .body = Json::Value(Json::objectValue) };
  response.body["result"] = result;
  return response;
}

inline std::optional<BadRequest> parse_object(const std::string& body, Json::Value& out)
{
  Json::CharReaderBuilder builder;
  std::istringstream input(body);
  std::string errors;
  if (!Json::parseFromStream(builder, input, &out, &errors)) { return BadRequest{ "malformed JSON body: " + errors }; }
  if (!out.isObject()) { return BadRequest{ "request body must be a JSON object" }; }
  return std::nullopt;
}

inline std::optional<BadRequest> read_string(const Json::Value& body, const char* key, std::string& out)
{
  if (!body.isMember(key)) { return BadRequest{ std::string("missing field '") + key + "'" }; }
  if (!body[key].isString()) { return BadRequest{ std::string("field '") + key + "' must be a string" }; }
  out = body[key].asString();
  return std::nullopt;
}

inline std::optional<BadRequest> read_limit(const Json::Value& body, std::size_t fallback, std::size_t& out)
{
  out = fallback;
  if (!body.isMember("limit")) { return std::nullopt; }
  const Json::Value& value = body["limit"];
  // isIntegral() also accepts values past INT64_MAX, which asInt64() rejects by throwing
  if (!value.isIntegral() || !value.isInt64() || value.asInt64() <= 0) {
    return BadRequest{ "field 'limit' must be a positive integer" };
  }
  out = static_cast<std::size_t>(value.asUInt64());
  return std::nullopt;
}

} // namespace detail

// =============================================================================
// Router - maps HTTP-shaped requests 1:1 onto KnowledgeService calls
// The HTTP server itself lives outside this library; it only has to build a
// Request and write back Response::status and Response::text().
// =============================================================================

class Router
{
public:
  explicit Router(KnowledgeService& service) : service_(service)
  {
    add("GET", "/status", [this](const Request&) { return status(); });
    add("POST", "/search", [this](const Request& request) { return search_like(request, false); });
    add("POST", "/find", [this](const Request& request) { return search_like(request, true); });
    add("POST", "/add", [this](const Request& request) { return add_resource(request); });
    add("GET", "/ls", [this](const Request& request) {
      return detail::result_response(
        service_.list_directory(query_or(request, "uri", std::string(default_directory_uri))));
    });
    add("GET", "/read", [this](const Request& request) {
      return with_uri(request, [this](const std::string& uri) { return service_.read(uri); });
    });
    add("GET", "/abstract", [this](const Request& request) {
      return with_uri(request, [this](const std::string& uri) { return service_.abstract(uri); });
    });
    add("GET", "/sessions", [this](const Request&) { return detail::result_response(service_.list_sessions()); });
  }

  Router(const Router&) = delete;
  Router& operator=(const Router&) = delete;
  Router(Router&&) = delete;
  Router& operator=(Router&&) = delete;
  ~Router() = default;

  [[nodiscard]] Response handle(const Request& request) const
  {
    const std::string_view path = request.path;
    if (!path.starts_with(route_prefix)) { return detail::error_response(404, "not found"); }
    const std::string local(path.substr(route_prefix.size()));

    const auto by_path = routes_.find(local);
    if (by_path == routes_.end()) { return detail::error_response(404, "not found"); }
    const auto by_method = by_path->second.find(request.method);
    if (by_method == by_path->second.end()) { return detail::error_response(405, "method not allowed"); }

    // Everything but /status needs a live backend; refuse before touching the service
    if (local != "/status" && !service_.ready()) {
      return detail::error_response(503, std::string(not_initialized_message));
    }
    return by_method->second(request);
  }

private:
  using handler = std::function<Response(const Request&)>;

  void add(const std::string& method, const std::string& path, handler fn) { routes_[path][method] = std::move(fn); }

  [[nodiscard]] Response status() const
  {
    Response response{ .status = 200, .body = Json::Value(Json::objectValue) };
    if (!service_.ready()) {
      response.body["status"] = "disabled";
      response.body["message"] = std::string(not_initialized_message);
    } else {
      response.body["status"] = "ok";
      response.body["ready"] = true;
    }
    return response;
  }

  Response search_like(const Request& request, bool deep)
  {
    Json::Value body;
    std::string query;
    std::size_t limit = 0;
    if (auto bad = detail::parse_object(request.body, body)) { return unprocessable(request, *bad); }
    if (auto bad = detail::read_string(body, "query", query)) { return unprocessable(request, *bad); }
    if (auto bad = detail::read_limit(body, default_search_limit, limit)) { return unprocessable(request, *bad); }
    return detail::result_response(deep ? service_.find(query, limit) : service_.search(query, limit));
  }

  Response add_resource(const Request& request)
  {
    Json::Value body;
    std::string path;
    if (auto bad = detail::parse_object(request.body, body)) { return unprocessable(request, *bad); }
    if (auto bad = detail::read_string(body, "path", path)) { return unprocessable(request, *bad); }
    return detail::result_response(service_.add_resource(path));
  }

  template<typename F> Response with_uri(const Request& request, F&& fn)
  {
    const auto uri = request.query.find("uri");
    if (uri == request.query.end() || uri->second.empty()) {
      return unprocessable(request, detail::BadRequest{ "missing query parameter 'uri'" });
    }
    return detail::result_response(std::forward<F>(fn)(uri->second));
  }

  static std::string query_or(const Request& request, const std::string& key, std::string fallback)
  {
    const auto found = request.query.find(key);
    return found == request.query.end() ? std::move(fallback) : found->second;
  }

  static Response unprocessable(const Request& request, const detail::BadRequest& bad)
  {
    logger()->warn("{} {}: {}", request.method, request.path, bad.detail);
    return detail::error_response(422, bad.detail);
  }

  KnowledgeService& service_;
  std::map<std::string, std::map<std::string, handler>> routes_;
};

} // namespace kb_bridge
