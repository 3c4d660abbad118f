#pragma once

#include "codebox/common/result.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace codebox::gateway {

struct HttpRequest {
  std::string method;
  std::string path;
  std::string raw_path;
  // Header names are lowercased.
  std::unordered_map<std::string, std::string> headers;
  std::unordered_map<std::string, std::string> query;
  std::string body;
  // Textual address of the TCP peer, empty when unknown.
  std::string peer_address;
};

struct HttpResponse {
  int status = 200;
  std::string content_type = "application/json";
  std::string body;
  std::unordered_map<std::string, std::string> headers;
};

[[nodiscard]] std::string status_text(int status);
[[nodiscard]] int http_status_for(common::ErrorCode code);

[[nodiscard]] std::string header_lookup(const HttpRequest &request, const std::string &key);
[[nodiscard]] std::vector<std::string> split_path(const std::string &path);

[[nodiscard]] HttpResponse make_json_response(int status, std::string body);
/// `{"error": <kind>, "detail": <message>}`.
[[nodiscard]] HttpResponse make_error_response(int status, const std::string &error,
                                               const std::string &detail);
[[nodiscard]] HttpResponse make_error_response(common::ErrorCode code, const std::string &detail);

[[nodiscard]] std::string render_http_response(const HttpResponse &response);

/// Parses the request line, headers, and everything after the blank line as the body.
[[nodiscard]] common::Result<HttpRequest> parse_http_request(const std::string &raw);

/// Content-Length of a parsed head; 0 when absent, failure when not a number.
[[nodiscard]] common::Result<std::size_t> content_length_of(const HttpRequest &request);

} // namespace codebox::gateway
