#include "codebox/gateway/http.hpp"

#include "codebox/common/fs.hpp"
#include "codebox/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace codebox::gateway {

namespace {

std::unordered_map<std::string, std::string> parse_query_string(const std::string &query) {
  std::unordered_map<std::string, std::string> out;
  std::stringstream stream(query);
  std::string part;
  while (std::getline(stream, part, '&')) {
    if (part.empty()) {
      continue;
    }
    const auto eq = part.find('=');
    if (eq == std::string::npos) {
      out[part] = "";
      continue;
    }
    out[part.substr(0, eq)] = part.substr(eq + 1);
  }
  return out;
}

} // namespace

std::string status_text(const int status) {
  switch (status) {
  case 200:
    return "OK";
  case 201:
    return "Created";
  case 400:
    return "Bad Request";
  case 401:
    return "Unauthorized";
  case 403:
    return "Forbidden";
  case 404:
    return "Not Found";
  case 405:
    return "Method Not Allowed";
  case 409:
    return "Conflict";
  case 413:
    return "Payload Too Large";
  case 429:
    return "Too Many Requests";
  case 500:
    return "Internal Server Error";
  case 503:
    return "Service Unavailable";
  default:
    return "OK";
  }
}

int http_status_for(const common::ErrorCode code) {
  switch (code) {
  case common::ErrorCode::None:
    return 200;
  case common::ErrorCode::InvalidArgument:
  case common::ErrorCode::ValidationRejected:
    return 400;
  case common::ErrorCode::NotFound:
    return 404;
  case common::ErrorCode::AlreadyExists:
    return 409;
  case common::ErrorCode::RuntimeUnavailable:
  case common::ErrorCode::SandboxUnreachable:
    return 503;
  case common::ErrorCode::RateLimited:
    return 429;
  case common::ErrorCode::Unauthorized:
    return 401;
  case common::ErrorCode::Forbidden:
    return 403;
  case common::ErrorCode::Internal:
    return 500;
  }
  return 500;
}

std::string header_lookup(const HttpRequest &request, const std::string &key) {
  const auto it = request.headers.find(common::to_lower(key));
  if (it == request.headers.end()) {
    return "";
  }
  return it->second;
}

std::vector<std::string> split_path(const std::string &path) {
  std::vector<std::string> segments;
  for (auto &segment : common::split(path, '/')) {
    if (!segment.empty()) {
      segments.push_back(std::move(segment));
    }
  }
  return segments;
}

HttpResponse make_json_response(const int status, std::string body) {
  HttpResponse response;
  response.status = status;
  response.content_type = "application/json";
  response.body = std::move(body);
  return response;
}

HttpResponse make_error_response(const int status, const std::string &error,
                                 const std::string &detail) {
  return make_json_response(status, "{\"error\":" + common::json_string(error) +
                                        ",\"detail\":" + common::json_string(detail) + "}");
}

HttpResponse make_error_response(const common::ErrorCode code, const std::string &detail) {
  return make_error_response(http_status_for(code), std::string(common::error_code_name(code)),
                             detail);
}

std::string render_http_response(const HttpResponse &response) {
  std::ostringstream out;
  out << "HTTP/1.1 " << response.status << " " << status_text(response.status) << "\r\n";
  out << "Content-Type: " << response.content_type << "\r\n";
  out << "Content-Length: " << response.body.size() << "\r\n";
  out << "Connection: close\r\n";
  for (const auto &[k, v] : response.headers) {
    out << k << ": " << v << "\r\n";
  }
  out << "\r\n";
  out << response.body;
  return out.str();
}

common::Result<HttpRequest> parse_http_request(const std::string &raw) {
  const auto header_end = raw.find("\r\n\r\n");
  if (header_end == std::string::npos) {
    return common::Result<HttpRequest>::failure("incomplete request",
                                                common::ErrorCode::InvalidArgument);
  }

  const std::string headers_part = raw.substr(0, header_end);

  std::istringstream head_stream(headers_part);
  std::string line;
  if (!std::getline(head_stream, line)) {
    return common::Result<HttpRequest>::failure("missing request line",
                                                common::ErrorCode::InvalidArgument);
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }

  std::istringstream req_line(line);
  HttpRequest request;
  std::string http_version;
  if (!(req_line >> request.method >> request.raw_path >> http_version) ||
      !common::starts_with(http_version, "HTTP/")) {
    return common::Result<HttpRequest>::failure("invalid request line",
                                                common::ErrorCode::InvalidArgument);
  }

  while (std::getline(head_stream, line)) {
    if (!line.empty() && line.back() == '\r') {
      line.pop_back();
    }
    if (line.empty()) {
      continue;
    }
    const auto colon = line.find(':');
    if (colon == std::string::npos) {
      continue;
    }
    const std::string key = common::to_lower(common::trim(line.substr(0, colon)));
    request.headers[key] = common::trim(line.substr(colon + 1));
  }

  request.body = raw.substr(header_end + 4);
  const auto qpos = request.raw_path.find('?');
  if (qpos == std::string::npos) {
    request.path = request.raw_path;
  } else {
    request.path = request.raw_path.substr(0, qpos);
    request.query = parse_query_string(request.raw_path.substr(qpos + 1));
  }

  return common::Result<HttpRequest>::success(std::move(request));
}

common::Result<std::size_t> content_length_of(const HttpRequest &request) {
  const std::string value = header_lookup(request, "content-length");
  if (value.empty()) {
    return common::Result<std::size_t>::success(0);
  }
  std::size_t length = 0;
  const auto *begin = value.data();
  const auto *end = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(begin, end, length);
  if (ec != std::errc() || ptr != end) {
    return common::Result<std::size_t>::failure("invalid Content-Length",
                                                common::ErrorCode::InvalidArgument);
  }
  return common::Result<std::size_t>::success(length);
}

} // namespace codebox::gateway
