#include "codebox/sandbox/kernel_client.hpp"

#include "codebox/common/json_util.hpp"

#include <curl/curl.h>

#include <optional>

namespace codebox::sandbox {

namespace {

struct KernelResponse {
  long status = 0;
  std::string body;
  bool network_error = false;
  bool timeout = false;
  std::string network_error_message;
};

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

KernelResponse perform(const std::string &url, const std::optional<std::string> &json_body,
                       const std::chrono::milliseconds timeout) {
  KernelResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "codebox/0.1");

  struct curl_slist *header_list = nullptr;
  if (json_body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, json_body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(json_body->size()));
    header_list = curl_slist_append(header_list, "Content-Type: application/json");
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);
  return response;
}

std::string describe_failure(const KernelResponse &response) {
  if (response.timeout) {
    return "kernel request timed out";
  }
  if (response.network_error) {
    return "kernel unreachable: " + response.network_error_message;
  }
  return "kernel replied with HTTP " + std::to_string(response.status);
}

} // namespace

CurlKernelClient::CurlKernelClient(std::string host) : host_(std::move(host)) {
  curl_global_init(CURL_GLOBAL_DEFAULT);
}

CurlKernelClient::~CurlKernelClient() { curl_global_cleanup(); }

common::Result<kernel::ExecutionResult>
CurlKernelClient::execute(const std::uint16_t port, const std::string &code,
                          const std::chrono::milliseconds timeout) {
  const std::string url = "http://" + host_ + ":" + std::to_string(port) + "/execute";
  const auto response = perform(url, kernel::render_execute_request(code), timeout);
  if (response.network_error || response.status < 200 || response.status >= 300) {
    return common::Result<kernel::ExecutionResult>::failure(
        describe_failure(response), common::ErrorCode::SandboxUnreachable);
  }
  return kernel::parse_execution_result(response.body);
}

common::Status CurlKernelClient::health(const std::uint16_t port,
                                        const std::chrono::milliseconds timeout) {
  const std::string url = "http://" + host_ + ":" + std::to_string(port) + "/health";
  const auto response = perform(url, std::nullopt, timeout);
  if (response.network_error || response.status != 200) {
    return common::Status::error(describe_failure(response),
                                 common::ErrorCode::SandboxUnreachable);
  }
  auto object = common::json_parse_object(response.body);
  if (!object.ok() || common::json_member_string(object.value(), "status") != "ok") {
    return common::Status::error("kernel health reply is malformed",
                                 common::ErrorCode::SandboxUnreachable);
  }
  return common::Status::success();
}

} // namespace codebox::sandbox
