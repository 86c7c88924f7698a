#include "execbox/sandbox/engine_api.hpp"

#include "execbox/common/json_util.hpp"

#include <curl/curl.h>

#include <memory>
#include <mutex>

namespace execbox::sandbox {

namespace {

constexpr const char *API_PREFIX = "http://localhost/v1.41";

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  auto *output = static_cast<std::string *>(userdata);
  output->append(ptr, total);
  return total;
}

void ensure_curl_global() {
  static std::once_flag once;
  std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

std::string url_encode(CURL *curl, const std::string &value) {
  char *escaped = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  if (escaped == nullptr) {
    return value;
  }
  std::string out(escaped);
  curl_free(escaped);
  return out;
}

std::string api_error_message(const long status, const std::string &body) {
  std::string message = common::json_get_string(body, "message");
  if (message.empty()) {
    message = body;
  }
  return "docker engine returned HTTP " + std::to_string(status) +
         (message.empty() ? std::string() : ": " + message);
}

} // namespace

DockerEngineClient::DockerEngineClient(std::string socket_path,
                                       const std::chrono::milliseconds timeout)
    : socket_path_(std::move(socket_path)), timeout_(timeout) {
  ensure_curl_global();
}

common::Result<DockerEngineClient::Response>
DockerEngineClient::request(const std::string &method, const std::string &path_and_query,
                            const std::string *body, const std::chrono::milliseconds timeout) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> curl(curl_easy_init(), curl_easy_cleanup);
  if (!curl) {
    return common::Result<Response>::failure("curl_easy_init failed");
  }

  Response response;
  const std::string url = std::string(API_PREFIX) + path_and_query;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_UNIX_SOCKET_PATH, socket_path_.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT_MS, static_cast<long>(timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_USERAGENT, "execbox/0.1");

  struct curl_slist *header_list = nullptr;
  if (method == "PUT") {
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, "PUT");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body != nullptr ? body->data() : "");
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE,
                     static_cast<curl_off_t>(body != nullptr ? body->size() : 0));
    header_list = curl_slist_append(header_list, "Content-Type: application/x-tar");
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl.get());
  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  if (code != CURLE_OK) {
    const auto kind =
        code == CURLE_OPERATION_TIMEDOUT ? common::ErrorKind::Timeout : common::ErrorKind::Runtime;
    return common::Result<Response>::failure(kind, std::string("docker engine request failed: ") +
                                                       curl_easy_strerror(code));
  }
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return common::Result<Response>::success(std::move(response));
}

common::Result<std::string> DockerEngineClient::get_archive(const std::string &container,
                                                            const std::string &path) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> escaper(curl_easy_init(), curl_easy_cleanup);
  const std::string query = "/containers/" + container + "/archive?path=" +
                            (escaper ? url_encode(escaper.get(), path) : path);
  auto response = request("GET", query, nullptr, timeout_);
  if (!response.ok()) {
    return common::Result<std::string>::failure(response.kind(), response.error());
  }
  const auto &value = response.value();
  if (value.status == 404) {
    return common::Result<std::string>::failure(common::ErrorKind::NotFound,
                                                "Path not found in container: " + path);
  }
  if (value.status != 200) {
    return common::Result<std::string>::failure(api_error_message(value.status, value.body));
  }
  return common::Result<std::string>::success(std::move(response.value().body));
}

common::Status DockerEngineClient::put_archive(const std::string &container,
                                               const std::string &directory,
                                               const std::string &tar) {
  std::unique_ptr<CURL, decltype(&curl_easy_cleanup)> escaper(curl_easy_init(), curl_easy_cleanup);
  const std::string query = "/containers/" + container + "/archive?path=" +
                            (escaper ? url_encode(escaper.get(), directory) : directory);
  const auto response = request("PUT", query, &tar, timeout_);
  if (!response.ok()) {
    return common::Status::error(response.kind(), response.error());
  }
  const auto &value = response.value();
  if (value.status == 404) {
    return common::Status::error(common::ErrorKind::NotFound,
                                 "Directory not found in container: " + directory);
  }
  if (value.status != 200) {
    return common::Status::error(api_error_message(value.status, value.body));
  }
  return common::Status::success();
}

common::Status DockerEngineClient::ping() {
  const auto response = request("GET", "/_ping", nullptr, std::chrono::seconds(3));
  if (!response.ok()) {
    return common::Status::error(response.kind(), response.error());
  }
  if (response.value().status != 200) {
    return common::Status::error(api_error_message(response.value().status, response.value().body));
  }
  return common::Status::success();
}

} // namespace execbox::sandbox
