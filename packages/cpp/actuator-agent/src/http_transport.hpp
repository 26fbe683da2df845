/**
 * HTTP transport for talking to the monitoring registry.
 *
 * Uses libcurl. Never throws: every outcome, including network failures, is
 * reported through HttpResponse.
 */

#pragma once

#include <chrono>
#include <mutex>
#include <string>

#include <curl/curl.h>

#include "config.hpp"

namespace actuator {

struct HttpResponse {
  bool ok = false;  // transport succeeded and status is 2xx
  long status_code = 0;
  std::string body;
  std::string error;
};

namespace detail {
  // curl_global_init is not thread-safe; run it once per process and never
  // call curl_global_cleanup from a destructor.
  inline void ensure_curl_initialized() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
  }

  inline size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    static_cast<std::string*>(userp)->append(static_cast<char*>(contents), total_size);
    return total_size;
  }
}  // namespace detail

class HttpTransport {
 public:
  inline HttpTransport(std::chrono::milliseconds timeout, std::string username = "",
                       std::string password = "");
  inline ~HttpTransport();

  // Non-copyable
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  /**
   * POST a JSON document. Thread-safe; requests are serialized.
   */
  inline HttpResponse post_json(const std::string& url, const std::string& payload);

  inline HttpResponse delete_resource(const std::string& url);

 private:
  inline HttpResponse perform(const char* method, const std::string& url,
                              const std::string* payload);

  std::chrono::milliseconds timeout_;
  std::string username_;
  std::string password_;

  CURL* curl_handle_ = nullptr;
  std::mutex curl_mutex_;
};

/**
 * Outward side of the registration protocol. Tests substitute their own.
 */
class RegistryTransport {
 public:
  virtual ~RegistryTransport() = default;

  virtual HttpResponse register_instance(const std::string& registration_url,
                                         const std::string& document) = 0;

  virtual HttpResponse deregister_instance(const std::string& instance_url) = 0;
};

class CurlRegistryTransport : public RegistryTransport {
 public:
  explicit CurlRegistryTransport(const AgentConfig& config)
      : http_(config.http_timeout, config.registration_username,
              config.registration_password) {}

  HttpResponse register_instance(const std::string& registration_url,
                                 const std::string& document) override {
    return http_.post_json(registration_url, document);
  }

  HttpResponse deregister_instance(const std::string& instance_url) override {
    return http_.delete_resource(instance_url);
  }

 private:
  HttpTransport http_;
};

// =========================
// Inline Implementations
// =========================

inline HttpTransport::HttpTransport(std::chrono::milliseconds timeout, std::string username,
                                    std::string password)
    : timeout_(timeout), username_(std::move(username)), password_(std::move(password)) {
  detail::ensure_curl_initialized();

  curl_handle_ = curl_easy_init();
  if (!curl_handle_) {
    detail::agent_logger()->warn("Failed to initialize libcurl for registry transport");
  }
}

inline HttpTransport::~HttpTransport() {
  // Blocks until an in-flight request releases the handle
  std::lock_guard<std::mutex> lock(curl_mutex_);
  if (curl_handle_) {
    curl_easy_cleanup(curl_handle_);
    curl_handle_ = nullptr;
  }
}

inline HttpResponse HttpTransport::post_json(const std::string& url,
                                             const std::string& payload) {
  return perform("POST", url, &payload);
}

inline HttpResponse HttpTransport::delete_resource(const std::string& url) {
  return perform("DELETE", url, nullptr);
}

inline HttpResponse HttpTransport::perform(const char* method, const std::string& url,
                                           const std::string* payload) {
  HttpResponse response;

  std::lock_guard<std::mutex> lock(curl_mutex_);
  if (!curl_handle_) {
    response.error = "libcurl not initialized";
    return response;
  }

  curl_easy_reset(curl_handle_);
  curl_easy_setopt(curl_handle_, CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl_handle_, CURLOPT_CUSTOMREQUEST, method);
  curl_easy_setopt(curl_handle_, CURLOPT_NOSIGNAL, 1L);

  struct curl_slist* headers = nullptr;
  if (payload) {
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDS, payload->c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_POSTFIELDSIZE, static_cast<long>(payload->size()));
    headers = curl_slist_append(headers, "Content-Type: application/json");
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPHEADER, headers);
  }

  if (!username_.empty() && !password_.empty()) {
    curl_easy_setopt(curl_handle_, CURLOPT_HTTPAUTH, CURLAUTH_BASIC);
    curl_easy_setopt(curl_handle_, CURLOPT_USERNAME, username_.c_str());
    curl_easy_setopt(curl_handle_, CURLOPT_PASSWORD, password_.c_str());
  }

  curl_easy_setopt(curl_handle_, CURLOPT_TIMEOUT_MS, static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEFUNCTION, detail::write_callback);
  curl_easy_setopt(curl_handle_, CURLOPT_WRITEDATA, &response.body);

  CURLcode res = curl_easy_perform(curl_handle_);
  if (res == CURLE_OK) {
    curl_easy_getinfo(curl_handle_, CURLINFO_RESPONSE_CODE, &response.status_code);
    response.ok = response.status_code >= 200 && response.status_code < 300;
    if (!response.ok) {
      response.error = "HTTP status " + std::to_string(response.status_code);
    }
  } else {
    response.error = curl_easy_strerror(res);
  }

  curl_slist_free_all(headers);
  return response;
}

}  // namespace actuator
