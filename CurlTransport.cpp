#include "CurlTransport.hpp"
#include <curl/curl.h>
#include <format>
#include <memory>
#include "AuthError.hpp"
#include "AuthUtils.hpp"
#include "logger.hpp"

namespace MailAuth {

namespace {

size_t write_callback(char* data, size_t size, size_t nmemb, void* clientp) {
  size_t realsize = size * nmemb;
  auto* response = static_cast<std::string*>(clientp);
  response->append(data, realsize);
  return realsize;
}

struct CurlDeleter {
  void operator()(CURL* curl) const { curl_easy_cleanup(curl); }
};

struct SlistDeleter {
  void operator()(curl_slist* list) const { curl_slist_free_all(list); }
};

} // namespace

CurlTransport::CurlTransport(ClientConfig config) : config_(std::move(config)) {}

nlohmann::json CurlTransport::post_json(std::string_view path, const nlohmann::json& body) {
  std::unique_ptr<CURL, CurlDeleter> curl(curl_easy_init());
  if (!curl) {
    throw AuthError(AuthErrc::TransportError, "curl_easy_init() failed");
  }

  std::string url = std::format("{}{}", config_.api_url, path);
  std::string payload = body.dump();
  std::string response;

  curl_slist* raw_list = curl_slist_append(nullptr, "Content-Type: application/json");
  std::unique_ptr<curl_slist, SlistDeleter> headers(raw_list);
  std::string version_header = std::format("x-pm-appversion: {}", config_.app_version);
  if (raw_list) {
    raw_list = curl_slist_append(raw_list, version_header.c_str());
  }
  if (!raw_list) {
    throw AuthError(AuthErrc::TransportError, "failed to build request headers");
  }

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, payload.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE, static_cast<long>(payload.size()));
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, static_cast<void*>(&response));
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, static_cast<long>(config_.timeout.count()));
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  LOG_DEBUG("POST {}", url);
  CURLcode res = curl_easy_perform(curl.get());
  // The payload may carry a client proof
  Utils::secure_wipe(payload);
  if (res != CURLE_OK) {
    LOG_ERROR("curl_easy_perform() failed: {}", curl_easy_strerror(res));
    throw AuthError(AuthErrc::TransportError, curl_easy_strerror(res));
  }

  long status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &status);
  LOG_DEBUG("POST {} -> HTTP {} ({} bytes)", url, status, response.size());

  nlohmann::json j = nlohmann::json::parse(response, nullptr, false);
  if (j.is_discarded()) {
    throw AuthError(AuthErrc::TransportError,
                    std::format("HTTP {}: response is not JSON", status));
  }
  if ((status < 200 || status >= 300) && !j.contains("Code")) {
    throw AuthError(AuthErrc::TransportError, std::format("HTTP {}", status));
  }
  return j;
}

} // namespace MailAuth
