#include "sidecar/providers/traits.hpp"

#include "sidecar/common/fs.hpp"
#include "sidecar/common/json_util.hpp"

#include <curl/curl.h>

#include <memory>

namespace sidecar::providers {

namespace {

constexpr const char *kUserAgent = "sidecar/" SIDECAR_VERSION;

struct EasyHandleDeleter {
  void operator()(CURL *handle) const { curl_easy_cleanup(handle); }
};

struct HeaderListDeleter {
  void operator()(curl_slist *list) const { curl_slist_free_all(list); }
};

using EasyHandle = std::unique_ptr<CURL, EasyHandleDeleter>;
using HeaderList = std::unique_ptr<curl_slist, HeaderListDeleter>;

size_t append_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  static_cast<std::string *>(userdata)->append(ptr, total);
  return total;
}

size_t collect_header(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string line(buffer, total);
  const auto colon = line.find(':');
  if (colon != std::string::npos) {
    auto &headers = *static_cast<HttpHeaders *>(userdata);
    headers[common::to_lower(common::trim(line.substr(0, colon)))] =
        common::trim(line.substr(colon + 1));
  }
  return total;
}

HttpResponse transport_failure(std::string message, const bool timed_out = false) {
  HttpResponse response;
  response.network_error = true;
  response.timeout = timed_out;
  response.network_error_message = std::move(message);
  return response;
}

} // namespace

std::string_view provider_error_code_name(const ProviderErrorCode code) {
  switch (code) {
  case ProviderErrorCode::ApiError:
    return "api";
  case ProviderErrorCode::NetworkError:
    return "network";
  case ProviderErrorCode::AuthError:
    return "auth";
  case ProviderErrorCode::RateLimitError:
    return "rate_limit";
  case ProviderErrorCode::InvalidResponse:
    return "invalid_response";
  case ProviderErrorCode::Timeout:
    return "timeout";
  }
  return "api";
}

std::string ProviderError::to_string() const {
  std::string out = "Provider error [" + std::string(provider_error_code_name(code)) + "]";
  if (status != 0) {
    out += " status=" + std::to_string(status);
  }
  if (retry_after.has_value()) {
    out += " retry_after=" + std::to_string(*retry_after) + "s";
  }
  if (!message.empty()) {
    out += " " + message;
  }
  return out;
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::post(const HttpRequest &request) {
  EasyHandle handle(curl_easy_init());
  if (handle == nullptr) {
    return transport_failure("curl_easy_init failed");
  }

  HeaderList header_list;
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    curl_slist *head = curl_slist_append(header_list.get(), line.c_str());
    if (head == nullptr) {
      return transport_failure("could not allocate request headers");
    }
    static_cast<void>(header_list.release());
    header_list.reset(head);
  }

  HttpResponse response;
  CURL *curl = handle.get();
  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, kUserAgent);
  curl_easy_setopt(curl, CURLOPT_POST, 1L);
  curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body.c_str());
  curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body.size()));
  curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list.get());
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_body);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, collect_header);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

  if (const CURLcode code = curl_easy_perform(curl); code != CURLE_OK) {
    return transport_failure(curl_easy_strerror(code), code == CURLE_OPERATION_TIMEDOUT);
  }

  long status = 0;
  curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
  response.status = static_cast<std::uint16_t>(status);
  return response;
}

common::Result<std::string> parse_anthropic_content(const std::string &response) {
  if (!common::json_validate(response)) {
    return common::Result<std::string>::failure("response is not valid JSON");
  }
  const std::string content = common::json_get_array(response, "content");
  if (content.empty()) {
    return common::Result<std::string>::failure("content field missing");
  }
  for (const auto &block : common::json_split_top_level_objects(content)) {
    if (common::json_get_string(block, "type") == "text") {
      return common::Result<std::string>::success(common::json_get_string(block, "text"));
    }
  }
  return common::Result<std::string>::failure("content has no text block");
}

} // namespace sidecar::providers
