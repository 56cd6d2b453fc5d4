#include "sidecar/providers/anthropic.hpp"

#include "sidecar/common/json_util.hpp"
#include "sidecar/observability/global.hpp"

#include <charconv>
#include <chrono>
#include <sstream>

namespace sidecar::providers {

namespace {

constexpr const char *kApiVersion = "2023-06-01";

std::optional<std::uint64_t> retry_after_seconds(const HttpHeaders &headers) {
  const auto it = headers.find("retry-after");
  if (it == headers.end()) {
    return std::nullopt;
  }
  // Delta-seconds only; dates and values beyond 64 bits are ignored.
  const std::string &raw = it->second;
  std::uint64_t seconds = 0;
  const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), seconds);
  if (raw.empty() || ec != std::errc() || ptr != raw.data() + raw.size()) {
    return std::nullopt;
  }
  return seconds;
}

std::optional<ProviderError> classify_failure(const HttpResponse &response) {
  if (response.timeout) {
    return ProviderError{.code = ProviderErrorCode::Timeout, .message = "request timed out"};
  }
  if (response.network_error) {
    return ProviderError{.code = ProviderErrorCode::NetworkError,
                         .message = response.network_error_message};
  }
  if (response.status >= 200 && response.status < 300) {
    return std::nullopt;
  }

  ProviderError error{.status = response.status, .message = response.body};
  if (response.status == 401 || response.status == 403) {
    error.code = ProviderErrorCode::AuthError;
  } else if (response.status == 429) {
    error.code = ProviderErrorCode::RateLimitError;
    error.retry_after = retry_after_seconds(response.headers);
  }
  return error;
}

std::string messages_body(const std::optional<std::string> &system_prompt,
                          const std::string &message, const std::string &model,
                          const double temperature, const std::uint32_t max_tokens) {
  std::ostringstream body;
  body << "{\"model\":\"" << common::json_escape(model) << "\",\"max_tokens\":" << max_tokens;
  if (system_prompt.has_value()) {
    body << ",\"system\":\"" << common::json_escape(*system_prompt) << "\"";
  }
  body << ",\"messages\":[{\"role\":\"user\",\"content\":\"" << common::json_escape(message)
       << "\"}],\"temperature\":" << temperature << ",\"stream\":false}";
  return body.str();
}

} // namespace

AnthropicProvider::AnthropicProvider(std::string api_key, std::string base_url,
                                     std::shared_ptr<HttpClient> http_client,
                                     const AnthropicOptions options)
    : api_key_(std::move(api_key)), base_url_(std::move(base_url)),
      http_client_(std::move(http_client)), options_(options) {
  while (!base_url_.empty() && base_url_.back() == '/') {
    base_url_.pop_back();
  }
}

common::Result<std::string>
AnthropicProvider::chat_with_system(const std::optional<std::string> &system_prompt,
                                    const std::string &message, const std::string &model,
                                    const double temperature) {
  if (api_key_.empty()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::AuthError, .message = "missing API key"}.to_string());
  }

  const HttpRequest request{
      .url = base_url_ + "/v1/messages",
      .headers = {{"Content-Type", "application/json"},
                  {"anthropic-version", kApiVersion},
                  {"x-api-key", api_key_}},
      .body = messages_body(system_prompt, message, model, temperature, options_.max_tokens),
      .timeout_ms = options_.timeout_ms,
  };

  const auto started = std::chrono::steady_clock::now();
  const auto response = http_client_->post(request);
  observability::record_metric(observability::RequestLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});

  if (const auto failure = classify_failure(response); failure.has_value()) {
    return common::Result<std::string>::failure(failure->to_string());
  }

  auto text = parse_anthropic_content(response.body);
  if (!text.ok()) {
    return common::Result<std::string>::failure(
        ProviderError{.code = ProviderErrorCode::InvalidResponse, .message = text.error()}.to_string());
  }
  return text;
}

std::string AnthropicProvider::name() const { return "anthropic"; }

} // namespace sidecar::providers
