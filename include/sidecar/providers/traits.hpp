#pragma once

#include "sidecar/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace sidecar::providers {

enum class ProviderErrorCode {
  ApiError,
  NetworkError,
  AuthError,
  RateLimitError,
  InvalidResponse,
  Timeout,
};

[[nodiscard]] std::string_view provider_error_code_name(ProviderErrorCode code);

/// Transport failure of a summarizer request, rendered into Result error text.
struct ProviderError {
  ProviderErrorCode code = ProviderErrorCode::ApiError;
  std::uint16_t status = 0;
  std::string message;
  std::optional<std::uint64_t> retry_after;

  [[nodiscard]] std::string to_string() const;
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

struct HttpRequest {
  std::string url;
  HttpHeaders headers;
  std::string body;
  std::uint64_t timeout_ms = 0;
};

/// Header names are lower-cased. A transport failure sets network_error, and timeout
/// as well when the deadline was hit.
struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  [[nodiscard]] virtual HttpResponse post(const HttpRequest &request) = 0;
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  [[nodiscard]] HttpResponse post(const HttpRequest &request) override;
};

/// A remote language model reachable with a single request/response call.
class Provider {
public:
  virtual ~Provider() = default;

  [[nodiscard]] virtual common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) = 0;

  [[nodiscard]] virtual std::string name() const = 0;
};

/// Text of the first text block of a Messages API response.
[[nodiscard]] common::Result<std::string> parse_anthropic_content(const std::string &response);

} // namespace sidecar::providers
