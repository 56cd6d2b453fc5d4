#pragma once

#include "sidecar/providers/traits.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace sidecar::providers {

struct AnthropicOptions {
  std::uint32_t max_tokens = 4096;
  std::uint64_t timeout_ms = 60'000;
};

/// Messages API client. Requests are single-shot; retrying is left to the caller.
class AnthropicProvider : public Provider {
public:
  AnthropicProvider(std::string api_key, std::string base_url,
                    std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                    AnthropicOptions options = {});

  [[nodiscard]] common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;

private:
  std::string api_key_;
  std::string base_url_ = "https://api.anthropic.com";
  std::shared_ptr<HttpClient> http_client_;
  AnthropicOptions options_;
};

} // namespace sidecar::providers
