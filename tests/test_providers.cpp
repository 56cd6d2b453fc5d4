#include "test_framework.hpp"

#include "sidecar/common/json_util.hpp"
#include "sidecar/providers/anthropic.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <memory>

namespace {

namespace pv = sidecar::providers;
using sidecar::testing::FakeHttpClient;

const char *kOkBody = R"({"id":"msg_1","type":"message","content":[)"
                      R"({"type":"thinking","thinking":"..."},{"type":"text","text":"{\"a\":1}"}],)"
                      R"("usage":{"input_tokens":10,"output_tokens":5}})";

std::shared_ptr<FakeHttpClient> fake_http(pv::HttpResponse response) {
  return std::make_shared<FakeHttpClient>(std::move(response));
}

} // namespace

void register_provider_tests(std::vector<sidecar::tests::TestCase> &tests) {
  using sidecar::tests::require;
  using sidecar::tests::require_contains;

  tests.push_back({"anthropic_sends_messages_request", [] {
                     auto http = fake_http(pv::HttpResponse{.status = 200, .body = kOkBody});
                     pv::AnthropicProvider provider("sk-test", "https://api.example.com/", http,
                                                    {.max_tokens = 1234, .timeout_ms = 5000});

                     const auto reply =
                         provider.chat_with_system(std::string("system text"), "user \"text\"",
                                                   "model-x", 0.2);
                     require(reply.ok(), reply.ok() ? "" : reply.error());
                     require(reply.value() == "{\"a\":1}", "first text block returned");

                     require(http->last_request.has_value(), "request sent");
                     const auto &request = *http->last_request;
                     require(request.url == "https://api.example.com/v1/messages", "url");
                     require(request.headers.at("x-api-key") == "sk-test", "api key header");
                     require(request.headers.at("anthropic-version") == "2023-06-01",
                             "version header");
                     require(request.timeout_ms == 5000, "timeout passed through");

                     const auto &body = request.body;
                     require(sidecar::common::json_validate(body), "body is valid JSON");
                     require(sidecar::common::json_get_string(body, "model") == "model-x", "model");
                     require(sidecar::common::json_get_string(body, "system") == "system text",
                             "system prompt");
                     require(sidecar::common::json_get_number(body, "max_tokens") == "1234",
                             "max tokens");
                     const auto messages = sidecar::common::json_split_top_level_objects(
                         sidecar::common::json_get_array(body, "messages"));
                     require(messages.size() == 1, "one message");
                     require(sidecar::common::json_get_string(messages[0], "content") ==
                                 "user \"text\"",
                             "escaped user content");
                   }});

  tests.push_back({"anthropic_missing_key_fails_without_request", [] {
                     auto http = fake_http(pv::HttpResponse{.status = 200, .body = kOkBody});
                     pv::AnthropicProvider provider("", "https://api.example.com", http);
                     const auto reply = provider.chat_with_system(std::nullopt, "hi", "m", 0.0);
                     require(!reply.ok(), "call should fail");
                     require_contains(reply.error(), "[auth]", "auth error");
                     require(!http->last_request.has_value(), "no request sent");
                   }});

  tests.push_back({"anthropic_maps_http_failures", [] {
                     const auto error_for = [](pv::HttpResponse response) {
                       pv::AnthropicProvider provider("k", "https://x", fake_http(std::move(response)));
                       const auto reply = provider.chat_with_system(std::nullopt, "hi", "m", 0.0);
                       require(!reply.ok(), "call should fail");
                       return reply.error();
                     };

                     require(error_for({.status = 401, .body = "denied"}).find("[auth] status=401") !=
                                 std::string::npos,
                             "401 is auth");
                     require(error_for({.status = 500, .body = "boom"}).find("[api] status=500 boom") !=
                                 std::string::npos,
                             "500 is api");
                     require_contains(error_for({.timeout = true}), "[timeout]", "timeout");
                     require_contains(
                         error_for({.network_error = true, .network_error_message = "refused"}),
                         "[network] refused", "network");

                     const auto limited = error_for(
                         {.status = 429, .body = "slow down", .headers = {{"retry-after", "12"}}});
                     require(limited.find("[rate_limit] status=429 retry_after=12s") !=
                                 std::string::npos,
                             "rate limit with retry-after");

                     const auto oversized = error_for({.status = 429,
                                                       .body = "slow down",
                                                       .headers = {{"retry-after",
                                                                    "99999999999999999999999"}}});
                     require_contains(oversized, "[rate_limit] status=429 slow down",
                                      "oversized retry-after still maps to rate_limit");
                     require(oversized.find("retry_after=") == std::string::npos,
                             "oversized retry-after dropped");
                     const auto dated = error_for(
                         {.status = 429,
                          .body = "later",
                          .headers = {{"retry-after", "Wed, 21 Oct 2015 07:28:00 GMT"}}});
                     require(dated.find("retry_after=") == std::string::npos,
                             "HTTP-date retry-after ignored");
                   }});

  tests.push_back({"anthropic_rejects_unreadable_body", [] {
                     pv::AnthropicProvider provider(
                         "k", "https://x", fake_http({.status = 200, .body = R"({"content":[]})"}));
                     const auto reply = provider.chat_with_system(std::nullopt, "hi", "m", 0.0);
                     require(!reply.ok(), "call should fail");
                     require_contains(reply.error(), "[invalid_response]",
                             "invalid response");
                   }});

  tests.push_back({"parse_anthropic_content_requires_text_block", [] {
                     require(!pv::parse_anthropic_content("not json").ok(), "invalid JSON");
                     require(!pv::parse_anthropic_content(R"({"id":"x"})").ok(), "missing content");
                     const auto parsed = pv::parse_anthropic_content(
                         R"({"content":[{"type":"text","text":"first"},{"type":"text","text":"second"}]})");
                     require(parsed.ok() && parsed.value() == "first", "first text block");
                   }});

  tests.push_back({"provider_error_formats_fields", [] {
                     const pv::ProviderError error{.code = pv::ProviderErrorCode::RateLimitError,
                                                   .status = 429,
                                                   .message = "later",
                                                   .retry_after = 3};
                     require(error.to_string() ==
                                 "Provider error [rate_limit] status=429 retry_after=3s later",
                             "formatted error");
                   }});
}
