#pragma once

#include "transloom/providers/traits.hpp"

#include <memory>
#include <string>
#include <unordered_map>

namespace transloom::providers {

class CompatibleProvider : public Provider {
public:
  CompatibleProvider(std::string name, std::string base_url, std::string api_key,
                     std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>(),
                     bool require_api_key = true, ProviderOptions options = {},
                     std::unordered_map<std::string, std::string> extra_headers = {});

  [[nodiscard]] common::Result<std::string>
  chat(const std::string &message, const std::string &model, double temperature) override;

  [[nodiscard]] common::Result<std::string>
  chat_with_system(const std::optional<std::string> &system_prompt, const std::string &message,
                   const std::string &model, double temperature) override;

  [[nodiscard]] std::string name() const override;
  [[nodiscard]] const std::string &base_url() const { return base_url_; }

private:
  [[nodiscard]] std::string build_body(const std::optional<std::string> &system_prompt,
                                       const std::string &message, const std::string &model,
                                       double temperature) const;

  [[nodiscard]] common::Result<std::string> handle_response(const HttpResponse &response) const;
  [[nodiscard]] common::Status validate_response_status(const HttpResponse &response) const;

  std::string name_;
  std::string base_url_;
  std::string api_key_;
  std::shared_ptr<HttpClient> http_client_;
  bool require_api_key_ = true;
  ProviderOptions options_;
  std::unordered_map<std::string, std::string> extra_headers_;
};

} // namespace transloom::providers
