#pragma once

#include "transloom/common/result.hpp"
#include "transloom/providers/traits.hpp"

#include <memory>
#include <optional>
#include <string>

namespace transloom::providers {

/// A missing api_key falls back to the provider's usual environment variable.
[[nodiscard]] common::Result<std::shared_ptr<Provider>>
create_provider(const std::string &name, const std::optional<std::string> &api_key,
                ProviderOptions options = {},
                std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

} // namespace transloom::providers
