#pragma once
#include <string_view>

namespace triggerware {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view JSONRPC_VERSION     = "2.0";
constexpr std::string_view DEFAULT_NAMESPACE   = "AP5";
constexpr int              DEFAULT_PORT        = 5221;

} // namespace triggerware
