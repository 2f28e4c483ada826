#include "core/config/bridge_config.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <system_error>
#include <utility>

namespace mcpbridge::core::config {

using core::errors::BridgeError;
using core::errors::ErrorCategory;

namespace {

constexpr std::uint32_t kMaxTimeoutMs = 600000;

bool is_blank(const std::optional<std::string>& value) {
    if (!value.has_value()) {
        return true;
    }
    for (const char c : value.value()) {
        if (std::isspace(static_cast<unsigned char>(c)) == 0) {
            return false;
        }
    }
    return true;
}

}  // namespace

std::optional<std::string> process_env(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

std::vector<std::string> split_command_line(const std::string& text) {
    std::vector<std::string> parts;
    std::string token;
    for (const char c : text) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            if (!token.empty()) {
                parts.push_back(std::move(token));
                token.clear();
            }
            continue;
        }
        token.push_back(c);
    }
    if (!token.empty()) {
        parts.push_back(std::move(token));
    }
    return parts;
}

core::errors::Result<std::uint32_t> parse_timeout_ms(const std::string& text) {
    std::uint32_t value = 0;
    const char* begin = text.data();
    const char* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (text.empty() || ec != std::errc() || ptr != end) {
        return BridgeError{ErrorCategory::Input,
                           "Invalid timeout value: " + text, "invalid_integer",
                           "Provide a positive integer number of milliseconds."};
    }
    if (value == 0 || value > kMaxTimeoutMs) {
        return BridgeError{ErrorCategory::Input, "Timeout out of bounds: " + text,
                           "bounds_error", "Must be between 1 and 600000."};
    }
    return value;
}

core::errors::Result<BridgeConfig> load_from_environment(const EnvLookup& lookup) {
    BridgeConfig config;

    const auto command_line = lookup("MCP_BRIDGE_COMMAND");
    if (!is_blank(command_line)) {
        auto parts = split_command_line(command_line.value());
        config.command = parts.front();
        config.args.assign(parts.begin() + 1, parts.end());
    } else {
        const auto token = lookup("SHOPIFY_ACCESS_TOKEN");
        const auto domain = lookup("MYSHOPIFY_DOMAIN");
        if (is_blank(token) || is_blank(domain)) {
            return BridgeError{ErrorCategory::Input, "Missing Shopify credentials.",
                               "missing_credentials",
                               "Set SHOPIFY_ACCESS_TOKEN and MYSHOPIFY_DOMAIN, or "
                               "MCP_BRIDGE_COMMAND."};
        }
        config.command = "npx";
        config.args = {"shopify-mcp", "--accessToken", token.value(), "--domain",
                       domain.value()};
    }

    const auto timeout = lookup("MCP_BRIDGE_TIMEOUT_MS");
    if (timeout.has_value()) {
        auto parsed = parse_timeout_ms(timeout.value());
        if (core::errors::is_error(parsed)) {
            return core::errors::get_error(parsed);
        }
        config.request_timeout_ms = core::errors::get_value(parsed);
    }

    return config;
}

}  // namespace mcpbridge::core::config
