/**
 * @file storage_config.cpp
 * @brief Client configuration validation and environment loading
 */

#include <azblob/storage/storage_config.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>

namespace azblob {

namespace {

auto env_value(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

auto parse_flag(std::string value) -> bool {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value == "1" || value == "true" || value == "yes" || value == "on";
}

}  // namespace

auto blob_client_config::validate() const -> result<void> {
    if (api_version.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "api_version must not be empty"));
    }
    if (max_list_pages == 0) {
        return unexpected(error(error_code::configuration_error,
                                "max_list_pages must be at least 1"));
    }
    if (count_max_pages == 0) {
        return unexpected(error(error_code::configuration_error,
                                "count_max_pages must be at least 1"));
    }
    return {};
}

auto blob_client_config::from_environment() -> result<blob_client_config> {
    blob_client_config config;

    auto debug = env_value("AZBLOB_DEBUG");
    if (!debug.empty()) {
        config.debug = parse_flag(debug);
    }

    auto pages = env_value("AZBLOB_MAX_LIST_PAGES");
    if (!pages.empty()) {
        uint32_t parsed = 0;
        auto [ptr, ec] = std::from_chars(pages.data(), pages.data() + pages.size(), parsed);
        if (ec != std::errc() || ptr != pages.data() + pages.size()) {
            return unexpected(error(error_code::configuration_error,
                                    "AZBLOB_MAX_LIST_PAGES is not a number: " + pages));
        }
        config.max_list_pages = parsed;
    }

    auto version = env_value("AZBLOB_API_VERSION");
    if (!version.empty()) {
        config.api_version = version;
    }

    auto valid = config.validate();
    if (!valid) {
        return unexpected(valid.error());
    }
    return config;
}

}  // namespace azblob
