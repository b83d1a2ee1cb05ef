/**
 * @file storage_config.h
 * @brief Client configuration for blob storage operations
 *
 * One configuration value is shared, read-only, by every component of a
 * client. Nothing here is read from the environment implicitly; use
 * blob_client_config::from_environment() for that.
 */

#ifndef AZBLOB_STORAGE_STORAGE_CONFIG_H
#define AZBLOB_STORAGE_STORAGE_CONFIG_H

#include <azblob/core/types.h>

#include <chrono>
#include <cstdint>
#include <string>

namespace azblob {

/// Storage REST API version sent as x-ms-version and signed into SAS tokens
inline constexpr const char* default_api_version = "2023-11-03";

/**
 * @brief Blob client configuration
 */
struct blob_client_config {
    /// Storage REST API version
    std::string api_version = default_api_version;

    /// Maximum number of list pages fetched by list_blobs()
    uint32_t max_list_pages = 20;

    /// Page at which a large-container warning is logged
    uint32_t large_container_page_threshold = 5;

    /// Maximum number of list pages fetched by count_blobs()
    uint32_t count_max_pages = 3;

    /// Connection timeout
    std::chrono::milliseconds connect_timeout{30000};

    /// Request timeout
    std::chrono::milliseconds request_timeout{0};  ///< 0 = no timeout

    /// Verify TLS certificates
    bool verify_tls = true;

    /// User-Agent string
    std::string user_agent = "azblob/0.1.0";

    /// Verbose per-line and per-blob diagnostics
    bool debug = false;

    /**
     * @brief Check the configuration for values no operation can run with
     * @return configuration_error describing the first bad field
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Defaults overridden by AZBLOB_DEBUG, AZBLOB_MAX_LIST_PAGES and
     *        AZBLOB_API_VERSION
     * @return Configuration or configuration_error for unparseable values
     */
    [[nodiscard]] static auto from_environment() -> result<blob_client_config>;
};

/**
 * @brief Blob client configuration builder
 *
 * @code
 * auto config = blob_client_config_builder()
 *     .with_max_list_pages(10)
 *     .with_debug(true)
 *     .build();
 * @endcode
 */
class blob_client_config_builder {
public:
    blob_client_config_builder() = default;

    explicit blob_client_config_builder(blob_client_config base)
        : config_(std::move(base)) {}

    auto with_api_version(const std::string& version) -> blob_client_config_builder& {
        config_.api_version = version;
        return *this;
    }

    auto with_max_list_pages(uint32_t pages) -> blob_client_config_builder& {
        config_.max_list_pages = pages;
        return *this;
    }

    auto with_large_container_page_threshold(uint32_t page) -> blob_client_config_builder& {
        config_.large_container_page_threshold = page;
        return *this;
    }

    auto with_count_max_pages(uint32_t pages) -> blob_client_config_builder& {
        config_.count_max_pages = pages;
        return *this;
    }

    auto with_connect_timeout(std::chrono::milliseconds timeout) -> blob_client_config_builder& {
        config_.connect_timeout = timeout;
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> blob_client_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    auto with_tls_verification(bool verify) -> blob_client_config_builder& {
        config_.verify_tls = verify;
        return *this;
    }

    auto with_user_agent(const std::string& agent) -> blob_client_config_builder& {
        config_.user_agent = agent;
        return *this;
    }

    auto with_debug(bool enable) -> blob_client_config_builder& {
        config_.debug = enable;
        return *this;
    }

    [[nodiscard]] auto build() const -> blob_client_config {
        return config_;
    }

private:
    blob_client_config config_;
};

}  // namespace azblob

#endif  // AZBLOB_STORAGE_STORAGE_CONFIG_H
