/**
 * @file container_lister.h
 * @brief Paginated blob and container enumeration
 */

#ifndef AZBLOB_STORAGE_CONTAINER_LISTER_H
#define AZBLOB_STORAGE_CONTAINER_LISTER_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>
#include <azblob/storage/http_transport.h>
#include <azblob/storage/storage_config.h>
#include <azblob/storage/storage_credentials.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace azblob {

/**
 * @brief One page of a List Blobs response
 */
struct blob_list_page {
    std::vector<std::string> names;          ///< XML-decoded, in service order
    std::optional<std::string> next_marker;  ///< nullopt on the last page
};

/**
 * @brief Result of a full blob enumeration
 */
struct blob_listing {
    std::vector<std::string> urls;
    uint32_t pages = 0;
    bool truncated = false;  ///< the page cap stopped pagination
};

/**
 * @brief Result of count_blobs()
 */
struct blob_count {
    uint64_t count = 0;
    bool estimated = false;  ///< more pages remained when counting stopped
    uint32_t pages = 0;
};

/**
 * @brief Container name with a display name for well-known containers
 */
struct container_info {
    std::string name;
    std::string friendly_name;
    std::string description;
};

/**
 * @brief Friendly name and description for a container
 *
 * App Service diagnostic containers (insights-logs-*), static website,
 * analytics and backup containers get descriptive names; any other
 * container keeps its own name.
 */
[[nodiscard]] auto describe_container(const std::string& name) -> container_info;

/**
 * @brief Enumerates blobs in a container and containers in an account
 *
 * Pagination follows NextMarker until the service returns none or the
 * configured page cap is reached.
 *
 * @code
 * container_lister lister(std::make_shared<curl_http_transport>(config, logger),
 *                         config, logger);
 * auto listing = lister.list_blobs(container_url);
 * if (listing) {
 *     for (const auto& url : listing.value().urls) { ... }
 * }
 * @endcode
 */
class container_lister {
public:
    using clock = std::chrono::system_clock;

    /**
     * @param transport HTTP transport; a curl transport is created when null
     * @param config Client configuration
     * @param logger Logger; a stderr logger is created when null
     */
    explicit container_lister(std::shared_ptr<http_transport_interface> transport = nullptr,
                              blob_client_config config = {},
                              std::shared_ptr<storage_logger> logger = nullptr);

    /**
     * @brief List every blob in a container
     * @param container_url Container URL, usually carrying an "rl" SAS
     * @return Blob URLs carrying the container URL's query, or the first
     *         page error (no partial results)
     */
    [[nodiscard]] auto list_blobs(const std::string& container_url) const
        -> result<blob_listing>;

    /**
     * @brief Fetch and parse a single List Blobs page
     * @param list_url Complete request URL including restype, comp and marker
     */
    [[nodiscard]] auto fetch_blob_page(const std::string& list_url) const
        -> result<blob_list_page>;

    /**
     * @brief Count blobs over at most @p max_pages pages
     * @param container_url Container URL
     * @param max_pages Page limit; the configured count_max_pages when unset
     */
    [[nodiscard]] auto count_blobs(const std::string& container_url,
                                   std::optional<uint32_t> max_pages = std::nullopt) const
        -> result<blob_count>;

    /**
     * @brief List the containers of an account with Shared Key authorization
     * @param credentials Credentials with an account key
     * @param now Time signed into x-ms-date
     */
    [[nodiscard]] auto list_containers(const storage_credentials& credentials,
                                       clock::time_point now = clock::now()) const
        -> result<std::vector<container_info>>;

private:
    std::shared_ptr<http_transport_interface> transport_;
    blob_client_config config_;
    std::shared_ptr<storage_logger> logger_;
};

}  // namespace azblob

#endif  // AZBLOB_STORAGE_CONTAINER_LISTER_H
