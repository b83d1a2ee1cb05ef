/**
 * @file azblob.h
 * @brief Main header for the azblob library
 * @version 0.1.0
 *
 * This is the primary include file for the azblob library.
 * Include this header to access all blob storage functionality.
 *
 * @code
 * #include <azblob/azblob.h>
 *
 * using namespace azblob;
 *
 * auto credentials = resolve_credentials(connection_string);
 * auto url = build_container_url(credentials.value(), "insights-logs-appserviceconsolelogs");
 *
 * container_lister lister;
 * auto listing = lister.list_blobs(url.value());
 * auto recent = filter_blobs_by_date(listing.value().urls, time_window::last_minutes(60));
 *
 * blob_stream_downloader downloader;
 * for (const auto& blob : recent) {
 *     auto stats = downloader.stream_blob(blob, [](std::string_view line) { ... });
 * }
 * @endcode
 */

#ifndef AZBLOB_AZBLOB_H
#define AZBLOB_AZBLOB_H

#include <string>

// Core
#include "azblob/core/types.h"
#include "azblob/core/logging.h"
#include "azblob/core/gzip_inflater.h"

// Storage
#include "azblob/storage/storage_config.h"
#include "azblob/storage/storage_credentials.h"
#include "azblob/storage/storage_utils.h"
#include "azblob/storage/sas_token.h"
#include "azblob/storage/shared_key_signer.h"
#include "azblob/storage/http_transport.h"
#include "azblob/storage/container_lister.h"
#include "azblob/storage/blob_stream_downloader.h"
#include "azblob/storage/time_window_filter.h"

namespace azblob {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace azblob

#endif  // AZBLOB_AZBLOB_H
