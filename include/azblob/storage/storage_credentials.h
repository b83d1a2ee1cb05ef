/**
 * @file storage_credentials.h
 * @brief Storage account credentials and connection string parsing
 */

#ifndef AZBLOB_STORAGE_STORAGE_CREDENTIALS_H
#define AZBLOB_STORAGE_STORAGE_CREDENTIALS_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>

#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace azblob {

/// Endpoint suffix used when a connection string does not name one
inline constexpr const char* default_endpoint_suffix = "core.windows.net";

/**
 * @brief Storage account credentials
 *
 * Parsed from a connection string and never persisted. The account key is
 * kept in its base64 form; it is decoded only when a signature is computed.
 */
struct storage_credentials {
    std::string account_name;
    std::string account_key;                             ///< base64, may be empty
    std::string endpoint_suffix = default_endpoint_suffix;
    std::string protocol = "https";
    std::optional<std::string> sas_token;                ///< SharedAccessSignature=

    /**
     * @brief Whether SAS tokens and Shared Key headers can be signed
     */
    [[nodiscard]] auto has_signing_key() const -> bool {
        return !account_name.empty() && !account_key.empty();
    }

    /**
     * @brief Blob service endpoint, e.g. https://account.blob.core.windows.net
     */
    [[nodiscard]] auto blob_endpoint() const -> std::string {
        return protocol + "://" + account_name + ".blob." + endpoint_suffix;
    }
};

/**
 * @brief Parse a storage connection string
 *
 * Parts are separated by ';' and split on their first '='; parts without a
 * key or value are ignored. Keys are case-sensitive.
 *
 * @code
 * auto creds = resolve_credentials(
 *     "DefaultEndpointsProtocol=https;AccountName=acct;AccountKey=a2V5;"
 *     "EndpointSuffix=core.windows.net");
 * @endcode
 *
 * @param connection_string Connection string
 * @return Credentials, or configuration_error when AccountName is missing
 */
[[nodiscard]] auto resolve_credentials(std::string_view connection_string)
    -> result<storage_credentials>;

/**
 * @brief Load credentials from the process environment
 *
 * AZURE_STORAGE_CONNECTION_STRING wins; otherwise AZURE_STORAGE_ACCOUNT and
 * AZURE_STORAGE_KEY (with optional AZURE_STORAGE_ENDPOINT) are used.
 *
 * @param logger Logger for the chosen source, may be null
 * @return Credentials, or configuration_error when neither source is set
 */
[[nodiscard]] auto credentials_from_environment(
    std::shared_ptr<storage_logger> logger = nullptr) -> result<storage_credentials>;

/**
 * @brief Render credentials for logs with the key and SAS hidden
 */
[[nodiscard]] auto mask_credentials(const storage_credentials& credentials) -> std::string;

}  // namespace azblob

#endif  // AZBLOB_STORAGE_STORAGE_CREDENTIALS_H
