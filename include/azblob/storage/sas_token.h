/**
 * @file sas_token.h
 * @brief Container-scoped Service SAS generation
 *
 * Tokens are generated per request and never cached. The string-to-sign
 * layout follows the Service SAS format for API version 2020-12-06 and
 * later, with the encryption scope field and the five response header
 * overrides left empty.
 */

#ifndef AZBLOB_STORAGE_SAS_TOKEN_H
#define AZBLOB_STORAGE_SAS_TOKEN_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>
#include <azblob/storage/storage_config.h>
#include <azblob/storage/storage_credentials.h>

#include <chrono>
#include <memory>
#include <string>

namespace azblob {

/**
 * @brief A signed Service SAS
 */
struct sas_token {
    std::string signed_version;            ///< sv
    std::string signed_resource = "c";     ///< sr
    std::string permissions;               ///< sp
    std::string expiry;                    ///< se, YYYY-MM-DDTHH:MM:SSZ
    std::string signature;                 ///< sig, base64
    std::string protocol = "https";        ///< spr

    /**
     * @brief Query string without the leading '?'
     *
     * Parameters appear in the order sv, sr, sp, se, sig, spr with their
     * values URL-encoded.
     */
    [[nodiscard]] auto query_string() const -> std::string;

    /**
     * @brief Token with a leading '?', ready to append to a resource URL
     */
    [[nodiscard]] auto to_string() const -> std::string {
        return "?" + query_string();
    }
};

/**
 * @brief Build the Service SAS string-to-sign
 * @param account Storage account name
 * @param container Container the token is scoped to
 * @param permissions Signed permissions, e.g. "rl"
 * @param expiry Signed expiry, already formatted
 * @param api_version Signed version
 */
[[nodiscard]] auto build_sas_string_to_sign(const std::string& account,
                                            const std::string& container,
                                            const std::string& permissions,
                                            const std::string& expiry,
                                            const std::string& api_version) -> std::string;

/**
 * @brief Signs Service SAS tokens and builds SAS-authorized URLs
 *
 * @code
 * sas_token_generator generator(config, logger);
 * auto url = generator.container_url(credentials, "insights-logs-appserviceconsolelogs");
 * if (url) {
 *     auto listing = lister.list_blobs(url.value());
 * }
 * @endcode
 */
class sas_token_generator {
public:
    using clock = std::chrono::system_clock;

    explicit sas_token_generator(blob_client_config config = {},
                                 std::shared_ptr<storage_logger> logger = nullptr);

    /**
     * @brief Generate a container-scoped SAS
     * @param account Storage account name
     * @param key Base64 account key
     * @param container Container name
     * @param permissions Signed permissions
     * @param expiry_hours Lifetime in hours, must be positive
     * @param now Generation time; the expiry is now + expiry_hours
     * @return Token, configuration_error for missing inputs or an undecodable
     *         key, invalid_argument for a non-positive lifetime
     */
    [[nodiscard]] auto generate(const std::string& account,
                                const std::string& key,
                                const std::string& container,
                                const std::string& permissions = "rl",
                                int expiry_hours = 24,
                                clock::time_point now = clock::now()) const
        -> result<sas_token>;

    /**
     * @brief Container URL with an "rl" SAS, suitable for list_blobs()
     */
    [[nodiscard]] auto container_url(const storage_credentials& credentials,
                                     const std::string& container,
                                     clock::time_point now = clock::now()) const
        -> result<std::string>;

    /**
     * @brief Full List Blobs URL: container URL plus restype and comp
     */
    [[nodiscard]] auto list_url(const storage_credentials& credentials,
                                const std::string& container,
                                clock::time_point now = clock::now()) const
        -> result<std::string>;

    /**
     * @brief Blob URL with a read-only ("r") SAS
     */
    [[nodiscard]] auto blob_url(const storage_credentials& credentials,
                                const std::string& container,
                                const std::string& blob,
                                clock::time_point now = clock::now()) const
        -> result<std::string>;

private:
    blob_client_config config_;
    std::shared_ptr<storage_logger> logger_;
};

/**
 * @brief Generate a container-scoped SAS with the default configuration
 * @see sas_token_generator::generate
 */
[[nodiscard]] auto generate_sas_token(const std::string& account,
                                      const std::string& key,
                                      const std::string& container,
                                      const std::string& permissions = "rl",
                                      int expiry_hours = 24,
                                      std::chrono::system_clock::time_point now =
                                          std::chrono::system_clock::now())
    -> result<sas_token>;

/**
 * @brief https://{account}.blob.{suffix}/{container}?{sas}&restype=container&comp=list
 */
[[nodiscard]] auto build_list_url(const storage_credentials& credentials,
                                  const std::string& container) -> result<std::string>;

/**
 * @brief Blob URL with a read-only SAS
 */
[[nodiscard]] auto build_blob_url(const storage_credentials& credentials,
                                  const std::string& container,
                                  const std::string& blob) -> result<std::string>;

/**
 * @brief Container URL with an "rl" SAS
 */
[[nodiscard]] auto build_container_url(const storage_credentials& credentials,
                                       const std::string& container) -> result<std::string>;

}  // namespace azblob

#endif  // AZBLOB_STORAGE_SAS_TOKEN_H
