/**
 * @file shared_key_signer.h
 * @brief Shared Key authorization for account-level requests
 */

#ifndef AZBLOB_STORAGE_SHARED_KEY_SIGNER_H
#define AZBLOB_STORAGE_SHARED_KEY_SIGNER_H

#include <azblob/core/logging.h>
#include <azblob/core/types.h>
#include <azblob/storage/http_transport.h>

#include <map>
#include <memory>
#include <string>

namespace azblob {

/// Query parameters signed into the canonicalized resource
using query_parameters = std::map<std::string, std::string>;

/**
 * @brief Build the Shared Key string-to-sign
 *
 * Layout: the verb, the eleven standard headers (Date is always empty since
 * x-ms-date is signed instead), the canonicalized x-ms- headers, then the
 * canonicalized resource `/{account}{path}` followed by one `name:value`
 * line per query parameter.
 *
 * @param method HTTP verb
 * @param account Storage account name
 * @param headers Request headers; standard header lookup is case-insensitive
 * @param resource_path Resource path, "/" for account-level operations
 * @param query Query parameters, values not URL-encoded
 */
[[nodiscard]] auto build_shared_key_string_to_sign(
    const std::string& method,
    const std::string& account,
    const http_headers& headers,
    const std::string& resource_path = "/",
    const query_parameters& query = {{"comp", "list"}}) -> std::string;

/**
 * @brief Signs requests with an account key
 *
 * @code
 * shared_key_signer signer(credentials.account_name, credentials.account_key, logger);
 * http_headers headers{{"x-ms-date", date}, {"x-ms-version", "2023-11-03"}};
 * auto auth = signer.sign("GET", headers);
 * if (auth) headers["Authorization"] = auth.value();
 * @endcode
 */
class shared_key_signer {
public:
    shared_key_signer(std::string account,
                      std::string key,
                      std::shared_ptr<storage_logger> logger = nullptr);

    /**
     * @brief Compute the Authorization header value
     * @return "SharedKey {account}:{signature}", or configuration_error when
     *         the account or key is missing or the key is not base64
     */
    [[nodiscard]] auto sign(const std::string& method,
                            const http_headers& headers,
                            const std::string& resource_path = "/",
                            const query_parameters& query = {{"comp", "list"}}) const
        -> result<std::string>;

private:
    std::string account_;
    std::string key_;
    std::shared_ptr<storage_logger> logger_;
};

/**
 * @brief Authorization header for the List Containers operation
 */
[[nodiscard]] auto generate_authorization_header(const std::string& method,
                                                 const std::string& account,
                                                 const std::string& key,
                                                 const http_headers& headers)
    -> result<std::string>;

/**
 * @brief Authorization header for an arbitrary resource
 */
[[nodiscard]] auto generate_authorization_header(const std::string& method,
                                                 const std::string& account,
                                                 const std::string& key,
                                                 const http_headers& headers,
                                                 const std::string& resource_path,
                                                 const query_parameters& query)
    -> result<std::string>;

}  // namespace azblob

#endif  // AZBLOB_STORAGE_SHARED_KEY_SIGNER_H
