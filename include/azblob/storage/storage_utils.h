/**
 * @file storage_utils.h
 * @brief Utility functions shared by the storage signing and listing code
 *
 * Encoding, HMAC, time formatting, URL and XML helpers used by the SAS
 * generator, the Shared Key signer, the lister and the downloader.
 */

#ifndef AZBLOB_STORAGE_STORAGE_UTILS_H
#define AZBLOB_STORAGE_STORAGE_UTILS_H

#include <azblob/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace azblob::storage_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Base64 encode bytes
 * @param data Vector of bytes to encode
 * @return Base64 encoded string
 */
auto base64_encode(const std::vector<uint8_t>& data) -> std::string;

/**
 * @brief Base64 encode string
 * @param data String to encode
 * @return Base64 encoded string
 */
auto base64_encode(const std::string& data) -> std::string;

/**
 * @brief Base64 decode string
 *
 * Characters outside the base64 alphabet are skipped; decoding stops at the
 * first '=' padding character.
 *
 * @param encoded Base64 encoded string
 * @return Decoded bytes
 */
auto base64_decode(const std::string& encoded) -> std::vector<uint8_t>;

/**
 * @brief URL encode a string (RFC 3986)
 * @param value String to encode
 * @param encode_slash Whether to encode forward slashes (default: true)
 * @return URL encoded string
 */
auto url_encode(const std::string& value, bool encode_slash = true) -> std::string;

/**
 * @brief Encode a blob name for use as a URL path
 *
 * Keeps the RFC 3986 pchar set, so partition paths such as
 * `y=2024/m=03/d=15` survive unchanged.
 */
auto encode_blob_path(const std::string& name) -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

/**
 * @brief HMAC-SHA256
 * @param key Key bytes
 * @param data Data to sign
 * @return HMAC-SHA256 result (32 bytes)
 */
auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t>;

/**
 * @brief HMAC-SHA256 keyed by a base64 account key, base64 encoded
 * @param base64_key Account key as found in the connection string
 * @param data String-to-sign
 * @return Signature, or configuration_error if the key decodes to nothing
 */
auto sign_with_account_key(const std::string& base64_key,
                           const std::string& data) -> result<std::string>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format as ISO 8601 truncated to seconds (YYYY-MM-DDTHH:MM:SSZ)
 */
auto format_iso8601(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Format as RFC 1123 (Fri, 15 Mar 2024 09:00:00 GMT)
 */
auto format_rfc1123(std::chrono::system_clock::time_point tp) -> std::string;

/**
 * @brief Build a UTC time point from calendar fields
 *
 * No range checking is done; callers validate the fields first.
 */
auto make_utc_time(int year, int month, int day,
                   int hour = 0, int minute = 0, int second = 0)
    -> std::chrono::system_clock::time_point;

// ============================================================================
// URL Utilities
// ============================================================================

/**
 * @brief Components of an absolute http(s) URL
 */
struct url_parts {
    std::string scheme;  ///< "https"
    std::string host;    ///< authority, including any port
    std::string path;    ///< path without trailing '/', may be empty
    std::string query;   ///< query without the leading '?', may be empty
};

/**
 * @brief Split an absolute URL into scheme, host, path and query
 * @return nullopt when the URL has no scheme or host
 */
auto parse_url(const std::string& url) -> std::optional<url_parts>;

/**
 * @brief Append a raw query fragment, choosing '?' or '&'
 */
auto append_query(const std::string& url, const std::string& fragment) -> std::string;

/**
 * @brief Drop everything from the first '?' on
 */
auto strip_query(std::string_view url) -> std::string_view;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Extract XML element value
 * @param xml XML string to parse
 * @param tag Tag name to extract
 * @return Element value if found, nullopt otherwise
 */
auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string>;

/**
 * @brief Extract every value of an element, in document order
 * @return Values, or xml_parse_error if an element is not terminated
 */
auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> result<std::vector<std::string>>;

/**
 * @brief Decode the five predefined XML entities
 */
auto decode_xml_entities(const std::string& text) -> std::string;

// ============================================================================
// String Utilities
// ============================================================================

auto to_lower(std::string_view value) -> std::string;

auto iequals(std::string_view lhs, std::string_view rhs) -> bool;

auto is_blank(std::string_view value) -> bool;

}  // namespace azblob::storage_utils

#endif  // AZBLOB_STORAGE_STORAGE_UTILS_H
