/**
 * @file shared_key_signer.cpp
 * @brief Shared Key authorization
 */

#include <azblob/storage/shared_key_signer.h>
#include <azblob/storage/storage_utils.h>

#include <sstream>

namespace azblob {

namespace {

auto find_header(const http_headers& headers, const std::string& name) -> std::string {
    for (const auto& [key, value] : headers) {
        if (storage_utils::iequals(key, name)) {
            return value;
        }
    }
    return {};
}

auto trim(const std::string& value) -> std::string {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

}  // namespace

auto build_shared_key_string_to_sign(const std::string& method,
                                     const std::string& account,
                                     const http_headers& headers,
                                     const std::string& resource_path,
                                     const query_parameters& query) -> std::string {
    std::ostringstream string_to_sign;
    string_to_sign << method << "\n";

    // A zero Content-Length is signed as empty
    auto content_length = find_header(headers, "Content-Length");
    if (content_length == "0") {
        content_length.clear();
    }

    string_to_sign << find_header(headers, "Content-Encoding") << "\n";
    string_to_sign << find_header(headers, "Content-Language") << "\n";
    string_to_sign << content_length << "\n";
    string_to_sign << find_header(headers, "Content-MD5") << "\n";
    string_to_sign << find_header(headers, "Content-Type") << "\n";
    string_to_sign << "\n";  // Date, superseded by x-ms-date
    string_to_sign << find_header(headers, "If-Modified-Since") << "\n";
    string_to_sign << find_header(headers, "If-Match") << "\n";
    string_to_sign << find_header(headers, "If-None-Match") << "\n";
    string_to_sign << find_header(headers, "If-Unmodified-Since") << "\n";
    string_to_sign << find_header(headers, "Range") << "\n";

    // Canonicalized headers (x-ms-*)
    std::map<std::string, std::string> ms_headers;
    for (const auto& [key, value] : headers) {
        auto lower_key = storage_utils::to_lower(key);
        if (lower_key.rfind("x-ms-", 0) == 0) {
            ms_headers[lower_key] = trim(value);
        }
    }

    for (const auto& [key, value] : ms_headers) {
        string_to_sign << key << ":" << value << "\n";
    }

    // Canonicalized resource
    string_to_sign << "/" << account << (resource_path.empty() ? "/" : resource_path);

    std::map<std::string, std::string> canonical_query;
    for (const auto& [key, value] : query) {
        canonical_query[storage_utils::to_lower(key)] = value;
    }
    for (const auto& [key, value] : canonical_query) {
        string_to_sign << "\n" << key << ":" << value;
    }

    return string_to_sign.str();
}

shared_key_signer::shared_key_signer(std::string account,
                                     std::string key,
                                     std::shared_ptr<storage_logger> logger)
    : account_(std::move(account)),
      key_(std::move(key)),
      logger_(ensure_logger(std::move(logger))) {}

auto shared_key_signer::sign(const std::string& method,
                             const http_headers& headers,
                             const std::string& resource_path,
                             const query_parameters& query) const -> result<std::string> {
    if (account_.empty() || key_.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "Shared Key authorization requires an account name and key"));
    }

    auto string_to_sign = build_shared_key_string_to_sign(method, account_, headers,
                                                          resource_path, query);
    auto signature = storage_utils::sign_with_account_key(key_, string_to_sign);
    if (!signature) {
        AZB_LOG_ERROR(*logger_, log_category::auth,
                      "Shared Key signing failed for " + account_ + ": " +
                          signature.error().message);
        return unexpected(signature.error());
    }

    AZB_LOG_TRACE(*logger_, log_category::auth,
                  "Signed " + method + " /" + account_ + resource_path);
    return "SharedKey " + account_ + ":" + signature.value();
}

auto generate_authorization_header(const std::string& method,
                                   const std::string& account,
                                   const std::string& key,
                                   const http_headers& headers) -> result<std::string> {
    return shared_key_signer(account, key).sign(method, headers);
}

auto generate_authorization_header(const std::string& method,
                                   const std::string& account,
                                   const std::string& key,
                                   const http_headers& headers,
                                   const std::string& resource_path,
                                   const query_parameters& query) -> result<std::string> {
    return shared_key_signer(account, key).sign(method, headers, resource_path, query);
}

}  // namespace azblob
