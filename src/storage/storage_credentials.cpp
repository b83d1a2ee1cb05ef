/**
 * @file storage_credentials.cpp
 * @brief Connection string parsing and environment credential loading
 */

#include <azblob/storage/storage_credentials.h>

#include <cstdlib>
#include <map>
#include <sstream>

namespace azblob {

namespace {

auto env_value(const char* name) -> std::string {
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string();
}

auto parse_parts(std::string_view connection_string) -> std::map<std::string, std::string> {
    std::map<std::string, std::string> parts;

    std::size_t start = 0;
    while (start <= connection_string.size()) {
        auto end = connection_string.find(';', start);
        if (end == std::string_view::npos) {
            end = connection_string.size();
        }

        auto part = connection_string.substr(start, end - start);
        auto eq = part.find('=');
        if (eq != std::string_view::npos && eq > 0 && eq + 1 < part.size()) {
            // Later occurrences of a key replace earlier ones
            parts[std::string(part.substr(0, eq))] = std::string(part.substr(eq + 1));
        }

        start = end + 1;
    }

    return parts;
}

auto query_parameter(const std::string& query, const std::string& name) -> std::string {
    std::string needle = name + "=";
    std::size_t pos = 0;
    while (pos < query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        if (query.compare(pos, needle.size(), needle) == 0) {
            return query.substr(pos + needle.size(), end - pos - needle.size());
        }
        pos = end + 1;
    }
    return {};
}

}  // namespace

auto resolve_credentials(std::string_view connection_string) -> result<storage_credentials> {
    auto parts = parse_parts(connection_string);

    auto account = parts.find("AccountName");
    if (account == parts.end()) {
        return unexpected(error(error_code::configuration_error,
                                "Invalid connection string: missing AccountName"));
    }

    storage_credentials credentials;
    credentials.account_name = account->second;

    if (auto it = parts.find("AccountKey"); it != parts.end()) {
        credentials.account_key = it->second;
    }
    if (auto it = parts.find("EndpointSuffix"); it != parts.end()) {
        credentials.endpoint_suffix = it->second;
    }
    if (auto it = parts.find("DefaultEndpointsProtocol"); it != parts.end()) {
        credentials.protocol = it->second;
    }
    if (auto it = parts.find("SharedAccessSignature"); it != parts.end()) {
        credentials.sas_token = it->second;
    }

    return credentials;
}

auto credentials_from_environment(std::shared_ptr<storage_logger> logger)
    -> result<storage_credentials> {
    logger = ensure_logger(std::move(logger));

    auto connection_string = env_value("AZURE_STORAGE_CONNECTION_STRING");
    if (!connection_string.empty()) {
        auto resolved = resolve_credentials(connection_string);
        if (resolved) {
            AZB_LOG_DEBUG(*logger, log_category::credentials,
                          "Using AZURE_STORAGE_CONNECTION_STRING: " +
                              mask_credentials(resolved.value()));
        }
        return resolved;
    }

    auto account = env_value("AZURE_STORAGE_ACCOUNT");
    auto key = env_value("AZURE_STORAGE_KEY");
    if (!account.empty() && !key.empty()) {
        storage_credentials credentials;
        credentials.account_name = account;
        credentials.account_key = key;

        auto endpoint = env_value("AZURE_STORAGE_ENDPOINT");
        if (!endpoint.empty()) {
            credentials.endpoint_suffix = endpoint;
        }

        AZB_LOG_DEBUG(*logger, log_category::credentials,
                      "Using AZURE_STORAGE_ACCOUNT/AZURE_STORAGE_KEY: " +
                          mask_credentials(credentials));
        return credentials;
    }

    return unexpected(error(error_code::configuration_error,
        "No storage credentials: set AZURE_STORAGE_CONNECTION_STRING or "
        "AZURE_STORAGE_ACCOUNT and AZURE_STORAGE_KEY"));
}

auto mask_credentials(const storage_credentials& credentials) -> std::string {
    std::ostringstream oss;
    oss << "AccountName=" << credentials.account_name
        << ";AccountKey="
        << (credentials.account_key.empty()
                ? std::string("<none>")
                : sensitive_info_masker::mask_secret(credentials.account_key))
        << ";EndpointSuffix=" << credentials.endpoint_suffix
        << ";DefaultEndpointsProtocol=" << credentials.protocol;

    if (credentials.sas_token) {
        const auto& sas = *credentials.sas_token;
        std::string query = sas.empty() || sas.front() != '?' ? sas : sas.substr(1);
        oss << ";SharedAccessSignature=[SAS token with permissions: "
            << query_parameter(query, "sp") << ", expires: "
            << query_parameter(query, "se") << "]";
    }

    return oss.str();
}

}  // namespace azblob
