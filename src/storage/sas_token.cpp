/**
 * @file sas_token.cpp
 * @brief Service SAS generation
 */

#include <azblob/storage/sas_token.h>
#include <azblob/storage/storage_utils.h>

#include <sstream>

namespace azblob {

auto sas_token::query_string() const -> std::string {
    using storage_utils::url_encode;

    std::ostringstream oss;
    oss << "sv=" << url_encode(signed_version)
        << "&sr=" << url_encode(signed_resource)
        << "&sp=" << url_encode(permissions)
        << "&se=" << url_encode(expiry)
        << "&sig=" << url_encode(signature)
        << "&spr=" << url_encode(protocol);
    return oss.str();
}

auto build_sas_string_to_sign(const std::string& account,
                              const std::string& container,
                              const std::string& permissions,
                              const std::string& expiry,
                              const std::string& api_version) -> std::string {
    std::ostringstream oss;
    oss << permissions << '\n'                              // signedPermissions
        << '\n'                                             // signedStart
        << expiry << '\n'                                   // signedExpiry
        << "/blob/" << account << '/' << container << '\n'  // canonicalizedResource
        << '\n'                                             // signedIdentifier
        << '\n'                                             // signedIP
        << "https" << '\n'                                  // signedProtocol
        << api_version << '\n'                              // signedVersion
        << 'c' << '\n'                                      // signedResource
        << '\n'                                             // signedSnapshotTime
        << '\n'                                             // signedEncryptionScope
        << '\n'                                             // rscc
        << '\n'                                             // rscd
        << '\n'                                             // rsce
        << '\n';                                            // rscl, then empty rsct
    return oss.str();
}

sas_token_generator::sas_token_generator(blob_client_config config,
                                         std::shared_ptr<storage_logger> logger)
    : config_(std::move(config)), logger_(ensure_logger(std::move(logger))) {}

auto sas_token_generator::generate(const std::string& account,
                                   const std::string& key,
                                   const std::string& container,
                                   const std::string& permissions,
                                   int expiry_hours,
                                   clock::time_point now) const -> result<sas_token> {
    if (account.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "SAS generation requires an account name"));
    }
    if (key.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "SAS generation requires an account key"));
    }
    if (container.empty()) {
        return unexpected(error(error_code::configuration_error,
                                "SAS generation requires a container name"));
    }
    if (expiry_hours <= 0) {
        return unexpected(error(error_code::invalid_argument,
                                "SAS expiry must be in the future, got " +
                                    std::to_string(expiry_hours) + " hours"));
    }

    sas_token token;
    token.signed_version = config_.api_version;
    token.permissions = permissions;
    token.expiry = storage_utils::format_iso8601(now + std::chrono::hours(expiry_hours));

    auto string_to_sign = build_sas_string_to_sign(account, container, permissions,
                                                   token.expiry, token.signed_version);
    auto signature = storage_utils::sign_with_account_key(key, string_to_sign);
    if (!signature) {
        AZB_LOG_ERROR(*logger_, log_category::sas,
                      "SAS signing failed for container " + container + ": " +
                          signature.error().message);
        return unexpected(signature.error());
    }
    token.signature = std::move(signature.value());

    AZB_LOG_DEBUG(*logger_, log_category::sas,
                  "Generated SAS for /" + account + "/" + container + " sp=" + permissions +
                      " se=" + token.expiry);
    return token;
}

auto sas_token_generator::container_url(const storage_credentials& credentials,
                                        const std::string& container,
                                        clock::time_point now) const -> result<std::string> {
    auto base = credentials.blob_endpoint() + "/" + storage_utils::encode_blob_path(container);

    if (!credentials.has_signing_key()) {
        // A connection string may carry its own SAS instead of a key
        if (credentials.sas_token && !credentials.sas_token->empty()) {
            const auto& sas = *credentials.sas_token;
            return base + (sas.front() == '?' ? sas : "?" + sas);
        }
        return unexpected(error(error_code::configuration_error,
                                "Account key is required to sign container URLs"));
    }

    auto token = generate(credentials.account_name, credentials.account_key, container,
                          "rl", 24, now);
    if (!token) {
        return unexpected(token.error());
    }
    return base + token.value().to_string();
}

auto sas_token_generator::list_url(const storage_credentials& credentials,
                                   const std::string& container,
                                   clock::time_point now) const -> result<std::string> {
    auto url = container_url(credentials, container, now);
    if (!url) {
        return url;
    }
    return storage_utils::append_query(url.value(), "restype=container&comp=list");
}

auto sas_token_generator::blob_url(const storage_credentials& credentials,
                                   const std::string& container,
                                   const std::string& blob,
                                   clock::time_point now) const -> result<std::string> {
    auto base = credentials.blob_endpoint() + "/" +
                storage_utils::encode_blob_path(container) + "/" +
                storage_utils::encode_blob_path(blob);

    if (!credentials.has_signing_key()) {
        if (credentials.sas_token && !credentials.sas_token->empty()) {
            const auto& sas = *credentials.sas_token;
            return base + (sas.front() == '?' ? sas : "?" + sas);
        }
        return unexpected(error(error_code::configuration_error,
                                "Account key is required to sign blob URLs"));
    }

    auto token = generate(credentials.account_name, credentials.account_key, container,
                          "r", 24, now);
    if (!token) {
        return unexpected(token.error());
    }
    return base + token.value().to_string();
}

auto generate_sas_token(const std::string& account,
                        const std::string& key,
                        const std::string& container,
                        const std::string& permissions,
                        int expiry_hours,
                        std::chrono::system_clock::time_point now) -> result<sas_token> {
    return sas_token_generator().generate(account, key, container, permissions,
                                          expiry_hours, now);
}

auto build_list_url(const storage_credentials& credentials,
                    const std::string& container) -> result<std::string> {
    return sas_token_generator().list_url(credentials, container);
}

auto build_blob_url(const storage_credentials& credentials,
                    const std::string& container,
                    const std::string& blob) -> result<std::string> {
    return sas_token_generator().blob_url(credentials, container, blob);
}

auto build_container_url(const storage_credentials& credentials,
                         const std::string& container) -> result<std::string> {
    return sas_token_generator().container_url(credentials, container);
}

}  // namespace azblob
