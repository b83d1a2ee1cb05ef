/**
 * @file container_lister.cpp
 * @brief Paginated blob and container enumeration
 */

#include <azblob/storage/container_lister.h>
#include <azblob/storage/shared_key_signer.h>
#include <azblob/storage/storage_utils.h>

namespace azblob {

namespace {

constexpr const char* list_blobs_query = "restype=container&comp=list";

auto contains(const std::string& haystack, const char* needle) -> bool {
    return haystack.find(needle) != std::string::npos;
}

auto check_enumeration_results(const http_response& response,
                               const char* operation) -> result<void> {
    if (response.status_code != 200) {
        return unexpected(make_http_status_error(response.status_code, operation));
    }
    if (response.body.find("<EnumerationResults") == std::string::npos) {
        return unexpected(error(error_code::xml_parse_error,
                                std::string(operation) +
                                    ": response is not an EnumerationResults document"));
    }
    return {};
}

auto parse_next_marker(const std::string& body) -> result<std::optional<std::string>> {
    auto markers = storage_utils::extract_xml_elements(body, "NextMarker");
    if (!markers) {
        return unexpected(markers.error());
    }
    if (markers.value().empty() || markers.value().front().empty()) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{
        storage_utils::decode_xml_entities(markers.value().front())};
}

auto with_marker(const std::string& url, const std::optional<std::string>& marker)
    -> std::string {
    if (!marker) {
        return url;
    }
    return storage_utils::append_query(url, "marker=" + storage_utils::url_encode(*marker));
}

}  // namespace

auto describe_container(const std::string& name) -> container_info {
    container_info info{name, name, "Storage container"};

    if (contains(name, "mysitemedia")) {
        info.friendly_name = "Media Files";
        info.description = "Media files and assets";
    } else if (name == "$web") {
        info.friendly_name = "Web Content";
        info.description = "Static website content";
    } else if (contains(name, "insights-logs-appserviceconsolelogs")) {
        info.friendly_name = "Console Logs";
        info.description = "Application console logs";
    } else if (contains(name, "insights-logs-appservicehttplogs")) {
        info.friendly_name = "HTTP Logs";
        info.description = "HTTP/Web server logs";
    } else if (contains(name, "insights-logs-appserviceapplogs")) {
        info.friendly_name = "Application Logs";
        info.description = "Application logs";
    } else if (contains(name, "insights-logs-appserviceplatformlogs")) {
        info.friendly_name = "Platform Logs";
        info.description = "Platform logs";
    } else if (contains(name, "insights-logs-appservicefileauditlogs")) {
        info.friendly_name = "File Audit Logs";
        info.description = "File audit logs";
    } else if (contains(name, "insights-logs-appserviceantivirusscanauditlogs")) {
        info.friendly_name = "Antivirus Scan Logs";
        info.description = "Antivirus scan audit logs";
    } else if (contains(name, "insights-metrics")) {
        info.friendly_name = "Metrics";
        info.description = "Application metrics";
    } else if (contains(name, "backup")) {
        info.friendly_name = "Database Backups";
        info.description = "Database backups";
    } else if (name == "dataprotectionkeys") {
        info.friendly_name = "Data Protection Keys";
        info.description = "ASP.NET Core data protection keys";
    } else if (name == "$logs") {
        info.friendly_name = "Storage Logs";
        info.description = "Azure Storage analytics logs";
    } else if (name == "$blobchangefeed") {
        info.friendly_name = "Blob Change Feed";
        info.description = "Blob change feed data";
    }

    return info;
}

container_lister::container_lister(std::shared_ptr<http_transport_interface> transport,
                                   blob_client_config config,
                                   std::shared_ptr<storage_logger> logger)
    : transport_(std::move(transport)),
      config_(std::move(config)),
      logger_(ensure_logger(std::move(logger))) {
    if (!transport_) {
        transport_ = std::make_shared<curl_http_transport>(config_, logger_);
    }
}

auto container_lister::fetch_blob_page(const std::string& list_url) const
    -> result<blob_list_page> {
    auto response = transport_->get(list_url, {});
    if (!response) {
        return unexpected(response.error());
    }

    auto valid = check_enumeration_results(response.value(), "List blobs");
    if (!valid) {
        return unexpected(valid.error());
    }

    const auto& body = response.value().body;
    auto names = storage_utils::extract_xml_elements(body, "Name");
    if (!names) {
        return unexpected(names.error());
    }

    auto marker = parse_next_marker(body);
    if (!marker) {
        return unexpected(marker.error());
    }

    blob_list_page page;
    page.names.reserve(names.value().size());
    for (const auto& name : names.value()) {
        page.names.push_back(storage_utils::decode_xml_entities(name));
    }
    page.next_marker = std::move(marker.value());
    return page;
}

auto container_lister::list_blobs(const std::string& container_url) const
    -> result<blob_listing> {
    auto parts = storage_utils::parse_url(container_url);
    if (!parts) {
        return unexpected(error(error_code::invalid_argument,
                                "Container URL is not an absolute URL"));
    }

    const std::string target(storage_utils::strip_query(container_url));
    const auto list_url = storage_utils::append_query(container_url, list_blobs_query);
    const std::string blob_prefix = parts->scheme + "://" + parts->host + parts->path + "/";
    const std::string blob_query = parts->query.empty() ? "" : "?" + parts->query;

    blob_listing listing;
    std::optional<std::string> marker;

    while (true) {
        auto page = fetch_blob_page(with_marker(list_url, marker));
        ++listing.pages;
        if (!page) {
            blob_log_context ctx;
            ctx.container = target;
            ctx.page = listing.pages;
            ctx.http_status = page.error().http_status;
            ctx.error_message = page.error().message;
            AZB_LOG_CTX(*logger_, log_level::error, log_category::lister,
                        "Blob listing failed", ctx);
            return unexpected(page.error());
        }

        for (const auto& name : page.value().names) {
            listing.urls.push_back(blob_prefix + storage_utils::encode_blob_path(name) +
                                   blob_query);
        }

        AZB_LOG_DEBUG(*logger_, log_category::lister,
                      "Page " + std::to_string(listing.pages) + ": " +
                          std::to_string(page.value().names.size()) + " blobs (total " +
                          std::to_string(listing.urls.size()) + ")");

        marker = std::move(page.value().next_marker);
        if (!marker) {
            break;
        }

        if (listing.pages == config_.large_container_page_threshold) {
            AZB_LOG_WARN(*logger_, log_category::lister,
                         "Large container: " + std::to_string(listing.urls.size()) +
                             " blobs after " + std::to_string(listing.pages) +
                             " pages and more remain; consider a narrower time range");
        }

        if (listing.pages >= config_.max_list_pages) {
            listing.truncated = true;
            blob_log_context ctx;
            ctx.container = target;
            ctx.page = listing.pages;
            ctx.blob_count = listing.urls.size();
            AZB_LOG_WARN_CTX(*logger_, log_category::lister,
                             "Page limit reached, returning partial blob list", ctx);
            break;
        }
    }

    blob_log_context ctx;
    ctx.container = target;
    ctx.page = listing.pages;
    ctx.blob_count = listing.urls.size();
    AZB_LOG_INFO_CTX(*logger_, log_category::lister, "Blob listing complete", ctx);
    return listing;
}

auto container_lister::count_blobs(const std::string& container_url,
                                   std::optional<uint32_t> max_pages) const
    -> result<blob_count> {
    const uint32_t limit = max_pages.value_or(config_.count_max_pages);
    if (limit == 0) {
        return unexpected(error(error_code::invalid_argument,
                                "count_blobs requires at least one page"));
    }

    const auto list_url = storage_utils::append_query(container_url, list_blobs_query);

    blob_count count;
    std::optional<std::string> marker;

    do {
        auto page = fetch_blob_page(with_marker(list_url, marker));
        if (!page) {
            return unexpected(page.error());
        }
        ++count.pages;
        count.count += page.value().names.size();
        marker = std::move(page.value().next_marker);
    } while (marker && count.pages < limit);

    count.estimated = marker.has_value();

    AZB_LOG_DEBUG(*logger_, log_category::lister,
                  "Counted " + std::to_string(count.count) + " blobs in " +
                      std::to_string(count.pages) + " pages" +
                      (count.estimated ? " (estimated)" : ""));
    return count;
}

auto container_lister::list_containers(const storage_credentials& credentials,
                                       clock::time_point now) const
    -> result<std::vector<container_info>> {
    if (!credentials.has_signing_key()) {
        return unexpected(error(error_code::configuration_error,
                                "Listing containers requires an account name and key"));
    }

    shared_key_signer signer(credentials.account_name, credentials.account_key, logger_);
    const auto base_url = credentials.blob_endpoint() + "/?comp=list";

    std::vector<container_info> containers;
    std::optional<std::string> marker;
    uint32_t pages = 0;

    while (true) {
        http_headers headers{
            {"x-ms-date", storage_utils::format_rfc1123(now)},
            {"x-ms-version", config_.api_version},
        };

        query_parameters query{{"comp", "list"}};
        if (marker) {
            query["marker"] = *marker;
        }

        auto authorization = signer.sign("GET", headers, "/", query);
        if (!authorization) {
            return unexpected(authorization.error());
        }
        headers["Authorization"] = authorization.value();

        auto response = transport_->get(with_marker(base_url, marker), headers);
        ++pages;
        if (!response) {
            return unexpected(response.error());
        }

        auto valid = check_enumeration_results(response.value(), "List containers");
        if (!valid) {
            AZB_LOG_ERROR(*logger_, log_category::lister, valid.error().message);
            return unexpected(valid.error());
        }

        const auto& body = response.value().body;
        auto entries = storage_utils::extract_xml_elements(body, "Container");
        if (!entries) {
            return unexpected(entries.error());
        }

        for (const auto& entry : entries.value()) {
            auto name = storage_utils::extract_xml_element(entry, "Name");
            if (!name) {
                return unexpected(error(error_code::xml_parse_error,
                                        "List containers: <Container> without <Name>"));
            }
            containers.push_back(describe_container(storage_utils::decode_xml_entities(*name)));
        }

        auto next = parse_next_marker(body);
        if (!next) {
            return unexpected(next.error());
        }
        marker = std::move(next.value());
        if (!marker) {
            break;
        }
        if (pages >= config_.max_list_pages) {
            AZB_LOG_WARN(*logger_, log_category::lister,
                         "Page limit reached, returning partial container list");
            break;
        }
    }

    AZB_LOG_INFO(*logger_, log_category::lister,
                 "Found " + std::to_string(containers.size()) + " containers in " +
                     credentials.account_name);
    return containers;
}

}  // namespace azblob
