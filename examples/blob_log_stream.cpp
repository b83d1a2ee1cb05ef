/**
 * @file blob_log_stream.cpp
 * @brief Stream App Service diagnostic logs out of a storage container
 *
 * This example demonstrates:
 * - Loading credentials from the environment
 * - Signing a container URL with a Service SAS
 * - Listing blobs and narrowing them to a UTC time window
 * - Streaming each blob line by line with gzip handled transparently
 * - Listing the containers of an account with Shared Key authorization
 */

#include <azblob/azblob.h>

#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <string>

using namespace azblob;

namespace {

/**
 * @brief Format bytes into human-readable string
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Blob Log Stream - Azure Blob Storage log reader" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program << " --container <name> [options]" << std::endl;
    std::cout << "   or: " << program << " --list-containers" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --container <name>  Container to read" << std::endl;
    std::cout << "  -m, --minutes <n>       Only blobs from the last n minutes" << std::endl;
    std::cout << "  --start <timestamp>     Window start (UTC, e.g. 2024-03-15T09:00:00Z)" << std::endl;
    std::cout << "  --end <timestamp>       Window end" << std::endl;
    std::cout << "  --list-containers       List the account's containers" << std::endl;
    std::cout << "  --debug                 Verbose per-blob and per-line diagnostics" << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Credentials are read from AZURE_STORAGE_CONNECTION_STRING, or from" << std::endl;
    std::cout << "AZURE_STORAGE_ACCOUNT and AZURE_STORAGE_KEY." << std::endl;
}

int main(int argc, char* argv[]) {
    std::string container;
    std::string start_text;
    std::string end_text;
    uint32_t minutes = 0;
    bool list_only = false;
    bool debug = false;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-c" || arg == "--container") {
            if (++i >= argc) {
                std::cerr << "Error: --container requires an argument" << std::endl;
                return 1;
            }
            container = argv[i];
        } else if (arg == "-m" || arg == "--minutes") {
            if (++i >= argc) {
                std::cerr << "Error: --minutes requires an argument" << std::endl;
                return 1;
            }
            minutes = static_cast<uint32_t>(std::stoul(argv[i]));
        } else if (arg == "--start") {
            if (++i >= argc) {
                std::cerr << "Error: --start requires an argument" << std::endl;
                return 1;
            }
            start_text = argv[i];
        } else if (arg == "--end") {
            if (++i >= argc) {
                std::cerr << "Error: --end requires an argument" << std::endl;
                return 1;
            }
            end_text = argv[i];
        } else if (arg == "--list-containers") {
            list_only = true;
        } else if (arg == "--debug") {
            debug = true;
        } else {
            std::cerr << "Error: unknown option " << arg << std::endl;
            return 1;
        }
    }

    auto config_result = blob_client_config::from_environment();
    if (!config_result.has_value()) {
        std::cerr << "Invalid configuration: " << config_result.error().message << std::endl;
        return 1;
    }
    auto config = blob_client_config_builder(config_result.value())
        .with_debug(debug || config_result.value().debug)
        .build();

    auto logger = std::make_shared<storage_logger>();
    logger->set_level(config.debug ? log_level::debug : log_level::info);

    auto credentials = credentials_from_environment(logger);
    if (!credentials.has_value()) {
        std::cerr << credentials.error().message << std::endl;
        return 1;
    }

    auto transport = std::make_shared<curl_http_transport>(config, logger);
    container_lister lister(transport, config, logger);

    // Handle container listing mode
    if (list_only) {
        auto containers = lister.list_containers(credentials.value());
        if (!containers.has_value()) {
            std::cerr << "Failed to list containers: " << containers.error().message << std::endl;
            return 1;
        }
        for (const auto& info : containers.value()) {
            std::cout << std::left << std::setw(48) << info.name
                      << info.friendly_name << " - " << info.description << std::endl;
        }
        return 0;
    }

    if (container.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    // Resolve the time window
    time_window window;
    if (minutes > 0) {
        window = time_window::last_minutes(minutes);
    } else if (!start_text.empty() || !end_text.empty()) {
        if (start_text.empty() || end_text.empty()) {
            std::cerr << "Error: --start and --end must be given together" << std::endl;
            return 1;
        }
        auto parsed = time_window::from_strings(start_text, end_text);
        if (!parsed.has_value()) {
            std::cerr << "Error: " << parsed.error().message << std::endl;
            return 1;
        }
        window = parsed.value();
    }

    sas_token_generator sas(config, logger);
    auto container_url = sas.container_url(credentials.value(), container);
    if (!container_url.has_value()) {
        std::cerr << "Failed to sign container URL: " << container_url.error().message << std::endl;
        return 1;
    }

    auto listing = lister.list_blobs(container_url.value());
    if (!listing.has_value()) {
        std::cerr << "Failed to list blobs: " << listing.error().message << std::endl;
        return 1;
    }
    if (listing.value().truncated) {
        std::cerr << "Warning: listing stopped after " << listing.value().pages
                  << " pages; results are partial" << std::endl;
    }

    filter_options filter_opts;
    filter_opts.debug = config.debug;
    time_window_filter filter(filter_opts, logger);
    auto selected = filter.filter_blobs_by_date(listing.value().urls, window);

    blob_stream_downloader downloader(transport, config, logger);

    uint64_t total_bytes = 0;
    uint64_t total_lines = 0;
    uint64_t failed_blobs = 0;

    for (const auto& url : selected) {
        auto stats = downloader.stream_blob(url, [](std::string_view line) {
            std::cout << line << '\n';
        });
        if (!stats.has_value()) {
            std::cerr << "Skipping blob: " << stats.error().message << std::endl;
            ++failed_blobs;
            continue;
        }
        total_bytes += stats.value().bytes_downloaded;
        total_lines += stats.value().lines_processed;
    }
    std::cout.flush();

    std::cerr << std::endl;
    std::cerr << "Blobs listed:   " << listing.value().urls.size() << std::endl;
    std::cerr << "Blobs streamed: " << selected.size() - failed_blobs << std::endl;
    std::cerr << "Lines:          " << total_lines << std::endl;
    std::cerr << "Data:           " << format_bytes(total_bytes) << std::endl;

    logger->flush();
    return failed_blobs == 0 ? 0 : 2;
}
