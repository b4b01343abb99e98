/**
 * @file upload_example.cpp
 * @brief Distribution upload example with progress reporting and error handling
 *
 * This example demonstrates:
 * - Building a client from environment variables and command line flags
 * - Uploading a file through the stage, store and commit phases
 * - Using progress callbacks to monitor the store phase
 * - Reacting to errors that require restarting from the stage phase
 */

#include <kcenon/package_client/package_client.h>

#include <chrono>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::package_client;

namespace {

/**
 * @brief Format bytes into human-readable string
 * @param bytes Number of bytes
 * @return Formatted string (e.g., "1.5 MB")
 */
auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t KB = 1024;
    constexpr uint64_t MB = KB * 1024;
    constexpr uint64_t GB = MB * 1024;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2);

    if (bytes >= GB) {
        oss << static_cast<double>(bytes) / static_cast<double>(GB) << " GB";
    } else if (bytes >= MB) {
        oss << static_cast<double>(bytes) / static_cast<double>(MB) << " MB";
    } else if (bytes >= KB) {
        oss << static_cast<double>(bytes) / static_cast<double>(KB) << " KB";
    } else {
        oss << bytes << " bytes";
    }
    return oss.str();
}

/**
 * @brief Format transfer rate into human-readable string
 */
auto format_rate(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

/**
 * @brief Progress tracking state
 */
struct progress_tracker {
    std::chrono::steady_clock::time_point start_time = std::chrono::steady_clock::now();
    std::chrono::steady_clock::time_point last_update = start_time;
    uint64_t last_bytes = 0;
    double current_rate = 0.0;
};

void print_usage(const char* program) {
    std::cout << "Usage: " << program
              << " [options] <owner> <package> <version> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --domain <url>       Service URL (default: " << default_domain << ")"
              << std::endl;
    std::cout << "  -t, --token <token>      Authentication token" << std::endl;
    std::cout << "  -b, --basename <name>    Remote basename (default: local file name)"
              << std::endl;
    std::cout << "      --type <type>        Distribution type (e.g., conda, pypi)" << std::endl;
    std::cout << "      --description <text> Distribution description" << std::endl;
    std::cout << "      --md5 <hex>          Pre-computed MD5, skips hashing" << std::endl;
    std::cout << "  -h, --help               Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Environment:" << std::endl;
    std::cout << "  PACKAGE_CLIENT_DOMAIN, PACKAGE_CLIENT_TOKEN and" << std::endl;
    std::cout << "  PACKAGE_CLIENT_STORE_TIMEOUT_SECONDS override the defaults" << std::endl;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
    std::string domain;
    std::string token;
    std::string basename;
    upload_options options;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto next_value = [&](const char* flag) -> const char* {
            if (++i >= argc) {
                std::cerr << "Error: " << flag << " requires an argument" << std::endl;
                return nullptr;
            }
            return argv[i];
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--domain") {
            auto value = next_value("--domain");
            if (!value) return 1;
            domain = value;
        } else if (arg == "-t" || arg == "--token") {
            auto value = next_value("--token");
            if (!value) return 1;
            token = value;
        } else if (arg == "-b" || arg == "--basename") {
            auto value = next_value("--basename");
            if (!value) return 1;
            basename = value;
        } else if (arg == "--type") {
            auto value = next_value("--type");
            if (!value) return 1;
            options.distribution_type = value;
        } else if (arg == "--description") {
            auto value = next_value("--description");
            if (!value) return 1;
            options.description = value;
        } else if (arg == "--md5") {
            auto value = next_value("--md5");
            if (!value) return 1;
            options.md5 = value;
        } else if (arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return 1;
        }
    }

    if (positional.size() != 4) {
        std::cerr << "Error: owner, package, version and local_file are required" << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    std::filesystem::path local_path = positional[3];
    if (!std::filesystem::exists(local_path)) {
        std::cerr << "Error: Local file does not exist: " << local_path << std::endl;
        return 1;
    }
    if (basename.empty()) {
        basename = local_path.filename().string();
    }

    transfer_target target{positional[0], positional[1], positional[2], basename};
    auto file_size = std::filesystem::file_size(local_path);

    // Build the client; flags are applied first, environment variables win
    hub_client::builder builder;
    if (!domain.empty()) builder.with_domain(domain);
    if (!token.empty()) builder.with_token(token);
    auto client_result = builder.with_environment().build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }

    auto& client = client_result.value();
    if (!client.config().token) {
        std::cerr << "Error: A token is required for uploads (--token or PACKAGE_CLIENT_TOKEN)"
                  << std::endl;
        return 1;
    }

    client.on_version_warning([](const std::string& server, const std::string& local) {
        std::cerr << "[Warning] Server API version " << server
                  << " is newer than client version " << local << std::endl;
    });

    std::cout << "========================================" << std::endl;
    std::cout << "       Distribution Upload Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Service: " << client.config().domain << std::endl;
    std::cout << "  Target: " << target.to_string() << std::endl;
    std::cout << "  Local file: " << local_path.string() << std::endl;
    std::cout << "  File size: " << format_bytes(file_size) << std::endl;
    std::cout << std::endl;

    progress_tracker tracker;

    options.on_progress = [&tracker](const upload_progress& progress) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - tracker.last_update).count();

        if (elapsed >= 100) {
            auto bytes_delta = progress.bytes_sent - tracker.last_bytes;
            tracker.current_rate =
                static_cast<double>(bytes_delta) * 1000.0 / static_cast<double>(elapsed);
            tracker.last_bytes = progress.bytes_sent;
            tracker.last_update = now;
        }

        constexpr int bar_width = 30;
        int filled = static_cast<int>(progress.percentage() / 100.0 * bar_width);

        std::cout << "\r[";
        for (int i = 0; i < bar_width; ++i) {
            if (i < filled) std::cout << "=";
            else if (i == filled) std::cout << ">";
            else std::cout << " ";
        }
        std::cout << "] " << std::fixed << std::setprecision(1) << progress.percentage() << "%"
                  << " | " << format_bytes(progress.bytes_sent) << "/"
                  << format_bytes(progress.total_bytes)
                  << " | " << format_rate(tracker.current_rate)
                  << "     " << std::flush;

        if (progress.bytes_sent >= progress.total_bytes) {
            std::cout << std::endl;
        }
    };

    std::cout << "Uploading..." << std::endl;
    auto upload_result = client.upload_file(target, local_path, options);

    if (!upload_result.has_value()) {
        auto& err = upload_result.error();
        std::cerr << std::endl;
        std::cerr << "Upload failed: " << err.message << std::endl;
        std::cerr << "  Code: " << to_string(err.code) << std::endl;
        if (err.http_status != 0) {
            std::cerr << "  HTTP status: " << err.http_status << std::endl;
        }

        if (is_restart_required(err)) {
            std::cerr << "Hint: The storage grant is spent, run the upload again" << std::endl;
        } else if (err.code == error_code::conflict) {
            std::cerr << "Hint: This distribution already exists" << std::endl;
        } else if (err.code == error_code::unauthorized) {
            std::cerr << "Hint: Check the token and its scopes" << std::endl;
        } else if (err.code == error_code::not_found) {
            std::cerr << "Hint: Create the package and release first" << std::endl;
        }
        return 1;
    }

    auto total_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracker.start_time);

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "       Upload Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Status: SUCCESS" << std::endl;
    std::cout << "Bytes sent: " << format_bytes(file_size) << std::endl;
    std::cout << "Time elapsed: " << total_elapsed.count() << " ms" << std::endl;
    if (total_elapsed.count() > 0) {
        double avg_rate = static_cast<double>(file_size) * 1000.0 /
                          static_cast<double>(total_elapsed.count());
        std::cout << "Average rate: " << format_rate(avg_rate) << std::endl;
    }
    std::cout << "Distribution:" << std::endl;
    std::cout << upload_result.value().dump(2) << std::endl;

    return 0;
}
