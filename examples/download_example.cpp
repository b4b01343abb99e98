/**
 * @file download_example.cpp
 * @brief Conditional distribution download example with verification
 *
 * This example demonstrates:
 * - Sending the MD5 of an existing local copy as a cache validator
 * - Handling the not-modified and redirected outcomes
 * - Streaming the content to a file with progress callbacks
 * - Verifying the saved file against the distribution metadata
 */

#include <kcenon/package_client/package_client.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace kcenon::package_client;

namespace {

/**
 * @brief Format bytes into human-readable string
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
 * @brief Format transfer rate
 */
auto format_rate(double bytes_per_second) -> std::string {
    return format_bytes(static_cast<uint64_t>(bytes_per_second)) + "/s";
}

struct progress_tracker {
    std::chrono::steady_clock::time_point start_time;
    uint64_t last_bytes = 0;
    std::chrono::steady_clock::time_point last_update;
    double current_rate = 0.0;

    progress_tracker()
        : start_time(std::chrono::steady_clock::now())
        , last_update(start_time) {}
};

/**
 * @brief MD5 of an existing local copy, used as the ETag validator
 */
auto local_digest(const std::filesystem::path& path) -> std::optional<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::nullopt;
    }

    content_hasher hasher;
    auto digest = hasher.hash(file);
    if (!digest.has_value()) {
        std::cerr << "Warning: Could not hash " << path.string() << ": "
                  << digest.error().message << std::endl;
        return std::nullopt;
    }
    return digest.value().hex;
}

}  // namespace

void print_usage(const char* program) {
    std::cout << "Download Example - Package Client" << std::endl;
    std::cout << std::endl;
    std::cout << "Usage: " << program
              << " [options] <owner> <package> <version> <basename> <local_file>" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -d, --domain <url>      Service URL (default: " << default_domain << ")"
              << std::endl;
    std::cout << "  -t, --token <token>     Authentication token" << std::endl;
    std::cout << "  --md5 <hex>             Known MD5 to send instead of hashing local_file"
              << std::endl;
    std::cout << "  --force                 Download even if local_file is current" << std::endl;
    std::cout << "  --no-verify             Skip checking the MD5 against the service"
              << std::endl;
    std::cout << "  --help                  Show this help message" << std::endl;
    std::cout << std::endl;
    std::cout << "Examples:" << std::endl;
    std::cout << "  " << program << " conda-forge zlib 1.3 linux-64/zlib-1.3-0.tar.bz2 zlib.tar.bz2"
              << std::endl;
    std::cout << "  " << program << " --force -d http://localhost:8080 me pkg 1.0 pkg.whl ./pkg.whl"
              << std::endl;
}

int main(int argc, char* argv[]) {
    std::string domain;
    std::string token;
    std::optional<std::string> known_md5;
    bool force = false;
    bool verify_hash = true;
    std::vector<std::string> positional;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "-d" || arg == "--domain") {
            if (++i >= argc) {
                std::cerr << "Error: --domain requires an argument" << std::endl;
                return 1;
            }
            domain = argv[i];
        } else if (arg == "-t" || arg == "--token") {
            if (++i >= argc) {
                std::cerr << "Error: --token requires an argument" << std::endl;
                return 1;
            }
            token = argv[i];
        } else if (arg == "--md5") {
            if (++i >= argc) {
                std::cerr << "Error: --md5 requires an argument" << std::endl;
                return 1;
            }
            known_md5 = argv[i];
        } else if (arg == "--force") {
            force = true;
        } else if (arg == "--no-verify") {
            verify_hash = false;
        } else if (arg[0] != '-') {
            positional.push_back(arg);
        } else {
            std::cerr << "Error: Unknown option " << arg << std::endl;
            return 1;
        }
    }

    if (positional.size() != 5) {
        std::cerr << "Error: owner, package, version, basename and local_file are required"
                  << std::endl;
        print_usage(argv[0]);
        return 1;
    }

    transfer_target target{positional[0], positional[1], positional[2], positional[3]};
    std::filesystem::path local_path = positional[4];

    if (!known_md5 && !force && std::filesystem::exists(local_path)) {
        known_md5 = local_digest(local_path);
    }

    hub_client::builder builder;
    if (!domain.empty()) builder.with_domain(domain);
    if (!token.empty()) builder.with_token(token);
    auto client_result = builder.with_environment().build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }

    auto& client = client_result.value();

    std::cout << "========================================" << std::endl;
    std::cout << "       Distribution Download Example" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;
    std::cout << "Configuration:" << std::endl;
    std::cout << "  Service: " << client.config().domain << std::endl;
    std::cout << "  Target: " << target.to_string() << std::endl;
    std::cout << "  Local file: " << local_path.string() << std::endl;
    std::cout << "  Validator: " << known_md5.value_or("(none)") << std::endl;
    std::cout << "  Verify hash: " << (verify_hash ? "yes" : "no") << std::endl;
    std::cout << std::endl;

    std::cout << "[1/3] Requesting distribution..." << std::endl;
    auto outcome = client.download(target, known_md5);
    if (!outcome.has_value()) {
        auto& err = outcome.error();
        std::cerr << "Download request failed: " << err.message << std::endl;
        if (err.code == error_code::not_found) {
            std::cerr << "Hint: Check owner, package, version and basename" << std::endl;
        } else if (err.code == error_code::unauthorized) {
            std::cerr << "Hint: Private packages need a token" << std::endl;
        }
        return 1;
    }

    if (outcome.value().is_not_modified()) {
        std::cout << "Local file is up to date, nothing to download." << std::endl;
        return 0;
    }

    std::cout << "  Content location: " << outcome.value().location() << std::endl;
    std::cout << std::endl;

    std::cout << "[2/3] Downloading content..." << std::endl;
    progress_tracker tracker;

    stream_options options;
    options.on_progress = [&tracker](uint64_t bytes_received) {
        auto now = std::chrono::steady_clock::now();
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - tracker.last_update).count();
        if (elapsed < 100) {
            return;
        }
        tracker.current_rate = static_cast<double>(bytes_received - tracker.last_bytes) *
                               1000.0 / static_cast<double>(elapsed);
        tracker.last_bytes = bytes_received;
        tracker.last_update = now;

        std::cout << "\r  " << format_bytes(bytes_received)
                  << " | " << format_rate(tracker.current_rate)
                  << "     " << std::flush;
    };

    auto saved = outcome.value().stream()->save_to(local_path, options);
    std::cout << std::endl;
    if (!saved.has_value()) {
        std::cerr << "Download failed: " << saved.error().message << std::endl;
        if (saved.error().http_status != 0) {
            std::cerr << "  HTTP status: " << saved.error().http_status << std::endl;
        }
        return 1;
    }

    auto& digest = saved.value();
    auto total_elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - tracker.start_time);

    std::cout << "[3/3] Verifying..." << std::endl;
    if (verify_hash) {
        auto dist = client.api().distribution(target);
        if (!dist.has_value()) {
            std::cerr << "Could not fetch distribution metadata: " << dist.error().message
                      << std::endl;
            return 1;
        }
        std::string expected;
        if (dist.value().is_object() && dist.value().contains("md5") &&
            dist.value()["md5"].is_string()) {
            expected = dist.value()["md5"].get<std::string>();
        }
        if (!expected.empty() && expected != digest.hex) {
            std::cerr << "Verification failed: MD5 mismatch" << std::endl;
            std::cerr << "  Expected: " << expected << std::endl;
            std::cerr << "  Actual: " << digest.hex << std::endl;
            return 1;
        }
        std::cout << "  MD5 matches the service record" << std::endl;
    } else {
        std::cout << "  Skipped" << std::endl;
    }

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "       Download Summary" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Status: SUCCESS" << std::endl;
    std::cout << "Saved to: " << local_path.string() << std::endl;
    std::cout << "Size: " << format_bytes(digest.size) << std::endl;
    std::cout << "MD5: " << digest.hex << std::endl;
    std::cout << "Time elapsed: " << total_elapsed.count() << " ms" << std::endl;
    if (total_elapsed.count() > 0) {
        double avg_rate = static_cast<double>(digest.size) * 1000.0 /
                          static_cast<double>(total_elapsed.count());
        std::cout << "Average rate: " << format_rate(avg_rate) << std::endl;
    }

    return 0;
}
