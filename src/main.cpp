#include "splitfetch/config.hpp"
#include "splitfetch/curl_http_client.hpp"
#include "splitfetch/download_coordinator.hpp"
#include "splitfetch/download_event.hpp"

#include <cstddef>
#include <exception>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-c <concurrency>] [-p <max-parallel>] [-s <scratch-root>] [-q | -v] <url> <output>"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -c <concurrency>   Number of byte ranges fetched in parallel (default: "
              << splitfetch::kDefaultConcurrency << ")\n"
              << "  -p <max-parallel>  Cap on simultaneous connections, 0 for none (default: 0)\n"
              << "  -s <scratch-root>  Directory for temporary pieces (default: system temp directory)\n"
              << "  -q                 Log warnings and errors only\n"
              << "  -v                 Verbose logging\n"
              << "  -h, --help         Show this message" << std::endl;
}

long parseNumber(const std::string& option, const char* value) {
    try {
        std::size_t consumed = 0;
        const long number = std::stol(value, &consumed);
        if (consumed != std::string(value).size()) {
            throw std::invalid_argument(value);
        }
        return number;
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + std::string(value));
    }
}
} // namespace

int main(int argc, char** argv) {
    try {
        splitfetch::DownloadOptions options;
        auto level = spdlog::level::info;
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-c" || option == "-p" || option == "-s") {
                if (arg_index + 1 >= argc) {
                    printUsage(argv[0]);
                    return 1;
                }

                const char* value = argv[arg_index + 1];
                if (option == "-c") {
                    const long concurrency = parseNumber(option, value);
                    if (concurrency <= 0 || concurrency > 4096) {
                        throw std::runtime_error("Concurrency must be between 1 and 4096.");
                    }
                    options.concurrency = static_cast<int>(concurrency);
                } else if (option == "-p") {
                    const long cap = parseNumber(option, value);
                    if (cap < 0) {
                        throw std::runtime_error("Max parallel must not be negative.");
                    }
                    options.max_parallel = static_cast<std::size_t>(cap);
                } else {
                    options.scratch_root = value;
                }
                arg_index += 2;
            } else if (option == "-q") {
                level = spdlog::level::warn;
                ++arg_index;
            } else if (option == "-v") {
                level = spdlog::level::debug;
                ++arg_index;
            } else if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            } else {
                printUsage(argv[0]);
                return 1;
            }
        }

        if (argc - arg_index != 2) {
            printUsage(argv[0]);
            return 1;
        }
        options.url = argv[arg_index];
        options.destination = argv[arg_index + 1];

        auto logger = spdlog::stdout_color_mt("splitfetch");
        logger->set_level(level);
        logger->set_pattern("%Y/%m/%d %H:%M:%S %^%l%$ %v");
        logger->debug("splitfetch {} with {} workers, max parallel {}",
                      splitfetch::kVersion, options.concurrency, options.max_parallel);

        splitfetch::DownloadCoordinator coordinator(
            options,
            std::make_shared<splitfetch::CurlHttpClient>(),
            splitfetch::makeLoggingSink(logger)
        );
        coordinator.download();

    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
