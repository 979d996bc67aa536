#include "rangeget/curl_http_client.hpp"
#include "rangeget/downloader.hpp"
#include "rangeget/error.hpp"
#include "rangeget/link_resolver.hpp"
#include "rangeget/output_file.hpp"
#include "rangeget/range_planner.hpp"
#include "rangeget/terminal_progress.hpp"

#include <cstddef>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <system_error>

namespace {
void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName
              << " [-d <directory>] [-t <threads>] [-s <segments>] [-r <retries>] <url1> <file1> [<url2> <file2> ...]"
              << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>   Set download directory (default: current directory)\n"
              << "  -t <threads>     Concurrent segment downloads per file (default: 8)\n"
              << "  -s <segments>    Number of byte ranges per file (default: 8)\n"
              << "  -r <retries>     Transient failures tolerated per segment (default: 3)\n"
              << "  -h, --help       Show this message" << std::endl;
}

int parsePositive(const std::string& option, const char* value) {
    int parsed = 0;
    try {
        parsed = std::stoi(value);
    } catch (const std::exception&) {
        throw std::runtime_error("Invalid value for " + option + ": " + value);
    }
    if (parsed <= 0 || parsed > 64) {
        throw std::runtime_error("Value for " + option + " must be between 1 and 64.");
    }
    return parsed;
}
} // namespace

int main(int argc, char** argv) {
    try {
        rangeget::DownloaderOptions options;
        std::size_t segments = 8;
        std::filesystem::path download_dir = std::filesystem::current_path();   // 默认下载路径为当前路径下
        int arg_index = 1;

        while (arg_index < argc && argv[arg_index][0] == '-') {
            const std::string option = argv[arg_index];

            if (option == "-h" || option == "--help") {
                printUsage(argv[0]);
                return 0;
            }
            if (option != "-d" && option != "-t" && option != "-s" && option != "-r") {
                printUsage(argv[0]);
                return 1;
            }
            if (arg_index + 1 >= argc) {
                printUsage(argv[0]);
                return 1;
            }

            const char* value = argv[arg_index + 1];
            if (option == "-d") {
                download_dir = value;
                std::error_code ec;
                std::filesystem::create_directories(download_dir, ec);
                if (ec) {
                    throw std::runtime_error("Failed to create download directory: "
                         + download_dir.string() + " - " + ec.message());
                }
            } else if (option == "-t") {
                options.max_workers = static_cast<std::size_t>(parsePositive(option, value));
            } else if (option == "-s") {
                segments = static_cast<std::size_t>(parsePositive(option, value));
            } else {
                // 由 Downloader 负责校验
                options.retries = value;
            }
            arg_index += 2;
        }

        if (argc - arg_index < 2 || (argc - arg_index) % 2 != 0) {
            printUsage(argv[0]);
            return 1;
        }

        rangeget::CurlHttpClient client;
        const rangeget::SegmentCountPlanner planner{segments};

        for (int i = arg_index; i < argc; i += 2) {
            const std::filesystem::path destination = download_dir / argv[i + 1];
            auto output = rangeget::OutputFile::create(destination.string());
            rangeget::StaticLinkResolver resolver{argv[i]};
            rangeget::TerminalProgress progress{std::cout, destination.string()};

            rangeget::Downloader downloader{client, planner, progress, options};
            downloader.get(output, resolver, std::cerr);
            output.close();
        }
    } catch (const rangeget::DownloadError& ex) {
        std::cerr << "Download failed (" << rangeget::toString(ex.kind()) << "): " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
