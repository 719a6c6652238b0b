#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <streamfetch/stream.hpp>
#include <streamfetch/util/logger.hpp>

using namespace streamfetch;

// Helper to format bytes
std::string format_bytes(std::uint64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB"};
    int unit = 0;
    double size = static_cast<double>(bytes);
    while (size >= 1024 && unit < 3) {
        size /= 1024;
        unit++;
    }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << size << " " << units[unit];
    return oss.str();
}

// Helper to draw progress bar
void draw_progress(std::uint64_t downloaded, std::uint64_t total) {
    const int bar_width = 40;
    float progress = total > 0 ? static_cast<float>(downloaded) / total : 0;
    int filled = static_cast<int>(bar_width * progress);

    std::cout << "\r[";
    for (int i = 0; i < bar_width; ++i) {
        if (i < filled) std::cout << "=";
        else if (i == filled) std::cout << ">";
        else std::cout << " ";
    }
    std::cout << "] " << std::setw(3) << static_cast<int>(progress * 100) << "% "
              << format_bytes(downloaded);
    if (total > 0) {
        std::cout << " / " << format_bytes(total);
    }
    std::cout << std::flush;
}

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <url> <output file> [window size]" << std::endl;
        return 1;
    }

    std::string url = argv[1];
    std::string output = argv[2];

    stream::stream_options options;
    if (argc > 3) {
        options.window_size = std::stoull(argv[3]);
    }

    logging::enable();
    logging::set_log_level(spdlog::level::warn);

    auto transport = std::make_shared<http::asio_transport>();
    transport->timeout(std::chrono::seconds(30));
    http::client client(transport);

    stream::size_cache cache;
    stream::size_resolver resolver(client, cache);

    std::cout << "Range Download Example\n" << std::endl;

    try {
        // the total is only needed for the progress bar
        std::uint64_t total = 0;
        try {
            total = resolver.filesize(url);
        } catch (const header_not_found& e) {
            LOG_WARNING("total size unknown: {}", e.what());
        }

        std::ofstream file(output, std::ios::binary);
        if (!file) {
            std::cerr << "Cannot open " << output << std::endl;
            return 1;
        }

        stream::range_stream download(client, url, options);
        while (auto chunk = download.next()) {
            file.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));
            draw_progress(download.downloaded(), total ? total : download.total_size());
        }
        std::cout << std::endl;

        std::cout << "Download completed!" << std::endl;
        std::cout << "  Bytes: " << format_bytes(download.downloaded()) << std::endl;
        std::cout << "  Requests: " << download.requests_issued() << std::endl;
        std::cout << "  File: " << output << std::endl;
    } catch (const error& e) {
        std::cout << std::endl;
        std::cerr << "Download failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
