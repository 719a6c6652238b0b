#include <fstream>
#include <iostream>
#include <iomanip>
#include <sstream>
#include <streamfetch/stream.hpp>
#include <streamfetch/util/logger.hpp>

using namespace streamfetch;

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <segmented url> <output file>" << std::endl;
        return 1;
    }

    std::string url = argv[1];
    std::string output = argv[2];

    logging::enable();
    logging::set_log_level(spdlog::level::info);

    auto transport = std::make_shared<http::asio_transport>();
    http::client client(transport);

    stream::size_cache cache;
    stream::size_resolver resolver(client, cache);

    std::cout << "Segmented Download Example\n" << std::endl;

    try {
        auto total = resolver.seq_filesize(url);
        std::cout << "Total size: " << total << " bytes" << std::endl;

        std::ofstream file(output, std::ios::binary);
        if (!file) {
            std::cerr << "Cannot open " << output << std::endl;
            return 1;
        }

        stream::sequential_stream download(client, url);
        std::uint64_t last_segment = 0;
        while (auto chunk = download.next()) {
            file.write(chunk->data(), static_cast<std::streamsize>(chunk->size()));

            if (download.sequence_number() != last_segment) {
                last_segment = download.sequence_number();
                std::cout << "  Segment " << last_segment << "/" << download.segment_count().value_or(0)
                          << " (" << std::fixed << std::setprecision(1)
                          << (total ? 100.0 * download.downloaded() / total : 0.0) << "%)" << std::endl;
            }
        }

        std::cout << "\nDownload completed!" << std::endl;
        std::cout << "  Bytes: " << download.downloaded() << std::endl;
        std::cout << "  Segments: " << download.segments_started() << std::endl;
        std::cout << "  File: " << output << std::endl;
    } catch (const segment_header_not_found& e) {
        std::cerr << "Not a segmented resource: " << e.what() << std::endl;
        return 1;
    } catch (const error& e) {
        std::cerr << "Download failed: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
