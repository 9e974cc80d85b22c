#include <cstdlib>
#include <iostream>
#include <list>
#include <string>
#include <vector>

#include "document_processor.hpp"
#include "http_server.hpp"
#include "logging.hpp"
#include "outline_json.hpp"
#include "pdf_utils.hpp"

static int print_usage() {
    std::cerr << "Usage:\n";
    std::cerr << "  pdf_splitter extract <pdf> <output.json> [start_page] [options]\n";
    std::cerr << "  pdf_splitter serve <address> <port> <number_of_workers> [options]\n";
    std::cerr << "  For IPv4, try:\n";
    std::cerr << "    pdf_splitter serve 0.0.0.0 8080 4\n";
    std::cerr << "Options:\n";
    std::cerr << "  --from-cursor        search each heading after the previous one only\n";
    std::cerr << "  --skip-unmatched     do not search children of an unmatched heading\n";
    std::cerr << "  --marker <word>      chapter marker word, default " << PDF_SPLITTER_CHAPTER_MARKER << "\n";
    std::cerr << "  --warnings <path>    write the diagnostics as json\n";
    std::cerr << "  --log-level <level>  trace, debug, info, warning, error, fatal\n";
    std::cerr << "  --log-file           also log to a rotating file\n";
    return EXIT_FAILURE;
}

int main(int argc, char* argv[]) {
    std::vector<std::string> positional;
    Processor_Options options;
    Log_Sink_Config log_config;
    std::string warnings_path;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--from-cursor") {
            options.splitter.search_mode = Search_Mode::FROM_CURSOR;
        } else if (arg == "--skip-unmatched") {
            options.splitter.skip_children_of_unmatched = true;
        } else if (arg == "--marker" && i + 1 < argc) {
            options.outline.chapter_marker = argv[++i];
            options.splitter.chapter_marker = options.outline.chapter_marker;
        } else if (arg == "--warnings" && i + 1 < argc) {
            warnings_path = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            if (!parse_severity(argv[++i], log_config.threshold)) {
                std::cerr << "Unknown log level: " << argv[i] << "\n";
                return print_usage();
            }
        } else if (arg == "--log-file") {
            log_config.file = true;
        } else if (arg.compare(0, 2, "--") == 0) {
            std::cerr << "Unknown option: " << arg << "\n";
            return print_usage();
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        return print_usage();
    }
    configure_log_sinks(log_config);

    try {
        if (positional[0] == "extract" && (positional.size() == 3 || positional.size() == 4)) {
            if (positional.size() == 4) {
                options.start_page = std::stoi(positional[3]);
            }

            std::optional<Processed_Document> document = process_pdf_file(positional[1], options);
            if (!document) {
                LOG_CHANNEL_ERROR(LOG_CHANNEL_MAIN) << "Cannot read " << positional[1];
                return EXIT_FAILURE;
            }

            save_json(outline_to_json(document->outline), positional[2]);
            if (!warnings_path.empty()) {
                save_json(warnings_to_json(document->warnings), warnings_path);
            }
            std::cout << document->outline.chapters.size() << " chapters, "
                      << document->warnings.size() << " warnings" << std::endl;
            return EXIT_SUCCESS;
        }

        if (positional[0] == "serve" && positional.size() == 4) {
            auto const address = boost::asio::ip::make_address(positional[1]);
            unsigned short port = static_cast<unsigned short>(std::stoi(positional[2]));
            int num_workers = std::stoi(positional[3]);

            // assume that ioc is accessed from single thread
            boost::asio::io_context ioc{1};
            boost::asio::ip::tcp::acceptor acceptor{ioc, {address, port}};

            std::list<http_worker> workers;
            for (int i = 0; i < num_workers; ++i) {
                workers.emplace_back(acceptor, options);
                workers.back().start();
            }

            LOG_CHANNEL_INFO(LOG_CHANNEL_MAIN) << "Listening on " << address << ":" << port << " with " << num_workers << " workers";
            ioc.run();

            LOG_CHANNEL_INFO(LOG_CHANNEL_MAIN) << "Server stopped";
            return EXIT_SUCCESS;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return print_usage();
}
