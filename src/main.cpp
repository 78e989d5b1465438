#include "async_http_executor.hpp"
#include "errors.hpp"
#include "page_codec.hpp"
#include "page_fetcher.hpp"
#include "sync_iterator.hpp"
#include "transfer_filters.hpp"
#include "transfer_registry.hpp"
#include "transfer_store.hpp"
#include "util.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <future>
#include <iomanip>
#include <iostream>
#include <memory>
#include <string>

struct Config {
    std::string endpoint      = "http://localhost:10000/container?restype=container&comp=list";
    std::string itemsPath     = "items";
    std::string tokenPath     = "continuationToken";
    std::string tokenParam    = "continuationToken";
    std::string stateFile     = "transfers.json";
    blob_sync::HttpHeaders headers;
    int         limit         = 100;
    int         timeoutMs     = 5000;
    bool        listTransfers = false;
    bool        verbose       = false;
};

static void printUsage() {
    std::cout
        << "Usage: blob_sync [options]\n\n"
        << "Options:\n"
        << "  --endpoint URL      First page URL\n"
        << "  --items-path P      Dot path to the item array   (default: items)\n"
        << "  --token-path P      Dot path to the token        (default: continuationToken)\n"
        << "  --token-param NAME  Query parameter for the token (default: continuationToken)\n"
        << "  --header K:V        Extra request header (repeatable)\n"
        << "  --limit N           Stop after N items            (default: 100)\n"
        << "  --timeout-ms N      HTTP timeout in ms            (default: 5000)\n"
        << "  --state-file PATH   Transfer state file           (default: transfers.json)\n"
        << "  --list-transfers    Print persisted transfers and exit\n"
        << "  --verbose           Enable verbose diagnostics\n"
        << "  --help, -h          Show this message\n";
}

static Config parseArgs(int argc, char* argv[]) {
    Config cfg;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if ((arg == "--endpoint") && i + 1 < argc) {
            cfg.endpoint = argv[++i];
        } else if ((arg == "--items-path") && i + 1 < argc) {
            cfg.itemsPath = argv[++i];
        } else if ((arg == "--token-path") && i + 1 < argc) {
            cfg.tokenPath = argv[++i];
        } else if ((arg == "--token-param") && i + 1 < argc) {
            cfg.tokenParam = argv[++i];
        } else if ((arg == "--header") && i + 1 < argc) {
            std::string header = argv[++i];
            auto colon = header.find(':');
            if (colon == std::string::npos || colon == 0) {
                std::cerr << "Malformed header (expected K:V): " << header << "\n";
                std::exit(1);
            }
            cfg.headers[header.substr(0, colon)] = header.substr(colon + 1);
        } else if ((arg == "--limit") && i + 1 < argc) {
            cfg.limit = std::stoi(argv[++i]);
        } else if ((arg == "--timeout-ms") && i + 1 < argc) {
            cfg.timeoutMs = std::stoi(argv[++i]);
        } else if ((arg == "--state-file") && i + 1 < argc) {
            cfg.stateFile = argv[++i];
        } else if (arg == "--list-transfers") {
            cfg.listTransfers = true;
        } else if (arg == "--verbose") {
            cfg.verbose = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage();
            std::exit(0);
        } else {
            std::cerr << "Unknown argument: " << arg << "\n\n";
            printUsage();
            std::exit(1);
        }
    }
    return cfg;
}

static int listTransfers(const Config& cfg) {
    auto store = std::make_shared<blob_sync::JsonFileTransferStore>(cfg.stateFile, cfg.verbose);
    blob_sync::TransferRegistry registry(store, nullptr, nullptr, cfg.verbose);
    registry.loadContext();

    const auto all = registry.transfers();
    std::cout << "--- Transfers (" << all.size() << ") ---\n";
    for (const auto& t : all) {
        std::cout << std::left << std::setw(38) << t.id << "  "
                  << std::setw(9) << blob_sync::toString(t.kind) << "  "
                  << std::setw(11) << blob_sync::toString(t.state);
        if (t.progress) {
            std::cout << "  " << t.progress->bytesTransferred;
            if (t.progress->totalBytes) std::cout << "/" << *t.progress->totalBytes;
            std::cout << " bytes";
        }
        std::cout << "\n";
    }

    std::cout
        << "\nUploads:   " << blob_sync::ofKind(all, blob_sync::TransferKind::Upload).size()
        << "\nDownloads: " << blob_sync::ofKind(all, blob_sync::TransferKind::Download).size()
        << "\nCopies:    " << blob_sync::ofKind(all, blob_sync::TransferKind::Copy).size()
        << "\n";
    return 0;
}

static int listItems(const Config& cfg) {
    blob_sync::HttpClientOptions httpOptions;
    httpOptions.timeoutMs = cfg.timeoutMs;
    auto executor = std::make_shared<blob_sync::AsyncHttpExecutor>(
        httpOptions, /*maxAttempts=*/6, /*threads=*/1, cfg.verbose);

    blob_sync::HttpRequest request;
    request.url     = cfg.endpoint;
    request.headers = cfg.headers;
    request.headers.emplace("Accept", "application/json");

    // Initial request; follow-up pages go through the fetcher.
    std::promise<blob_sync::TransportResult> first;
    auto firstResult = first.get_future();
    executor->execute(request, {}, [&first](blob_sync::TransportResult r) {
        first.set_value(std::move(r));
    });
    auto result = firstResult.get();
    if (!result.ok()) {
        std::cerr << "Initial request failed: " << result.error << "\n";
        return 1;
    }
    if (result.response->httpStatus != 200) {
        std::cerr << "Initial request returned HTTP " << result.response->httpStatus << "\n";
        return 1;
    }

    auto fetcher = blob_sync::PageFetcher<>::create(
        executor,
        blob_sync::queryParameterUrlBuilder(cfg.tokenParam),
        blob_sync::PageCodec(cfg.itemsPath, cfg.tokenPath),
        nullptr,
        cfg.verbose);
    fetcher->initialize(request, result.response->body);

    blob_sync::SyncIteratorAdapter<> items(fetcher);
    int shown = 0;
    for (const auto& item : items) {
        std::cout << std::setw(4) << (shown + 1) << "  " << item.dump() << "\n";
        if (++shown >= cfg.limit) break;
    }

    const auto stats = fetcher->getStats();
    const auto http  = executor->getStats();
    std::cout
        << "\n=== Summary Report ===\n"
        << "Items shown:         " << shown                  << "\n"
        << "Items fetched:       " << stats.itemsFetched     << "\n"
        << "Pages fetched:       " << stats.pagesFetched     << "\n"
        << "Failed requests:     " << stats.failedRequests   << "\n"
        << "HTTP requests:       " << http.totalRequests     << "\n"
        << "HTTP retries:        " << http.totalRetries      << "\n"
        << "Exhausted:           " << (fetcher->isExhausted() ? "yes" : "no") << "\n"
        << "======================\n";
    return 0;
}

int main(int argc, char* argv[]) {
    try {
        Config cfg = parseArgs(argc, argv);

        std::cout
            << "=== blob_sync ===\n"
            << "Endpoint:    " << cfg.endpoint  << "\n"
            << "Items path:  " << cfg.itemsPath << "\n"
            << "Token path:  " << cfg.tokenPath << "\n"
            << "State file:  " << cfg.stateFile << "\n"
            << "Verbose:     " << (cfg.verbose ? "yes" : "no") << "\n"
            << "=================\n\n";

        return cfg.listTransfers ? listTransfers(cfg) : listItems(cfg);

    } catch (const blob_sync::PagingError& e) {
        std::cerr << "Paging error (" << blob_sync::toString(e.kind()) << "): "
                  << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << "\n";
        return 1;
    }
}
