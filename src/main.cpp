/**
 * Interlink - File transfer client
 *
 * Command line entry point. Queues uploads or downloads on the transfer
 * service, prints lifecycle events while they run and reports the outcome.
 */

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <filesystem>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "core/Cancellation.hpp"
#include "core/Config.hpp"
#include "core/EventBus.hpp"
#include "core/EventConsumer.hpp"
#include "core/Logger.hpp"
#include "core/storage/LocalCloudTransfer.hpp"
#include "services/TransferService.hpp"
#include "utils/PathUtils.hpp"
#include "utils/PlatformUtils.hpp"
#include "utils/StringUtils.hpp"

namespace fs = std::filesystem;

using interlink::core::Config;
using interlink::core::EventBus;
using interlink::core::EventType;
using interlink::core::Logger;
using interlink::core::LogLevel;
using interlink::core::transfer::parseTaskType;
using interlink::services::TransferRequest;
using interlink::services::TransferService;
using interlink::services::TransferServiceConfig;
using interlink::services::TransferType;
using interlink::utils::StringUtils;

namespace {

constexpr const char* Version = "1.0.0";

// Set from the signal handler, polled by the main loop
volatile std::sig_atomic_t g_interrupted = 0;

void signalHandler(int) {
    g_interrupted = 1;
}

/**
 * Setup signal handlers for graceful cancellation
 */
void setupSignalHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
#ifdef _WIN32
    std::signal(SIGBREAK, signalHandler);
#endif
}

struct Options {
    std::string command;
    TransferType type{TransferType::Upload};
    std::vector<std::string> targets;
    std::string dest;
    std::string configPath;
    std::string sourceLabel;
    std::string batchLabel;
    std::vector<std::string> tags;
    int maxConcurrent{0};
    bool debug{false};
    bool json{false};
};

void printUsage(const char* program) {
    std::cout << "Interlink - file transfer client\n"
              << "\nUsage: " << program << " [options] upload <file>...\n"
              << "       " << program << " [options] download <object-id>...\n"
              << "\nOptions:\n"
              << "  --dest <path>          Remote folder (upload) or local file/directory (download)\n"
              << "  --max-concurrent <n>   Concurrent transfers (default 5)\n"
              << "  --tag <tag>            Tag to apply after upload (repeatable)\n"
              << "  --label <label>        Source label shown with each transfer\n"
              << "  --batch <label>        Group the transfers under one batch\n"
              << "  --config <path>        Configuration file\n"
              << "  --json                 Print the final task list as JSON\n"
              << "  -d, --debug            Enable debug logging\n"
              << "  -h, --help             Show this help message\n"
              << "  -v, --version          Show version information\n"
              << std::endl;
}

/**
 * Load configuration; a missing file gets the defaults written to it
 */
bool loadConfiguration(const std::string& explicitPath) {
    auto& config = Config::instance();
    fs::path configPath = explicitPath.empty()
        ? interlink::utils::PathUtils::getConfigPath()
        : fs::path(explicitPath);

    try {
        if (fs::exists(configPath)) {
            if (!config.load(configPath.string())) {
                std::cerr << "Failed to load configuration from " << configPath.string() << std::endl;
                return false;
            }
        } else if (explicitPath.empty()) {
            config.setDefaults();
            config.save(configPath.string());
        } else {
            std::cerr << "Configuration file not found: " << configPath.string() << std::endl;
            return false;
        }
    } catch (const std::exception& e) {
        std::cerr << "Failed to load configuration: " << e.what() << std::endl;
        return false;
    }

    if (auto root = interlink::utils::PlatformUtils::getEnv("INTERLINK_STORAGE_ROOT")) {
        config.set("storage.root", *root);
    }
    return true;
}

/**
 * Print one transfer lifecycle event
 */
void printEvent(const interlink::core::Event& e) {
    switch (e.type()) {
        case EventType::TransferQueued:
        case EventType::TransferStarted:
        case EventType::TransferCompleted:
        case EventType::TransferFailed:
        case EventType::TransferCancelled: {
            const auto& t = static_cast<const interlink::core::TransferEvent&>(e);
            std::cout << "[" << interlink::core::toString(e.type()) << "] "
                      << t.taskType << " " << t.name;
            if (t.size > 0) {
                std::cout << " (" << StringUtils::formatBytes(t.size) << ")";
            }
            if (t.error) {
                std::cout << ": " << *t.error;
            }
            std::cout << std::endl;
            break;
        }
        case EventType::TransferProgress: {
            const auto& t = static_cast<const interlink::core::TransferEvent&>(e);
            std::cout << "  " << t.name << " " << StringUtils::formatPercentage(t.progress)
                      << " " << StringUtils::formatBytes(static_cast<int64_t>(t.speed)) << "/s"
                      << std::endl;
            break;
        }
        case EventType::BatchProgress: {
            const auto& b = static_cast<const interlink::core::BatchProgressEvent&>(e);
            std::cout << "[batch] " << b.label << ": " << b.completed << "/" << b.total
                      << " done, " << b.failed << " failed, "
                      << StringUtils::formatPercentage(b.progress) << std::endl;
            break;
        }
        case EventType::Complete: {
            const auto& c = static_cast<const interlink::core::CompleteEvent&>(e);
            std::cout << "[complete] " << c.successJobs << "/" << c.totalJobs << " succeeded, "
                      << c.failedJobs << " failed" << std::endl;
            break;
        }
        default:
            break;
    }
}

std::string generateBatchId() {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    return "batch-" + std::to_string(nanos);
}

std::vector<TransferRequest> buildRequests(const Options& options) {
    TransferType type = options.type;
    std::string batchId = options.batchLabel.empty() ? "" : generateBatchId();

    std::vector<TransferRequest> requests;
    for (const auto& target : options.targets) {
        TransferRequest request;
        request.type = type;
        request.source = target;
        request.sourceLabel = options.sourceLabel;
        request.batchId = batchId;
        request.batchLabel = options.batchLabel;

        if (type == TransferType::Upload) {
            request.dest = options.dest;
            request.tags = options.tags;
            std::error_code ec;
            auto size = fs::file_size(target, ec);
            request.size = ec ? 0 : static_cast<int64_t>(size);
        } else {
            request.dest = options.dest.empty() ? "." : options.dest;
            request.name = fs::path(target).filename().string();
        }
        requests.push_back(std::move(request));
    }
    return requests;
}

} // namespace

/**
 * Main application entry point
 */
int main(int argc, char* argv[]) {
    Options options;

    // Parse command line arguments
    for (int i = 1; i < argc; ++i) {
        std::string arg(argv[i]);
        auto next = [&](const char* name) -> std::string {
            if (i + 1 >= argc) {
                std::cerr << "Missing value for " << name << std::endl;
                std::exit(2);
            }
            return argv[++i];
        };

        if (arg == "--debug" || arg == "-d") {
            options.debug = true;
        } else if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version" || arg == "-v") {
            std::cout << "Interlink v" << Version << std::endl;
            return 0;
        } else if (arg == "--dest") {
            options.dest = next("--dest");
        } else if (arg == "--max-concurrent") {
            options.maxConcurrent = StringUtils::parseInt(next("--max-concurrent"), 0);
            if (options.maxConcurrent <= 0) {
                std::cerr << "--max-concurrent must be a positive number" << std::endl;
                return 2;
            }
        } else if (arg == "--tag") {
            options.tags.push_back(next("--tag"));
        } else if (arg == "--label") {
            options.sourceLabel = next("--label");
        } else if (arg == "--batch") {
            options.batchLabel = next("--batch");
        } else if (arg == "--config") {
            options.configPath = next("--config");
        } else if (arg == "--json") {
            options.json = true;
        } else if (options.command.empty()) {
            options.command = arg;
        } else {
            options.targets.push_back(arg);
        }
    }

    auto type = parseTaskType(options.command);
    if (!type) {
        printUsage(argv[0]);
        return 2;
    }
    options.type = *type;
    if (options.targets.empty()) {
        std::cerr << "Nothing to " << options.command << std::endl;
        return 2;
    }

    if (!loadConfiguration(options.configPath)) {
        return 1;
    }
    auto& config = Config::instance();

    // Initialize logger
    LogLevel level = options.debug
        ? LogLevel::Debug
        : Logger::parseLevel(config.get<std::string>("logging.level", "info"));
    Logger::instance().initialize(level, config.get<std::string>("logging.directory", ""));

    auto& logger = Logger::instance();
    logger.info("Interlink v{} starting", Version);

    setupSignalHandlers();

    try {
        auto serviceConfig = TransferServiceConfig::fromConfig(config);
        if (options.maxConcurrent > 0) {
            serviceConfig.maxConcurrent = static_cast<size_t>(options.maxConcurrent);
        }

        auto storageRoot = config.get<std::string>("storage.root", "");
        if (storageRoot.empty()) {
            storageRoot = interlink::utils::PathUtils::getStoragePath().string();
        }
        auto client = std::make_shared<interlink::core::storage::LocalCloudTransfer>(storageRoot);
        logger.info("Object store: {}", storageRoot);

        auto bus = std::make_shared<EventBus>(config.get<size_t>("eventBus.bufferSize", EventBus::DefaultBufferSize));

        int exitCode = 0;
        {
            // Declared first so the service's last events are printed
            interlink::core::EventConsumer printer(bus, printEvent);
            TransferService service(bus, serviceConfig, client);
            interlink::core::CancellationSource root;

            service.startTransfers(root.token(), buildRequests(options));

            auto done = std::async(std::launch::async, [&service] { service.waitForAll(); });
            bool cancelled = false;
            while (done.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
                if (g_interrupted && !cancelled) {
                    logger.warn("Interrupted, cancelling transfers");
                    root.cancel();
                    service.cancelAll();
                    cancelled = true;
                }
            }
            done.get();

            auto stats = service.getStats();
            std::cout << "\n" << stats.completed << " completed, " << stats.failed << " failed, "
                      << stats.cancelled << " cancelled (" << stats.total() << " total)" << std::endl;

            if (options.json) {
                nlohmann::json tasks = service.getTasks();
                std::cout << tasks.dump(2) << std::endl;
            }

            if (stats.failed > 0 || stats.cancelled > 0) {
                exitCode = 1;
            }
        }

        logger.info("Interlink finished with code {}", exitCode);
        logger.flush();
        return exitCode;

    } catch (const std::exception& e) {
        logger.critical("Unhandled exception: {}", e.what());
        return 1;
    }
}
