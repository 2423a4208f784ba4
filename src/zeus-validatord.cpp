// ZEUS Validator Daemon - Main Entry Point
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// zeus-validatord challenges the configured miners every round, verifies
// and scores their proofs, and exports consensus weights once per epoch.
//
// Miners are listed as repeated entries in zeus.conf:
//   [validator]
//   miner=alice@10.0.0.5:8091
//   miner=bob@10.0.0.6:8091

#include "zeus/core/random.h"
#include "zeus/db/database.h"
#include "zeus/util/config.h"
#include "zeus/util/logging.h"
#include "zeus/util/threadpool.h"
#include "zeus/validator/checkpoint.h"
#include "zeus/validator/params.h"
#include "zeus/validator/transport.h"
#include "zeus/validator/validator.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace zeus {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZEUS Validator Daemon";

namespace defaults {
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* CHECKPOINT_DIR = "checkpoints";
    constexpr int64_t CONNECT_TIMEOUT_MS = 3000;
}

// ============================================================================
// Global State
// ============================================================================

static std::atomic<bool> g_shutdownRequested{false};
static std::mutex g_shutdownMutex;
static std::condition_variable g_shutdownCondition;

// ============================================================================
// Signal Handling
// ============================================================================

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_shutdownRequested.store(true);
        g_shutdownCondition.notify_all();
    }
}

void SetupSignalHandlers() {
    std::signal(SIGINT, SignalHandler);
    std::signal(SIGTERM, SignalHandler);
#ifndef _WIN32
    std::signal(SIGPIPE, SIG_IGN);  // Ignore broken pipe
#endif
}

/// Sleep until the timeout elapses or shutdown is requested
bool WaitForShutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    g_shutdownCondition.wait_for(lock, timeout, [] { return g_shutdownRequested.load(); });
    return g_shutdownRequested.load();
}

// ============================================================================
// Initialization
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: zeus-validatord [options]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>        Data directory (default: ~/.zeus)\n"
              << "  -conf=<file>          Configuration file (default: zeus.conf)\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error\n"
              << "  -debug=<category>     Enable a log category (repeatable)\n"
              << "  -printtoconsole=<0|1> Log to the console (default: 1)\n"
              << "  -threads=<n>          Worker threads (default: hardware concurrency)\n"
              << "  -miner=<id@host:port> Miner to challenge (repeatable)\n"
              << "\nAll [validator] section keys may be given as -key=value.\n";
}

void SetupLogging(const util::ConfigManager& config, const std::string& dataDir) {
    using namespace util;
    auto& logger = Logger::Instance();
    logger.Initialize();
    logger.ClearSinks();
    
    LogLevel level = LogLevelFromString(config.GetString(ConfigKeys::LOGLEVEL, "info"));
    logger.SetLevel(level);
    
    if (config.GetBool(ConfigKeys::PRINTTOCONSOLE, true)) {
        ConsoleSink::Config consoleConfig;
        consoleConfig.level = level;
        logger.AddSink(std::make_shared<ConsoleSink>(consoleConfig));
    }
    
    FileSink::Config fileConfig;
    fileConfig.path = (std::filesystem::path(dataDir) / defaults::LOG_FILENAME).string();
    fileConfig.level = LogLevel::Debug;
    logger.AddSink(std::make_shared<FileSink>(fileConfig));
    
    for (const auto& category : config.GetList(ConfigKeys::DEBUG)) {
        logger.EnableCategory(category);
    }
}

size_t RegisterMiners(const util::ConfigManager& config, validator::Validator& validator) {
    using namespace util;
    size_t added = 0;
    for (const std::string& entry : config.GetList(ConfigKeys::MINER, ConfigSection::VALIDATOR)) {
        auto endpoint = validator::MinerEndpoint::Parse(entry);
        if (!endpoint) {
            LOG_ERROR(LogCategory::DEFAULT) << "Ignoring malformed miner entry: " << entry;
            continue;
        }
        if (validator.AddMiner(*endpoint)) {
            ++added;
        } else {
            LOG_WARN(LogCategory::DEFAULT) << "Duplicate miner entry: " << entry;
        }
    }
    return added;
}

// ============================================================================
// Main Entry Point
// ============================================================================

int AppMain(int argc, char* argv[]) {
    util::ConfigParseResult parsed = util::InitConfig(argc, argv);
    if (!parsed.success) {
        std::cerr << "Error: " << parsed.ToString() << std::endl;
        return 1;
    }
    const util::ConfigManager& config = util::GetConfig();
    if (config.HasKey("help") || config.HasKey("?")) {
        PrintHelp();
        return 0;
    }
    if (config.HasKey("version")) {
        std::cout << CLIENT_NAME << " v" << VERSION << std::endl;
        return 0;
    }
    
    const std::string dataDir = config.GetDataDir();
    std::error_code ec;
    std::filesystem::create_directories(dataDir, ec);
    if (ec) {
        std::cerr << "Error: cannot create data directory " << dataDir << ": "
                  << ec.message() << std::endl;
        return 1;
    }
    
    SetupLogging(config, dataDir);
    for (const auto& warning : parsed.warnings) {
        LOG_WARN(util::LogCategory::DEFAULT) << warning;
    }
    LOG_INFO(util::LogCategory::DEFAULT) << CLIENT_NAME << " v" << VERSION << " starting...";
    LOG_INFO(util::LogCategory::DEFAULT) << "Data directory: " << dataDir;
    
    validator::ValidatorConfig params = validator::ValidatorConfig::FromConfig(config);
    std::vector<std::string> problems = params.Validate();
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            LOG_ERROR(util::LogCategory::DEFAULT) << "Invalid configuration: " << problem;
        }
        return 1;
    }
    
    SetupSignalHandlers();
    
    // Checkpoint store
    auto [status, database] = db::OpenDatabase(
        std::filesystem::path(dataDir) / defaults::CHECKPOINT_DIR);
    if (!status.ok()) {
        LOG_ERROR(util::LogCategory::DB) << "Cannot open checkpoint database: " << status.ToString();
        return 1;
    }
    LOG_INFO(util::LogCategory::DB) << "Checkpoint backend: " << database->Backend();
    validator::CheckpointStore checkpoints(*database);
    
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = static_cast<size_t>(config.GetUInt(util::ConfigKeys::THREADS, 0));
    poolConfig.name = "validator";
    util::ThreadPool pool(poolConfig);
    
    validator::TcpMinerTransport transport(params.graceMs, defaults::CONNECT_TIMEOUT_MS);
    
    {
        validator::Validator validator(params, transport, pool, GetOsRandom(), &checkpoints, dataDir);
        size_t restored = validator.Restore();
        size_t miners = RegisterMiners(config, validator);
        LOG_INFO(util::LogCategory::DEFAULT) << "Restored " << restored << " miner record(s), "
                                             << miners << " miner(s) configured";
        if (miners == 0) {
            LOG_WARN(util::LogCategory::DEFAULT) << "No miners configured (add miner=<id>@<host>:<port>)";
        }
        
        validator.Start();
        
        while (!g_shutdownRequested.load()) {
            validator::RoundStats stats = validator.RunRound();
            LOG_DEBUG(util::LogCategory::CHALLENGE)
                << "Round " << stats.round << ": " << stats.dispatched << " dispatched, "
                << stats.accepted << " accepted, " << stats.rejected << " rejected, "
                << stats.expired << " expired";
            if (WaitForShutdown(std::chrono::milliseconds(params.roundIntervalMs))) {
                break;
            }
        }
        
        LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";
        validator.Stop();
        if (!validator.Checkpoint()) {
            LOG_ERROR(util::LogCategory::DB) << "Final checkpoint failed";
        }
    }
    
    pool.Shutdown();
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutdown complete";
    util::Logger::Instance().Shutdown();
    return 0;
}

} // namespace zeus

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
    try {
        return zeus::AppMain(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
