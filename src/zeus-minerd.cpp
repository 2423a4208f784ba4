// ZEUS Miner Daemon - Main Entry Point
// Copyright (c) 2024 ZEUS Developers
// MIT License
//
// zeus-minerd answers validator challenges using Zeus ASIC units behind
// cgminer, falling back to software search when no unit is usable.
// -simulate=N replaces cgminer with N in-process units.

#include "zeus/miner/cgminer_link.h"
#include "zeus/miner/proof_outbox.h"
#include "zeus/miner/responder.h"
#include "zeus/miner/server.h"
#include "zeus/miner/simulated_device.h"
#include "zeus/util/config.h"
#include "zeus/util/logging.h"
#include "zeus/util/threadpool.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>

namespace zeus {

// ============================================================================
// Version Information
// ============================================================================

constexpr const char* VERSION = "0.1.0";
constexpr const char* CLIENT_NAME = "ZEUS Miner Daemon";

namespace defaults {
    constexpr const char* LOG_FILENAME = "debug.log";
    constexpr const char* BIND = "0.0.0.0";
    constexpr const char* CGMINER_HOST = "127.0.0.1";
    constexpr size_t CONNECTION_THREADS = 4;
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

void WaitForShutdown() {
    std::unique_lock<std::mutex> lock(g_shutdownMutex);
    while (!g_shutdownRequested.load()) {
        g_shutdownCondition.wait_for(lock, std::chrono::seconds(1));
    }
}

// ============================================================================
// Initialization
// ============================================================================

void PrintHelp() {
    std::cout << CLIENT_NAME << " v" << VERSION << "\n\n"
              << "Usage: zeus-minerd [options]\n\n"
              << "Options:\n"
              << "  -datadir=<dir>        Data directory (default: ~/.zeus)\n"
              << "  -conf=<file>          Configuration file (default: zeus.conf)\n"
              << "  -loglevel=<level>     trace, debug, info, warn, error\n"
              << "  -debug=<category>     Enable a log category (repeatable)\n"
              << "  -bind=<addr>          Listen address (default: 0.0.0.0)\n"
              << "  -port=<port>          Listen port (default: 8091)\n"
              << "  -cgminerhost=<host>   cgminer API host (default: 127.0.0.1)\n"
              << "  -cgminerport=<port>   cgminer API port (default: 4028)\n"
              << "  -simulate=<n>         Use n simulated units instead of cgminer\n"
              << "  -softwarethreads=<n>  Software fallback threads (default: 1)\n"
              << "\nAll [miner] section keys may be given as -key=value.\n";
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

std::unique_ptr<miner::IDeviceLink> OpenDeviceLink(const util::ConfigManager& config) {
    using namespace util;
    const std::string section = ConfigSection::MINER;
    
    uint64_t simulated = config.GetUInt(ConfigKeys::SIMULATE, 0, section);
    if (simulated > 0) {
        LOG_INFO(LogCategory::DEVICE) << "Using " << simulated << " simulated unit(s)";
        return std::make_unique<miner::SimulatedDeviceLink>(static_cast<size_t>(simulated));
    }
    
    std::string host = config.GetString(ConfigKeys::CGMINERHOST, defaults::CGMINER_HOST, section);
    auto port = static_cast<uint16_t>(
        config.GetUInt(ConfigKeys::CGMINERPORT, miner::CgminerLink::DEFAULT_PORT, section));
    LOG_INFO(LogCategory::DEVICE) << "Using cgminer at " << host << ":" << port;
    return std::make_unique<miner::CgminerLink>(host, port);
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
    
    SetupSignalHandlers();
    
    const std::string section = util::ConfigSection::MINER;
    miner::ResponderConfig responderConfig = miner::ResponderConfig::FromConfig(config);
    std::unique_ptr<miner::IDeviceLink> link = OpenDeviceLink(config);
    
    std::vector<miner::DeviceInfo> devices = link->ListDevices();
    LOG_INFO(util::LogCategory::DEVICE) << devices.size() << " unit(s) detected";
    for (const auto& device : devices) {
        miner::HealthReport health = miner::EvaluateHealth(device, responderConfig.health);
        LOG_INFO(util::LogCategory::DEVICE) << "  " << device.id << " " << device.name << " "
                                            << device.telemetry.temperatureC << "C "
                                            << (health.healthy ? "healthy" : health.reason);
    }
    
    util::ThreadPool::Config poolConfig;
    poolConfig.numThreads = defaults::CONNECTION_THREADS;
    poolConfig.name = "miner";
    util::ThreadPool pool(poolConfig);
    
    miner::MinerResponder responder(*link, responderConfig);
    miner::ProofOutbox outbox;
    outbox.Start();
    
    util::Scheduler scheduler(pool);
    scheduler.Start();
    const auto reprobe = std::chrono::milliseconds(responderConfig.reprobeIntervalMs);
    scheduler.SchedulePeriodic(reprobe, reprobe,
                               [&responder]() { responder.ReprobeDegraded(GetTimeMillis()); });
    
    miner::MinerServer server(responder, outbox, pool);
    std::string bind = config.GetString(util::ConfigKeys::BIND, defaults::BIND, section);
    auto port = static_cast<uint16_t>(
        config.GetUInt(util::ConfigKeys::PORT, miner::DEFAULT_MINER_PORT, section));
    std::string error;
    if (!server.Start(bind, port, error)) {
        scheduler.Stop();
        outbox.Stop();
        return 1;
    }
    
    WaitForShutdown();
    
    LOG_INFO(util::LogCategory::DEFAULT) << "Shutting down...";
    server.Stop();
    scheduler.CancelAll();
    scheduler.Stop();
    pool.Wait();
    outbox.Stop();
    pool.Shutdown();
    
    const miner::ResponderStats& stats = responder.Stats();
    LOG_INFO(util::LogCategory::RESPONDER) << "Answered " << stats.challenges.load()
                                           << " challenge(s): " << stats.proofs.load()
                                           << " proof(s), " << stats.noSolutions.load()
                                           << " without solution, " << stats.hardwareFaults.load()
                                           << " hardware fault(s)";
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
