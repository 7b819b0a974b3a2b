#include "core/conflict_checker.hpp"
#include "core/discovery_engine.hpp"
#include "core/key_scanner.hpp"
#include "core/logger.hpp"
#include "core/multicast_probe.hpp"
#include "core/port_scan_probe.hpp"
#include "core/session_manager.hpp"
#include "core/settings_manager.hpp"
#include "core/tv_identifier.hpp"
#include "core/websocket_channel.hpp"
#include "models/subnet.hpp"
#include "util/net_util.hpp"

#include <borealis/core/thread.hpp>
#include <borealis/core/thread_pool.hpp>
#include <curl/curl.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

struct CliArgs {
    std::string configPath;
    bool verbose = false;
    std::string command;

    std::vector<std::string> subnets;
    bool save = false;
    std::string outFile;
    std::vector<std::string> positional;
};

static std::atomic<bool> g_interrupted{false};

static void onSignal(int) {
    g_interrupted = true;
}

static void usage(const char* prog) {
    std::cerr
        << "Usage: " << prog << " [--config PATH] [--verbose] <command> [options]\n"
        << "Commands:\n"
        << "  discover [--subnet CIDR]... [--save]   find TVs via SSDP and port scan\n"
        << "  send KEY...                            send remote keys to the configured TV\n"
        << "  pair                                   connect once and store the pairing token\n"
        << "  check IP                               check an address for conflicts\n"
        << "  scan-keys [--out FILE] KEY...          report which keys the TV accepts\n";
}

static bool parse_args(int argc, char** argv, CliArgs& a) {
    for (int i = 1; i < argc; ++i) {
        std::string s = argv[i];
        auto need = [&](int more) {
            if (i + more >= argc) { usage(argv[0]); return false; }
            return true;
        };

        if (s == "--config") { if (!need(1)) return false; a.configPath = argv[++i]; }
        else if (s == "--verbose" || s == "-v") a.verbose = true;
        else if (s == "--subnet") { if (!need(1)) return false; a.subnets.push_back(argv[++i]); }
        else if (s == "--save") a.save = true;
        else if (s == "--out") { if (!need(1)) return false; a.outFile = argv[++i]; }
        else if (s == "-h" || s == "--help") { usage(argv[0]); return false; }
        else if (!s.empty() && s[0] == '-') { std::cerr << "Unknown arg: " << s << "\n"; usage(argv[0]); return false; }
        else if (a.command.empty()) a.command = s;
        else a.positional.push_back(s);
    }

    if (a.command.empty()) { usage(argv[0]); return false; }
    if ((a.command == "send" || a.command == "scan-keys") && a.positional.empty()) {
        std::cerr << a.command << " needs at least one KEY\n";
        return false;
    }
    if (a.command == "check" && a.positional.size() != 1) {
        std::cerr << "check needs exactly one IP\n";
        return false;
    }
    return true;
}

static SessionOptions sessionOptionsFrom(const SettingsManager& settings) {
    SessionOptions options;
    options.clientName = settings.getName();
    options.timeoutMs = settings.getTimeout() * 1000;
    return options;
}

static bool openSession(SessionManager& session, SettingsManager& settings) {
    tv::Endpoint endpoint = settings.getEndpoint();
    if (endpoint.host.empty()) {
        std::cerr << "No TV configured; run 'discover --save' or set host in " << settings.getConfigPath() << "\n";
        return false;
    }

    session.setOnCredentialUpdated([&settings](const std::string& host, const tv::PairingCredential& credential) {
        settings.getTokenStore().put(host, credential);
        if (settings.writeFile() != 0) {
            std::cerr << "Warning: failed to save pairing token\n";
        }
    });

    tv::PairingCredential credential = settings.getTokenStore().get(endpoint.host);
    tv::TvError error;
    if (!session.connect(endpoint, credential, error)) {
        std::cerr << "Connect failed (" << tv::toString(error.kind) << "): " << error.message << "\n";
        return false;
    }
    return true;
}

static int runDiscover(const CliArgs& args, SettingsManager& settings, Logger* logger) {
    // Explicit subnets must all be valid; configured ones are skipped by the engine
    for (const auto& cidr : args.subnets) {
        tv::Subnet subnet;
        tv::TvError error;
        if (!tv::Subnet::parse(cidr, subnet, error.message)) {
            error.kind = tv::ErrorKind::InvalidSubnet;
            std::cerr << tv::toString(error.kind) << ": " << error.message << "\n";
            return 1;
        }
    }

    std::vector<std::string> subnets = args.subnets;
    if (subnets.empty()) subnets = settings.getDiscoverySubnets();
    if (subnets.empty()) {
        std::string local = util::localIPv4Address();
        subnets.push_back(tv::Subnet::defaultFor(local));
    }

    TvIdentifier identifier(CurlWebSocketChannel::factory(logger), logger);
    identifier.setClientName(settings.getName());
    MulticastProbe multicast(MulticastProbeOptions{}, logger);
    PortScanProbe portScan(PortScanOptions{}, identifier, logger);
    DiscoveryEngine engine(multicast, portScan, logger);

    std::promise<std::pair<std::vector<tv::Candidate>, tv::TvError>> done;
    auto result = done.get_future();

    engine.discoverAsync(subnets,
        [](const std::string& message, double fraction) {
            std::cerr << "\r" << message << " " << static_cast<int>(fraction * 100) << "%   " << std::flush;
        },
        [&done](const std::vector<tv::Candidate>& candidates, const tv::TvError& error) {
            done.set_value({candidates, error});
        });

    while (result.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (g_interrupted) {
            engine.stop();
        }
    }
    std::cerr << "\n";

    auto [candidates, error] = result.get();
    if (error.isError()) {
        std::cerr << "Discovery failed (" << tv::toString(error.kind) << "): " << error.message << "\n";
        return 3;
    }

    nlohmann::json out = candidates;
    std::cout << out.dump(2) << std::endl;

    if (args.save) {
        settings.setDiscoverySubnets(subnets);
        if (!candidates.empty()) {
            const tv::Endpoint& first = candidates.front().endpoint;
            settings.setHost(first.host);
            settings.setPort(first.port);
            settings.setMethod(first.method);
        }
        if (settings.writeFile() != 0) {
            std::cerr << "Failed to write " << settings.getConfigPath() << "\n";
            return 4;
        }
    }
    return 0;
}

static int runSend(const CliArgs& args, SettingsManager& settings, Logger* logger) {
    SessionManager session(sessionOptionsFrom(settings), CurlWebSocketChannel::factory(logger), logger);
    if (!openSession(session, settings)) return 3;

    int failures = 0;
    for (const auto& key : args.positional) {
        if (g_interrupted) break;
        tv::CommandResult result = session.send(key);
        nlohmann::json out = result;
        std::cout << out.dump() << std::endl;
        if (!result.succeeded()) failures++;
    }

    session.close();
    return failures == 0 ? 0 : 5;
}

static int runPair(SettingsManager& settings, Logger* logger) {
    SessionManager session(sessionOptionsFrom(settings), CurlWebSocketChannel::factory(logger), logger);
    if (!openSession(session, settings)) return 3;

    tv::PairingCredential credential = session.getCredential();
    std::cout << "Paired with " << session.getEndpoint().host
              << (credential.hasToken() ? " (token stored)" : "") << std::endl;
    session.close();
    return 0;
}

static int runCheck(const CliArgs& args, SettingsManager& settings, Logger* logger) {
    const std::string& ip = args.positional.front();
    ConflictChecker checker(logger);

    if (!checker.check(ip)) {
        std::cout << ip << ": no conflict detected" << std::endl;
        return 0;
    }

    std::cout << ip << ": address appears to be in use" << std::endl;

    std::string local = util::localIPv4Address();
    if (local.empty()) return 6;

    std::vector<std::string> subnets = settings.getDiscoverySubnets();
    std::string subnet = subnets.empty() ? tv::Subnet::defaultFor(local) : subnets.front();
    if (auto alternative = checker.suggestAlternative(local, subnet)) {
        std::cout << "Suggested free address: " << *alternative << std::endl;
    }
    return 6;
}

static int runScanKeys(const CliArgs& args, SettingsManager& settings, Logger* logger) {
    SessionOptions options = sessionOptionsFrom(settings);
    SessionManager session(options, CurlWebSocketChannel::factory(logger), logger);
    if (!openSession(session, settings)) return 3;

    KeyScanner scanner(session, logger);
    KeyScanReport report = scanner.scan(args.positional, [](const std::string& key, size_t index, size_t total) {
        std::cerr << "[" << (index + 1) << "/" << total << "] " << key << std::endl;
    });
    session.close();

    nlohmann::json out;
    out["working"] = report.working;
    out["failed"] = report.failed;
    std::cout << out.dump(2) << std::endl;

    if (!args.outFile.empty()) {
        std::string error;
        if (!KeyScanner::writeReport(report, args.outFile, error)) {
            std::cerr << error << "\n";
            return 4;
        }
    }
    return 0;
}

int main(int argc, char** argv) {
    CliArgs args;
    if (!parse_args(argc, argv, args)) return 1;

    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    BorealisLogger::setLevel(args.verbose ? LogLevel::Debug : LogLevel::Info);
    BorealisLogger logger;

    if (curl_global_init(CURL_GLOBAL_DEFAULT) != CURLE_OK) {
        std::cerr << "Failed to initialize libcurl\n";
        return 2;
    }

    // Discovery runs its probes as brls::async tasks
    brls::Threading::start();

    std::unique_ptr<SettingsManager> ownedSettings;
    SettingsManager* settings = nullptr;
    if (args.configPath.empty()) {
        settings = SettingsManager::getInstance(&logger);
    } else {
        ownedSettings = std::make_unique<SettingsManager>(args.configPath, &logger);
        ownedSettings->parseFile();
        settings = ownedSettings.get();
    }

    int rc = 1;
    if (args.command == "discover") rc = runDiscover(args, *settings, &logger);
    else if (args.command == "send") rc = runSend(args, *settings, &logger);
    else if (args.command == "pair") rc = runPair(*settings, &logger);
    else if (args.command == "check") rc = runCheck(args, *settings, &logger);
    else if (args.command == "scan-keys") rc = runScanKeys(args, *settings, &logger);
    else { std::cerr << "Unknown command: " << args.command << "\n"; usage(argv[0]); }

    brls::ThreadPool::shutdown();
    brls::Threading::stop();
    curl_global_cleanup();
    return rc;
}
