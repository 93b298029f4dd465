#include "firewall_daemon.hpp"
#include "logger.hpp"
#include "skeleton.hpp"
#include <chrono>
#include <csignal>
#include <filesystem>
#include <ostream>
#include <thread>

namespace nftfw {

namespace {

const std::string kComponent = "FirewallDaemon";

const auto kWaitStep = std::chrono::milliseconds(200);

void handleStopSignal(int) {
    FirewallDaemon::stopFlag().store(true);
}

} // anonymous namespace

FirewallDaemon::FirewallDaemon(const DaemonConfig& settings, const ConfigLoader& loader, NftEngine& engine,
                               HostAccess host_access)
    : settings_(settings), loader_(loader), engine_(engine), host_access_(std::move(host_access)) {
    host_access_.conntrack_log_flag = settings_.paths.conntrack_log_flag;
}

std::atomic<bool>& FirewallDaemon::stopFlag() {
    static std::atomic<bool> stop{false};
    return stop;
}

void FirewallDaemon::installSignalHandlers() {
    struct sigaction action{};
    action.sa_handler = &handleStopSignal;
    sigemptyset(&action.sa_mask);

    sigaction(SIGTERM, &action, nullptr);
    sigaction(SIGINT, &action, nullptr);
}

void FirewallDaemon::removeFirewall() {
    Logger::info(kComponent, "removing existing firewall rules");

    for (const auto& commands : Firewall::removeCommands()) {
        try {
            engine_.runJsonCommands(commands);
        } catch (const NftError& e) {
            if (e.kind() == NftError::Kind::Io) {
                throw;
            }
            Logger::debug(kComponent, e.what());
        }
    }
}

void FirewallDaemon::runCycle() {
    FirewallConfig config = FirewallConfig::load(loader_, engine_);
    Firewall firewall(std::move(config), host_access_);

    if (!firewall.isEnabled()) {
        removeFirewall();
        return;
    }

    Logger::info(kComponent, "creating the firewall skeleton");
    engine_.runCommands(Skeleton::script());

    CommandList commands = firewall.fullHostFw();

    Logger::info(kComponent, "running nftables commands");
    if (Logger::isEnabled(LogLevel::Debug)) {
        for (size_t i = 0; i < commands.size(); ++i) {
            Logger::debug(kComponent, "cmd #" + std::to_string(i) + " " +
                                          CommandList({commands.commands()[i]}).toString());
        }
    }

    std::optional<Json::Value> response = engine_.runJsonCommands(commands);
    if (response) {
        Logger::debug(kComponent, "got response from nftables: " + response->toStyledString());
    }
}

void FirewallDaemon::compile(std::ostream& out) const {
    HostAccess access = host_access_;
    access.write_tunable = nullptr;

    Firewall firewall(FirewallConfig::load(loader_, engine_), access);
    out << firewall.fullHostFw().toStyledString() << std::endl;
}

int FirewallDaemon::run(const std::atomic<bool>& stop) {
    std::filesystem::path force_disable(settings_.force_disable_flag);

    while (!stop.load()) {
        std::error_code ec;
        if (std::filesystem::exists(force_disable, ec)) {
            waitInterval(stop);
            continue;
        }

        auto start = std::chrono::steady_clock::now();

        try {
            runCycle();
        } catch (const std::exception& e) {
            Logger::error(kComponent, std::string("error updating firewall rules: ") + e.what());
        }

        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start);
        Logger::info(kComponent, "firewall update time: " + std::to_string(elapsed.count()) + "ms");

        waitInterval(stop);
    }

    try {
        removeFirewall();
    } catch (const NftError& e) {
        Logger::error(kComponent, e.what());
        return 1;
    }

    return 0;
}

void FirewallDaemon::waitInterval(const std::atomic<bool>& stop) const {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(settings_.update_interval);

    while (!stop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(kWaitStep);
    }
}

} // namespace nftfw
