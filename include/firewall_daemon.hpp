/**
 * @file firewall_daemon.hpp
 * @brief Periodic synchronization of the ruleset with the configuration
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "config.hpp"
#include "config_loader.hpp"
#include "firewall.hpp"
#include "nft_client.hpp"
#include <atomic>
#include <ostream>

namespace nftfw {

/**
 * @class FirewallDaemon
 * @brief Runs one synchronization cycle per update interval until stopped
 *
 * Each cycle loads a fresh FirewallConfig snapshot, applies the skeleton
 * and submits the generated batch. A failed cycle is logged and retried on
 * the next interval. While the force-disable flag file exists, cycles are
 * skipped. When the loop ends, both tables are removed.
 */
class FirewallDaemon {
public:
    FirewallDaemon(const DaemonConfig& settings, const ConfigLoader& loader, NftEngine& engine,
                   HostAccess host_access = HostAccess::system());

    /**
     * @brief Load the configuration and apply it once
     *
     * A disabled firewall removes both tables instead.
     * @throws std::runtime_error on configuration errors
     * @throws NftError on engine failures
     */
    void runCycle();

    /**
     * @brief Load the configuration and print the batch as indented JSON
     *
     * Nothing is submitted and no tunable is written.
     */
    void compile(std::ostream& out) const;

    /**
     * @brief Delete both tables
     *
     * Command errors are ignored since deleting a missing table fails.
     * @throws NftError only for I/O errors
     */
    void removeFirewall();

    /**
     * @brief Loop until the stop flag is set, then remove the firewall
     * @return 0 on a clean shutdown, 1 if the final removal failed
     */
    int run(const std::atomic<bool>& stop);

    /// Route SIGTERM and SIGINT to stopFlag()
    static void installSignalHandlers();

    static std::atomic<bool>& stopFlag();

private:
    /// Sleep for the update interval, waking early when stop is set
    void waitInterval(const std::atomic<bool>& stop) const;

    DaemonConfig settings_;
    const ConfigLoader& loader_;
    NftEngine& engine_;
    HostAccess host_access_;
};

} // namespace nftfw
