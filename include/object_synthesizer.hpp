/**
 * @file object_synthesizer.hpp
 * @brief Named nftables objects backing rules: ipsets and ct helpers
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include "firewall_config.hpp"
#include "ipset.hpp"
#include "macro_tables.hpp"
#include "nft_types.hpp"
#include <json/json.h>
#include <cstdint>
#include <optional>
#include <vector>

namespace nftfw {

/**
 * @struct ObjectEnv
 * @brief Table the objects are created in
 */
struct ObjectEnv {
    TableName table;
    const FirewallConfig& config;
    std::optional<uint32_t> vmid;   ///< Owner of guest scoped sets

    const Alias* alias(const AliasName& name) const { return config.alias(name, vmid); }
};

/**
 * @class ObjectSynthesizer
 * @brief Commands creating the objects referenced by compiled rules
 */
class ObjectSynthesizer {
public:
    /**
     * @brief Set pair per family the table carries
     *
     * For every family: add and flush the set of matching entries, add and
     * flush the set of "!" entries, then add the entries of each set that
     * is not empty. Entries of the other family are skipped.
     * @throws std::runtime_error if an entry references an unknown alias
     */
    static std::vector<Json::Value> ipsetObjects(const IpSet& ipset, const ObjectEnv& env);

    /// One helper object per transport protocol of the helper
    static std::vector<Json::Value> ctHelperObjects(const CtHelperMacro& helper, const ObjectEnv& env);
};

} // namespace nftfw
