/**
 * @file skeleton.hpp
 * @brief Fixed part of the ruleset, loaded before every generated batch
 * @author nftables-firewall Development Team
 * @date 2024
 */

#pragma once

#include <string>

namespace nftfw {

/**
 * @class Skeleton
 * @brief nft script creating both tables with their base and helper chains
 *
 * The script only adds objects and flushes the helper chains it fills, so
 * it can be applied repeatedly while the generated chains stay in place.
 */
class Skeleton {
public:
    static const std::string& script();
};

} // namespace nftfw
