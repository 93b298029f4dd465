/**
 * @file nft_client.hpp
 * @brief Gateway to the nftables engine
 * @author nftables-firewall Development Team
 * @date 2024
 *
 * NftEngine abstracts the packet filter engine. NftClient submits batches
 * by running the nft front end; MemoryNftEngine records batches and serves
 * a canned chain listing for tests and dry runs.
 */

#pragma once

#include "nft_command.hpp"
#include "nft_types.hpp"
#include <json/json.h>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace nftfw {

/**
 * @class NftError
 * @brief Failure while talking to the engine
 */
class NftError : public std::runtime_error {
public:
    enum class Kind {
        Io,       ///< Process could not be run or its pipes failed
        Command   ///< Engine reported an error on standard error
    };

    NftError(Kind kind, const std::string& detail);

    Kind kind() const { return kind_; }

    /// Engine error text or I/O failure reason
    const std::string& detail() const { return detail_; }

private:
    Kind kind_;
    std::string detail_;
};

/**
 * @class NftEngine
 * @brief Submits command batches to a packet filter engine
 */
class NftEngine {
public:
    virtual ~NftEngine() = default;

    /**
     * @brief Submit a JSON command batch
     * @return Parsed reply, std::nullopt when the engine printed nothing
     *         or something that is not JSON
     * @throws NftError
     */
    virtual std::optional<Json::Value> runJsonCommands(const CommandList& commands) = 0;

    /**
     * @brief Submit a batch in the native nft script syntax
     * @return Engine output
     * @throws NftError
     */
    virtual std::string runCommands(const std::string& script) = 0;

    /**
     * @brief Chains currently known to the engine, keyed by name
     * @throws NftError
     */
    std::multimap<std::string, ListChain> listChains();
};

/**
 * @class NftClient
 * @brief Engine backed by the nft command line tool
 *
 * Runs "nft [-j] -f -" and writes the batch to its standard input. Any
 * output on standard error counts as a failed batch.
 */
class NftClient : public NftEngine {
public:
    explicit NftClient(std::string binary = "nft");

    std::optional<Json::Value> runJsonCommands(const CommandList& commands) override;
    std::string runCommands(const std::string& script) override;

    const std::string& binary() const { return binary_; }

private:
    std::string execute(bool json, const std::string& input);

    std::string binary_;
};

/**
 * @class MemoryNftEngine
 * @brief In-memory engine recording every submitted batch
 */
class MemoryNftEngine : public NftEngine {
public:
    /// Starts with an empty chain listing
    MemoryNftEngine();

    /// Reply returned for batches consisting of a chain listing
    void setChainListing(Json::Value listing) { chain_listing_ = std::move(listing); }

    /// Make every following submission fail with the given error
    void failWith(NftError::Kind kind, const std::string& detail);

    std::optional<Json::Value> runJsonCommands(const CommandList& commands) override;
    std::string runCommands(const std::string& script) override;

    const std::vector<CommandList>& jsonBatches() const { return json_batches_; }
    const std::vector<std::string>& scripts() const { return scripts_; }

private:
    void throwIfFailing() const;

    std::optional<Json::Value> chain_listing_;
    std::optional<NftError> failure_;
    std::vector<CommandList> json_batches_;
    std::vector<std::string> scripts_;
};

} // namespace nftfw
