#include "nft_client.hpp"
#include "command_executor.hpp"
#include "logger.hpp"
#include <memory>

namespace nftfw {

namespace {

const std::string kComponent = "NftClient";

std::string kindToString(NftError::Kind kind) {
    return kind == NftError::Kind::Io ? "cannot communicate with child process"
                                      : "cannot execute nftables commands";
}

bool isChainListing(const CommandList& commands) {
    return commands.size() == 1 && commands.commands().front().isMember("list");
}

} // anonymous namespace

NftError::NftError(Kind kind, const std::string& detail)
    : std::runtime_error(kindToString(kind) + ": " + detail), kind_(kind), detail_(detail) {}

std::multimap<std::string, ListChain> NftEngine::listChains() {
    Logger::info(kComponent, "querying nftables config for chains");

    CommandList commands;
    commands.append(Command::listChains());

    std::optional<Json::Value> reply = runJsonCommands(commands);
    if (!reply) {
        throw NftError(NftError::Kind::Command, "no command output from nft query");
    }

    return ListChain::fromReply(*reply);
}

NftClient::NftClient(std::string binary) : binary_(std::move(binary)) {}

std::string NftClient::execute(bool json, const std::string& input) {
    std::vector<std::string> args = {binary_};
    if (json) {
        args.push_back("-j");
    }
    args.push_back("-f");
    args.push_back("-");

    CommandResult result = CommandExecutor::execute(args, input);

    if (!result.success) {
        throw NftError(NftError::Kind::Io, result.stderr_output);
    }
    if (result.exit_code == 127 && result.stdout_output.empty()) {
        throw NftError(NftError::Kind::Io, "unable to run " + binary_);
    }
    if (!result.stderr_output.empty()) {
        throw NftError(NftError::Kind::Command, result.stderr_output);
    }

    return result.stdout_output;
}

std::optional<Json::Value> NftClient::runJsonCommands(const CommandList& commands) {
    std::string output = execute(true, commands.toString());
    if (output.empty()) {
        return std::nullopt;
    }

    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;

    if (!reader->parse(output.data(), output.data() + output.size(), &root, &errors)) {
        Logger::debug(kComponent, "ignoring unparsable nft output: " + errors);
        return std::nullopt;
    }

    return root;
}

std::string NftClient::runCommands(const std::string& script) {
    return execute(false, script);
}

MemoryNftEngine::MemoryNftEngine() {
    Json::Value listing;
    listing["nftables"] = Json::Value(Json::arrayValue);
    chain_listing_ = listing;
}

void MemoryNftEngine::failWith(NftError::Kind kind, const std::string& detail) {
    failure_ = NftError(kind, detail);
}

void MemoryNftEngine::throwIfFailing() const {
    if (failure_) {
        throw *failure_;
    }
}

std::optional<Json::Value> MemoryNftEngine::runJsonCommands(const CommandList& commands) {
    throwIfFailing();

    if (isChainListing(commands)) {
        return chain_listing_;
    }

    json_batches_.push_back(commands);
    return std::nullopt;
}

std::string MemoryNftEngine::runCommands(const std::string& script) {
    throwIfFailing();
    scripts_.push_back(script);
    return "";
}

} // namespace nftfw
