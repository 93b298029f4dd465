#include "nft_command.hpp"
#include "nft_expression.hpp"

namespace nftfw {

namespace {

Json::Value wrap(const std::string& verb, const std::string& object, Json::Value body) {
    Json::Value command;
    command[verb][object] = std::move(body);
    return command;
}

Json::Value tableObject(const TableName& table) {
    Json::Value object(Json::objectValue);
    object["family"] = tableFamilyToString(table.family);
    object["name"] = table.name;
    return object;
}

} // anonymous namespace

Json::Value Command::addTable(const TableName& table) {
    return wrap("add", "table", tableObject(table));
}

Json::Value Command::flushTable(const TableName& table) {
    return wrap("flush", "table", tableObject(table));
}

Json::Value Command::deleteTable(const TableName& table) {
    return wrap("delete", "table", tableObject(table));
}

Json::Value Command::addChain(const ChainName& chain) {
    return wrap("add", "chain", chain.toJson());
}

Json::Value Command::flushChain(const ChainName& chain) {
    return wrap("flush", "chain", chain.toJson());
}

Json::Value Command::deleteChain(const ChainName& chain) {
    return wrap("delete", "chain", chain.toJson());
}

Json::Value Command::addRule(const ChainName& chain, const std::vector<Json::Value>& statements) {
    Json::Value rule(Json::objectValue);
    chain.table.appendTo(rule);
    rule["chain"] = chain.name;

    Json::Value& expr = rule["expr"] = Json::Value(Json::arrayValue);
    for (const auto& statement : statements) {
        expr.append(statement);
    }

    return wrap("add", "rule", std::move(rule));
}

Json::Value Command::addSet(const SetName& set, Family family) {
    Json::Value object = set.toJson();
    object["type"] = family == Family::V4 ? "ipv4_addr" : "ipv6_addr";
    object["flags"] = Json::Value(Json::arrayValue);
    object["flags"].append("interval");
    object["auto-merge"] = true;
    return wrap("add", "set", std::move(object));
}

Json::Value Command::flushSet(const SetName& set) {
    return wrap("flush", "set", set.toJson());
}

Json::Value Command::addElements(const SetName& set, const std::vector<Json::Value>& elements) {
    Json::Value object = set.toJson();
    Json::Value& elem = object["elem"] = Json::Value(Json::arrayValue);
    for (const auto& element : elements) {
        elem.append(element);
    }
    return wrap("add", "element", std::move(object));
}

Json::Value Command::flushMap(const SetName& map) {
    return wrap("flush", "map", map.toJson());
}

Json::Value Command::addMapElements(const SetName& map,
                                    const std::vector<std::pair<Json::Value, Json::Value>>& elements) {
    Json::Value object = map.toJson();
    Json::Value& elem = object["elem"] = Json::Value(Json::arrayValue);
    for (const auto& [key, value] : elements) {
        Json::Value pair(Json::arrayValue);
        pair.append(key);
        pair.append(value);
        elem.append(pair);
    }
    return wrap("add", "element", std::move(object));
}

Json::Value Command::addCtHelper(const TableName& table, const std::string& name,
                                 const std::string& type, const std::string& protocol,
                                 std::optional<Family> l3proto) {
    Json::Value object(Json::objectValue);
    table.appendTo(object);
    object["name"] = name;
    object["type"] = type;
    object["protocol"] = protocol;
    if (l3proto) {
        object["l3proto"] = Expression::ipProtocol(*l3proto);
    }
    return wrap("add", "ct helper", std::move(object));
}

Json::Value Command::listChains() {
    return wrap("list", "chains", Json::Value::null);
}

void CommandList::extend(const CommandList& other) {
    extend(other.commands());
}

void CommandList::extend(const std::vector<Json::Value>& commands) {
    commands_.insert(commands_.end(), commands.begin(), commands.end());
}

Json::Value CommandList::toJson() const {
    Json::Value document;
    Json::Value& entries = document["nftables"] = Json::Value(Json::arrayValue);
    for (const auto& command : commands_) {
        entries.append(command);
    }
    return document;
}

std::string CommandList::toString() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, toJson());
}

std::string CommandList::toStyledString() const {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    return Json::writeString(builder, toJson());
}

} // namespace nftfw
