#include "nft_expression.hpp"
#include <sstream>

namespace nftfw {

namespace {

Json::Value toArray(const std::vector<Json::Value>& elements) {
    Json::Value array(Json::arrayValue);
    for (const auto& element : elements) {
        array.append(element);
    }
    return array;
}

} // anonymous namespace

Json::Value Expression::payload(const std::string& protocol, const std::string& field) {
    Json::Value expression;
    expression["payload"]["protocol"] = protocol;
    expression["payload"]["field"] = field;
    return expression;
}

Json::Value Expression::meta(const std::string& key) {
    Json::Value expression;
    expression["meta"]["key"] = key;
    return expression;
}

Json::Value Expression::ct(const std::string& key, std::optional<Family> family) {
    Json::Value expression;
    expression["ct"]["key"] = key;
    if (family) {
        expression["ct"]["family"] = ipProtocol(*family);
    }
    return expression;
}

Json::Value Expression::set(const std::vector<Json::Value>& elements) {
    Json::Value expression;
    expression["set"] = toArray(elements);
    return expression;
}

Json::Value Expression::list(const std::vector<Json::Value>& elements) {
    return toArray(elements);
}

Json::Value Expression::concat(const std::vector<Json::Value>& elements) {
    Json::Value expression;
    expression["concat"] = toArray(elements);
    return expression;
}

Json::Value Expression::range(const Json::Value& start, const Json::Value& end) {
    Json::Value expression;
    expression["range"] = toArray({start, end});
    return expression;
}

Json::Value Expression::prefix(const Cidr& cidr) {
    Json::Value expression;
    expression["prefix"]["addr"] = cidr.address().toString();
    expression["prefix"]["len"] = static_cast<Json::UInt>(cidr.mask());
    return expression;
}

Json::Value Expression::setReference(const std::string& name) {
    return Json::Value("@" + name);
}

Json::Value Expression::fromIpRange(const IpRange& range) {
    return Expression::range(Json::Value(range.start().toString()),
                             Json::Value(range.end().toString()));
}

Json::Value Expression::fromIpEntry(const IpEntry& entry) {
    if (entry.isCidr()) {
        return prefix(entry.cidr());
    }
    return fromIpRange(entry.range());
}

Json::Value Expression::fromIpList(const IpList& list) {
    if (list.entries().size() == 1) {
        return fromIpEntry(list.entries().front());
    }

    std::vector<Json::Value> elements;
    elements.reserve(list.entries().size());
    for (const auto& entry : list.entries()) {
        elements.push_back(fromIpEntry(entry));
    }
    return set(elements);
}

Json::Value Expression::fromPortEntry(const PortEntry& entry) {
    if (entry.isRange()) {
        return range(Json::Value(static_cast<Json::UInt>(entry.start())),
                     Json::Value(static_cast<Json::UInt>(entry.end())));
    }
    return Json::Value(static_cast<Json::UInt>(entry.start()));
}

Json::Value Expression::fromPortList(const PortList& list) {
    if (list.entries().size() == 1) {
        return fromPortEntry(list.entries().front());
    }

    std::vector<Json::Value> elements;
    elements.reserve(list.entries().size());
    for (const auto& entry : list.entries()) {
        elements.push_back(fromPortEntry(entry));
    }
    return set(elements);
}

Json::Value Expression::fromIcmpValue(const IcmpValue& value) {
    if (value.isNamed()) {
        return Json::Value(std::get<std::string>(value.value));
    }
    return Json::Value(static_cast<Json::UInt>(std::get<uint8_t>(value.value)));
}

std::string Expression::ipProtocol(Family family) {
    return family == Family::V4 ? "ip" : "ip6";
}

Json::Value Statement::match(MatchOperator op, const Json::Value& left, const Json::Value& right) {
    Json::Value statement;
    statement["match"]["op"] = op == MatchOperator::Eq ? "==" : "!=";
    statement["match"]["left"] = left;
    statement["match"]["right"] = right;
    return statement;
}

Json::Value Statement::matchEq(const Json::Value& left, const Json::Value& right) {
    return match(MatchOperator::Eq, left, right);
}

Json::Value Statement::matchNe(const Json::Value& left, const Json::Value& right) {
    return match(MatchOperator::Ne, left, right);
}

Json::Value Statement::accept() {
    Json::Value statement;
    statement["accept"] = Json::Value::null;
    return statement;
}

Json::Value Statement::drop() {
    Json::Value statement;
    statement["drop"] = Json::Value::null;
    return statement;
}

Json::Value Statement::jump(const std::string& target) {
    Json::Value statement;
    statement["jump"]["target"] = target;
    return statement;
}

Json::Value Statement::goTo(const std::string& target) {
    Json::Value statement;
    statement["goto"]["target"] = target;
    return statement;
}

Json::Value Statement::fromVerdict(Verdict verdict) {
    return verdict == Verdict::Accept ? accept() : drop();
}

Json::Value Statement::log(const std::string& prefix, int group) {
    Json::Value statement;
    statement["log"]["prefix"] = prefix;
    statement["log"]["group"] = group;
    return statement;
}

std::string Statement::logPrefix(std::optional<uint32_t> vmid, int level,
                                 const std::string& chain, Verdict verdict) {
    std::ostringstream prefix;
    prefix << ':' << vmid.value_or(0) << ':' << level << ':' << chain << ": "
           << verdictToString(verdict) << ": ";
    return prefix.str();
}

Json::Value Statement::limit(uint64_t rate, RateUnit per, std::optional<uint64_t> burst,
                             bool inverted) {
    Json::Value statement;
    Json::Value& limit = statement["limit"];
    limit["rate"] = static_cast<Json::UInt64>(rate);
    limit["per"] = rateUnitToString(per);
    if (burst) {
        limit["burst"] = static_cast<Json::UInt64>(*burst);
    }
    if (inverted) {
        limit["inv"] = true;
    }
    return statement;
}

Json::Value Statement::fromLogRateLimit(const LogRateLimit& limit) {
    return Statement::limit(static_cast<uint64_t>(limit.rate), limit.per,
                            static_cast<uint64_t>(limit.burst));
}

Json::Value Statement::ctHelper(const std::string& name) {
    Json::Value statement;
    statement["ct helper"] = name;
    return statement;
}

Json::Value Statement::setUpdate(const Json::Value& element, const std::string& setName,
                                 const std::vector<Json::Value>& statements) {
    Json::Value statement;
    Json::Value& set = statement["set"];
    set["op"] = "update";
    set["elem"] = element;
    set["set"] = "@" + setName;
    set["stmt"] = toArray(statements);
    return statement;
}

} // namespace nftfw
