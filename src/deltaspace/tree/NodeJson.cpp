#include "tree/NodeJson.hpp"

#include <cstdint>
#include <limits>
#include <string>

namespace DS {

auto toJson(NodePtr const& node) -> nlohmann::json {
    if (!node)
        return nullptr;

    switch (node->kind()) {
    case NodeKind::Null:
        return nullptr;
    case NodeKind::Bool:
        return *node->asBool();
    case NodeKind::Integer:
        return *node->asInteger();
    case NodeKind::Number:
        return *node->asNumber();
    case NodeKind::String:
        return *node->asString();
    case NodeKind::Array: {
        auto out = nlohmann::json::array();
        for (auto const& item : *node->asArray()) {
            out.push_back(toJson(item));
        }
        return out;
    }
    case NodeKind::Object: {
        auto out = nlohmann::json::object();
        for (auto const& [key, child] : *node->asObject()) {
            out[key] = toJson(child);
        }
        return out;
    }
    }
    return nullptr;
}

auto fromJson(nlohmann::json const& json) -> Expected<NodePtr> {
    using value_t = nlohmann::json::value_t;

    switch (json.type()) {
    case value_t::null:
        return Node::null();
    case value_t::boolean:
        return Node::boolean(json.get<bool>());
    case value_t::number_integer:
        return Node::integer(json.get<std::int64_t>());
    case value_t::number_unsigned: {
        auto value = json.get<std::uint64_t>();
        if (value <= static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max()))
            return Node::integer(static_cast<std::int64_t>(value));
        return Node::number(static_cast<double>(value));
    }
    case value_t::number_float:
        return Node::number(json.get<double>());
    case value_t::string:
        return Node::string(json.get<std::string>());
    case value_t::array: {
        Array items;
        items.reserve(json.size());
        for (auto const& element : json) {
            auto child = fromJson(element);
            if (!child)
                return std::unexpected(child.error());
            items.push_back(std::move(*child));
        }
        return Node::array(std::move(items));
    }
    case value_t::object: {
        Object fields;
        for (auto const& [key, element] : json.items()) {
            auto child = fromJson(element);
            if (!child)
                return std::unexpected(child.error());
            fields.emplace(key, std::move(*child));
        }
        return Node::object(std::move(fields));
    }
    case value_t::binary:
        return std::unexpected(Error{Error::Code::NotSupported, "Binary JSON values cannot be stored in a state tree"});
    case value_t::discarded:
        return std::unexpected(Error{Error::Code::NotSupported, "Discarded JSON value cannot be stored in a state tree"});
    }
    return std::unexpected(Error{Error::Code::NotSupported, "Unknown JSON value type"});
}

} // namespace DS
