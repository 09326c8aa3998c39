#include "tree/Node.hpp"

#include <unordered_set>

namespace DS {

auto Node::child(std::string_view key) const -> NodePtr {
    auto const* fields = asObject();
    if (!fields)
        return nullptr;
    auto it = fields->find(key);
    if (it == fields->end())
        return nullptr;
    return it->second;
}

auto Node::child(std::size_t index) const -> NodePtr {
    auto const* items = asArray();
    if (!items || index >= items->size())
        return nullptr;
    return (*items)[index];
}

auto Node::null() -> NodePtr {
    static NodePtr const shared = std::make_shared<const Node>(Node{nullptr});
    return shared;
}

auto Node::boolean(bool v) -> NodePtr {
    return std::make_shared<const Node>(Node{v});
}

auto Node::integer(std::int64_t v) -> NodePtr {
    return std::make_shared<const Node>(Node{v});
}

auto Node::number(double v) -> NodePtr {
    return std::make_shared<const Node>(Node{v});
}

auto Node::string(std::string v) -> NodePtr {
    return std::make_shared<const Node>(Node{std::move(v)});
}

auto Node::array(Array items) -> NodePtr {
    return std::make_shared<const Node>(Node{std::move(items)});
}

auto Node::object(Object fields) -> NodePtr {
    return std::make_shared<const Node>(Node{std::move(fields)});
}

auto nodeKindToString(NodeKind kind) -> std::string_view {
    switch (kind) {
    case NodeKind::Null: return "null";
    case NodeKind::Bool: return "bool";
    case NodeKind::Integer: return "integer";
    case NodeKind::Number: return "number";
    case NodeKind::String: return "string";
    case NodeKind::Array: return "array";
    case NodeKind::Object: return "object";
    }
    return "unknown";
}

auto scalarEquals(Node const& lhs, Node const& rhs) -> bool {
    if (lhs.kind() != rhs.kind() || lhs.isComposite())
        return false;
    return lhs.value == rhs.value;
}

auto deepEquals(NodePtr const& lhs, NodePtr const& rhs) -> bool {
    if (lhs == rhs)
        return true;
    if (!lhs || !rhs || lhs->kind() != rhs->kind())
        return false;

    if (auto const* left = lhs->asArray()) {
        auto const* right = rhs->asArray();
        if (left->size() != right->size())
            return false;
        for (std::size_t i = 0; i < left->size(); ++i) {
            if (!deepEquals((*left)[i], (*right)[i]))
                return false;
        }
        return true;
    }

    if (auto const* left = lhs->asObject()) {
        auto const* right = rhs->asObject();
        if (left->size() != right->size())
            return false;
        auto rit = right->begin();
        for (auto lit = left->begin(); lit != left->end(); ++lit, ++rit) {
            if (lit->first != rit->first || !deepEquals(lit->second, rit->second))
                return false;
        }
        return true;
    }

    return scalarEquals(*lhs, *rhs);
}

auto countUniqueNodes(NodePtr const& root) -> std::size_t {
    if (!root)
        return 0;

    std::unordered_set<Node const*> visited;
    std::vector<NodePtr>            stack;
    stack.push_back(root);

    while (!stack.empty()) {
        NodePtr current = stack.back();
        stack.pop_back();
        if (!current || !visited.insert(current.get()).second)
            continue;
        if (auto const* items = current->asArray()) {
            for (auto const& item : *items)
                stack.push_back(item);
        } else if (auto const* fields = current->asObject()) {
            for (auto const& [_, child] : *fields)
                stack.push_back(child);
        }
    }
    return visited.size();
}

} // namespace DS
