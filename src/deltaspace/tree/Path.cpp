#include "tree/Path.hpp"

#include <algorithm>
#include <charconv>
#include <optional>

namespace DS {

namespace {

auto escapeToken(std::string_view token) -> std::string {
    std::string out;
    out.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out.push_back(c);
        }
    }
    return out;
}

auto unescapeToken(std::string_view token) -> Expected<std::string> {
    std::string out;
    out.reserve(token.size());
    for (std::size_t i = 0; i < token.size(); ++i) {
        char c = token[i];
        if (c != '~') {
            out.push_back(c);
            continue;
        }
        if (i + 1 >= token.size()) {
            return std::unexpected(Error{Error::Code::InvalidPath, "Dangling '~' in pointer token"});
        }
        char next = token[++i];
        if (next == '0') {
            out.push_back('~');
        } else if (next == '1') {
            out.push_back('/');
        } else {
            return std::unexpected(Error{Error::Code::InvalidPath,
                                         std::string("Invalid escape '~") + next + "' in pointer token"});
        }
    }
    return out;
}

auto parseIndexToken(std::string_view token) -> std::optional<std::size_t> {
    if (token.empty() || !std::all_of(token.begin(), token.end(), [](char c) { return c >= '0' && c <= '9'; }))
        return std::nullopt;
    // RFC 6901 forbids leading zeros in array indices.
    if (token.size() > 1 && token.front() == '0')
        return std::nullopt;
    std::size_t value = 0;
    auto [ptr, ec]    = std::from_chars(token.data(), token.data() + token.size(), value);
    if (ec != std::errc{} || ptr != token.data() + token.size())
        return std::nullopt;
    return value;
}

} // namespace

auto pathKeyToString(PathKey const& key) -> std::string {
    if (auto const* index = std::get_if<std::size_t>(&key))
        return std::to_string(*index);
    return std::get<std::string>(key);
}

auto toPointer(Path const& path) -> std::string {
    std::string out;
    for (auto const& key : path) {
        out.push_back('/');
        out += escapeToken(pathKeyToString(key));
    }
    return out;
}

auto parsePointer(std::string_view pointer) -> Expected<Path> {
    Path path;
    if (pointer.empty())
        return path;
    if (pointer.front() != '/') {
        return std::unexpected(Error{Error::Code::InvalidPath, "JSON pointer must start with '/'"});
    }

    std::size_t start = 1;
    while (true) {
        auto end   = pointer.find('/', start);
        auto token = pointer.substr(start, end == std::string_view::npos ? std::string_view::npos : end - start);
        if (auto index = parseIndexToken(token)) {
            path.emplace_back(*index);
        } else {
            auto unescaped = unescapeToken(token);
            if (!unescaped)
                return std::unexpected(unescaped.error());
            path.emplace_back(std::move(*unescaped));
        }
        if (end == std::string_view::npos)
            break;
        start = end + 1;
    }
    return path;
}

auto isPrefixOf(Path const& prefix, Path const& path) -> bool {
    if (prefix.size() > path.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

auto resolve(NodePtr const& root, Path const& path) -> Expected<NodePtr> {
    NodePtr current = root;
    for (std::size_t depth = 0; depth < path.size(); ++depth) {
        if (!current) {
            return std::unexpected(Error{Error::Code::NoSuchPath, "Null node at " + toPointer(path)});
        }
        auto const& key = path[depth];
        NodePtr     next;
        if (auto const* index = std::get_if<std::size_t>(&key)) {
            if (current->isArray()) {
                next = current->child(*index);
            } else if (current->isObject()) {
                next = current->child(std::to_string(*index));
            } else {
                return std::unexpected(Error{Error::Code::TypeMismatch,
                                             "Cannot index into " + std::string(nodeKindToString(current->kind()))});
            }
        } else {
            if (!current->isObject()) {
                return std::unexpected(Error{Error::Code::TypeMismatch,
                                             "Cannot look up key '" + std::get<std::string>(key) + "' in "
                                                 + std::string(nodeKindToString(current->kind()))});
            }
            next = current->child(std::get<std::string>(key));
        }
        if (!next) {
            Path partial(path.begin(), path.begin() + static_cast<std::ptrdiff_t>(depth + 1));
            return std::unexpected(Error{Error::Code::NoSuchPath, "No node at " + toPointer(partial)});
        }
        current = std::move(next);
    }
    return current;
}

} // namespace DS
