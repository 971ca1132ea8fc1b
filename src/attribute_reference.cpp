#include "attribute_reference.hpp"

namespace flagstore {

namespace {

// Returns false on a malformed escape
bool unescapeComponent(const std::string& path, std::string& out) {
    out.clear();
    for (std::size_t i = 0; i < path.size(); ++i) {
        if (path[i] != '~') {
            out.push_back(path[i]);
            continue;
        }
        if (i + 1 == path.size()) {
            return false;
        }
        switch (path[i + 1]) {
        case '0':
            out.push_back('~');
            break;
        case '1':
            out.push_back('/');
            break;
        default:
            return false;
        }
        ++i;
    }
    return true;
}

std::string rawText(const nlohmann::json& value) {
    return value.is_string() ? value.get<std::string>() : value.dump();
}

} // namespace

AttributeReference AttributeReference::fromJson(const nlohmann::json& value) {
    if (!value.is_string()) {
        return AttributeReference(value.is_null() ? "" : rawText(value), {}, ERR_EMPTY);
    }
    return create(value.get<std::string>());
}

AttributeReference AttributeReference::create(const std::string& value) {
    if (value.empty() || value == "/") {
        return AttributeReference(value, {}, ERR_EMPTY);
    }
    if (value.front() != '/') {
        return AttributeReference(value, {value});
    }
    if (value.back() == '/') {
        return AttributeReference(value, {}, ERR_DOUBLE_TRAILING_SLASH);
    }

    std::vector<std::string> components;
    std::size_t start = 1;
    while (start <= value.size()) {
        auto end = value.find('/', start);
        if (end == std::string::npos) {
            end = value.size();
        }
        auto part = value.substr(start, end - start);
        if (part.empty()) {
            return AttributeReference(value, {}, ERR_DOUBLE_TRAILING_SLASH);
        }

        std::string unescaped;
        if (!unescapeComponent(part, unescaped)) {
            return AttributeReference(value, {}, ERR_INVALID_ESCAPE_SEQUENCE);
        }
        components.push_back(std::move(unescaped));
        start = end + 1;
    }

    return AttributeReference(value, std::move(components));
}

AttributeReference AttributeReference::literalFromJson(const nlohmann::json& value) {
    if (!value.is_string()) {
        return AttributeReference(value.is_null() ? "" : rawText(value), {}, ERR_EMPTY);
    }
    return createLiteral(value.get<std::string>());
}

AttributeReference AttributeReference::createLiteral(const std::string& value) {
    if (value.empty()) {
        return AttributeReference(value, {}, ERR_EMPTY);
    }
    if (value.front() != '/') {
        return AttributeReference(value, {value});
    }

    std::string escaped = "/";
    for (char c : value) {
        if (c == '~') {
            escaped += "~0";
        } else if (c == '/') {
            escaped += "~1";
        } else {
            escaped.push_back(c);
        }
    }
    return AttributeReference(escaped, {value});
}

std::optional<std::string> AttributeReference::component(std::size_t index) const {
    if (index >= components_.size()) {
        return std::nullopt;
    }
    return components_[index];
}

} // namespace flagstore
