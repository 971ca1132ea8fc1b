#include "data_kind.hpp"
#include <functional>

namespace flagstore {

const char* objectKindName(DataKind kind) {
    switch (kind) {
    case DataKind::FLAGS:
        return "flag";
    case DataKind::SEGMENTS:
        return "segment";
    }
    return "unknown";
}

const char* namespaceName(DataKind kind) {
    switch (kind) {
    case DataKind::FLAGS:
        return "features";
    case DataKind::SEGMENTS:
        return "segments";
    }
    return "unknown";
}

std::optional<DataKind> dataKindFromObjectKind(std::string_view name) {
    for (auto kind : ALL_DATA_KINDS) {
        if (name == objectKindName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::optional<DataKind> dataKindFromNamespace(std::string_view name) {
    for (auto kind : ALL_DATA_KINDS) {
        if (name == namespaceName(kind)) {
            return kind;
        }
    }
    return std::nullopt;
}

std::size_t KindAndKeyHash::operator()(const KindAndKey& value) const {
    std::size_t h = std::hash<std::string>{}(value.key);
    return h ^ (static_cast<std::size_t>(value.kind) + 0x9e3779b9 + (h << 6) + (h >> 2));
}

} // namespace flagstore
