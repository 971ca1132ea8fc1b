#include "data_source.hpp"

namespace flagstore {

const char* dataSourceStateToString(DataSourceState state) {
    switch (state) {
    case DataSourceState::INITIALIZING:
        return "INITIALIZING";
    case DataSourceState::VALID:
        return "VALID";
    case DataSourceState::INTERRUPTED:
        return "INTERRUPTED";
    case DataSourceState::OFF:
        return "OFF";
    }
    return "UNKNOWN";
}

const char* DataSourceErrorInfo::kindToString(Kind kind) {
    switch (kind) {
    case Kind::UNKNOWN:
        return "UNKNOWN";
    case Kind::NETWORK_ERROR:
        return "NETWORK_ERROR";
    case Kind::ERROR_RESPONSE:
        return "ERROR_RESPONSE";
    case Kind::INVALID_DATA:
        return "INVALID_DATA";
    case Kind::STORE_ERROR:
        return "STORE_ERROR";
    }
    return "UNKNOWN";
}

std::string DataSourceErrorInfo::toString() const {
    std::string out = kindToString(kind);
    if (statusCode > 0) {
        out += "(" + std::to_string(statusCode) + ")";
    }
    if (!message.empty()) {
        out += ": " + message;
    }
    return out;
}

} // namespace flagstore
