#include "exceptions.hpp"
#include <nlohmann/json.hpp>
#include <random>
#include <sstream>
#include <unordered_map>

namespace flagstore {

const ErrorCodeInfo& getErrorCodeInfo(ErrorCode code) {
    static const std::unordered_map<ErrorCode, ErrorCodeInfo> errorInfo = {
        // Validation errors
        {ErrorCode::INVALID_INPUT, {"Invalid input data or format", "Validation", false}},
        {ErrorCode::MISSING_FIELD, {"Required field is missing", "Validation", false}},
        {ErrorCode::INVALID_FORMAT, {"Value has an invalid format", "Validation", false}},
        {ErrorCode::INVALID_RANGE, {"Value is outside acceptable range", "Validation", false}},
        {ErrorCode::INVALID_TYPE, {"Value has an unexpected type", "Validation", false}},

        // System errors
        {ErrorCode::STORE_UNAVAILABLE, {"Persistent store is unavailable", "System", true}},
        {ErrorCode::STORE_OPERATION_FAILED, {"Persistent store operation failed", "System", true}},
        {ErrorCode::NETWORK_ERROR, {"Network communication failed", "System", true}},
        {ErrorCode::FILE_ERROR, {"File system operation failed", "System", true}},
        {ErrorCode::LOCK_TIMEOUT, {"Lock acquisition timed out", "System", true}},
        {ErrorCode::CONFIGURATION_ERROR, {"Configuration is invalid", "System", false}},

        // Data errors
        {ErrorCode::DATA_INCONSISTENCY, {"Data item is internally inconsistent", "Data", false}},
        {ErrorCode::DECODE_FAILED, {"Data item could not be decoded", "Data", false}},
        {ErrorCode::UNKNOWN_DATA_KIND, {"Unknown data kind", "Data", false}}
    };

    static const ErrorCodeInfo unknown{"Unknown error", "Unknown", false};
    auto it = errorInfo.find(code);
    return it != errorInfo.end() ? it->second : unknown;
}

const char* getErrorCodeDescription(ErrorCode code) {
    return getErrorCodeInfo(code).description;
}

std::string FlagStoreException::generateCorrelationId() {
    static thread_local std::mt19937 gen(std::random_device{}());
    static thread_local std::uniform_int_distribution<> dis(0, 15);

    std::stringstream ss;
    for (int i = 0; i < 8; ++i) {
        ss << std::hex << dis(gen);
    }
    return ss.str();
}

FlagStoreException::FlagStoreException(ErrorCode code, std::string message, ErrorContext context)
    : errorCode_(code), message_(std::move(message)), context_(std::move(context)),
      correlationId_(generateCorrelationId()), timestamp_(std::chrono::system_clock::now()) {
}

std::string FlagStoreException::toLogString() const {
    std::stringstream ss;
    ss << "[" << correlationId_ << "] "
       << "ErrorCode=" << static_cast<int>(errorCode_) << " "
       << "Message=\"" << message_ << "\"";

    if (!context_.empty()) {
        ss << " Context={";
        bool first = true;
        for (const auto& [key, value] : context_) {
            if (!first) ss << ", ";
            ss << key << "=\"" << value << "\"";
            first = false;
        }
        ss << "}";
    }

    return ss.str();
}

std::string FlagStoreException::toJsonString() const {
    nlohmann::json out = {
        {"correlationId", correlationId_},
        {"errorCode", static_cast<int>(errorCode_)},
        {"message", message_},
        {"timestamp", std::chrono::duration_cast<std::chrono::milliseconds>(
                          timestamp_.time_since_epoch()).count()}
    };
    if (!context_.empty()) {
        nlohmann::json context = nlohmann::json::object();
        for (const auto& [key, value] : context_) {
            context[key] = value;
        }
        out["context"] = std::move(context);
    }
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void FlagStoreException::addContext(const std::string& key, const std::string& value) {
    context_[key] = value;
}

void FlagStoreException::setCorrelationId(const std::string& correlationId) {
    correlationId_ = correlationId;
}

// ValidationException implementation
ValidationException::ValidationException(ErrorCode code, std::string message,
                                         std::string field, std::string value,
                                         ErrorContext context)
    : FlagStoreException(code, std::move(message), std::move(context)),
      field_(std::move(field)), value_(std::move(value)) {

    if (!field_.empty()) {
        addContext("field", field_);
    }
    if (!value_.empty()) {
        addContext("value", value_);
    }
}

std::string ValidationException::toLogString() const {
    std::stringstream ss;
    ss << "[VALIDATION] " << FlagStoreException::toLogString();
    if (!field_.empty()) {
        ss << " Field=\"" << field_ << "\"";
    }
    return ss.str();
}

// SystemException implementation
SystemException::SystemException(ErrorCode code, std::string message,
                                 std::string component, ErrorContext context)
    : FlagStoreException(code, std::move(message), std::move(context)),
      component_(std::move(component)) {

    if (!component_.empty()) {
        addContext("component", component_);
    }
}

std::string SystemException::toLogString() const {
    std::stringstream ss;
    ss << "[SYSTEM] " << FlagStoreException::toLogString();
    if (!component_.empty()) {
        ss << " Component=\"" << component_ << "\"";
    }
    return ss.str();
}

ValidationException createValidationError(const std::string& field,
                                          const std::string& value,
                                          const std::string& reason) {
    return ValidationException(ErrorCode::INVALID_INPUT,
                               "Invalid value for field '" + field + "': " + reason,
                               field, value);
}

SystemException createSystemError(ErrorCode code,
                                  const std::string& component,
                                  const std::string& details) {
    return SystemException(code, std::string(getErrorCodeDescription(code)) + ": " + details,
                           component);
}

bool isValidationError(const std::exception& ex) {
    return dynamic_cast<const ValidationException*>(&ex) != nullptr;
}

bool isSystemError(const std::exception& ex) {
    return dynamic_cast<const SystemException*>(&ex) != nullptr;
}

std::string describeException(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const FlagStoreException& e) {
        return e.toLogString();
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown exception";
    }
}

} // namespace flagstore
