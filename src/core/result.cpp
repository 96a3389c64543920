#include <mcp_manager/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace mcp_manager {

namespace {

// Pull a short human-readable reason out of an HTTP error body. JSON bodies
// of the form {"error": "..."} or {"error": {"message": "..."}} or
// {"message": "..."} are understood; anything else is used verbatim when short.
std::optional<std::string> ExtractBodyReason(const std::string& body) {
    if (body.empty()) return std::nullopt;

    auto j = nlohmann::json::parse(body, nullptr, false);
    if (!j.is_discarded() && j.is_object()) {
        if (j.contains("error")) {
            const auto& e = j["error"];
            if (e.is_string()) return e.get<std::string>();
            if (e.is_object() && e.contains("message") && e["message"].is_string()) {
                return e["message"].get<std::string>();
            }
        }
        if (j.contains("message") && j["message"].is_string()) {
            return j["message"].get<std::string>();
        }
        return std::nullopt;
    }

    constexpr size_t kMaxPlainReason = 200;
    if (body.size() <= kMaxPlainReason && body.find('<') == std::string::npos) {
        auto end = body.find_last_not_of(" \r\n\t");
        return body.substr(0, end + 1);
    }
    return std::nullopt;
}

} // anonymous namespace

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto reason = ExtractBodyReason(response_body);

    ErrorCategory category = ErrorCategory::HttpStatus;
    std::string message;

    switch (status_code) {
        case 400:
            message = "Bad request";
            break;
        case 401:
            message = "Unauthorized";
            break;
        case 403:
            message = "Forbidden";
            break;
        case 404:
            message = "Not found";
            break;
        case 405:
            message = "Method not allowed";
            break;
        case 408:
            category = ErrorCategory::Timeout;
            message = "Request timed out";
            break;
        case 429:
            message = "Too many requests";
            break;
        case 500:
            message = "Server internal error";
            break;
        case 502:
        case 503:
        case 504:
            category = ErrorCategory::Connection;
            message = "Server unavailable";
            break;
        default:
            message = "Unexpected HTTP " + std::to_string(status_code);
            break;
    }
    if (reason.has_value() && !reason->empty()) {
        message += ": " + *reason;
    }

    return Error{operation, endpoint, status_code, message, std::nullopt,
                 std::nullopt, category};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    if (rpc_code.has_value()) {
        oss << " (RPC " << *rpc_code << ")";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json body = {
        {"category", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!endpoint.empty()) {
        body["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        body["http_status"] = *http_status;
    }
    if (rpc_code.has_value()) {
        body["rpc_code"] = *rpc_code;
    }
    if (rpc_error.has_value()) {
        auto payload = nlohmann::json::parse(*rpc_error, nullptr, false);
        body["rpc_error"] = payload.is_discarded() ? nlohmann::json(*rpc_error)
                                                   : payload;
    }
    return nlohmann::json{{"error", body}}.dump();
}

} // namespace mcp_manager
