#include <mcp_manager/rpc/wire_codec.hpp>

namespace mcp_manager {

namespace {

nlohmann::json ParamsOrEmpty(const nlohmann::json& params) {
    return params.is_null() ? nlohmann::json::object() : params;
}

} // anonymous namespace

std::string EncodeRequest(const RequestEnvelope& request) {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", request.method},
        {"params", ParamsOrEmpty(request.params)},
        {"id", request.id},
    };
    return j.dump();
}

std::string EncodeNotification(std::string_view method, const nlohmann::json& params) {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"method", std::string(method)},
        {"params", ParamsOrEmpty(params)},
    };
    return j.dump();
}

std::optional<ResponseEnvelope> DecodeResponse(std::string_view line) {
    auto j = nlohmann::json::parse(line.begin(), line.end(), nullptr, false);
    if (j.is_discarded() || !j.is_object()) {
        return std::nullopt;
    }

    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string()) {
        return std::nullopt;
    }

    auto id = j.find("id");
    if (id == j.end()) {
        return std::nullopt;
    }
    ResponseEnvelope response;
    if (id->is_number_unsigned()) {
        response.id = id->get<uint64_t>();
    } else if (id->is_number_integer() && id->get<int64_t>() >= 0) {
        response.id = static_cast<uint64_t>(id->get<int64_t>());
    } else {
        return std::nullopt;
    }

    if (j.contains("method")) {
        // A server-initiated request, not a reply.
        return std::nullopt;
    }

    auto result = j.find("result");
    auto error = j.find("error");
    if (error != j.end() && !error->is_null()) {
        response.error = *error;
    } else {
        response.result = (result != j.end()) ? *result : nlohmann::json();
    }
    return response;
}

} // namespace mcp_manager
