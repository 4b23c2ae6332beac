#include "protocol/jsonrpc.hpp"

namespace gemini_mcp::protocol {

using core::errors::ErrorCategory;
using nlohmann::json;

core::errors::Result<RequestEnvelope> parse_request_line(const std::string& line) {
    const json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return core::errors::ServerError{ErrorCategory::Input, "Line is not valid JSON.",
                                         "parse_error"};
    }
    if (!message.is_object()) {
        return core::errors::ServerError{ErrorCategory::Input,
                                         "JSON value is not a request object.",
                                         "invalid_request"};
    }

    RequestEnvelope request;
    const auto id_it = message.find("id");
    if (id_it != message.end()) {
        request.id = *id_it;
        request.has_id = true;
    }

    const auto method_it = message.find("method");
    if (method_it != message.end()) {
        request.method = *method_it;
    }

    const auto params_it = message.find("params");
    if (params_it != message.end() && !params_it->is_null()) {
        request.params = *params_it;
    }
    return request;
}

std::string method_name(const RequestEnvelope& request) {
    return display_value(request.method);
}

json make_result_response(const json& id, const json& result) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

json make_error_response(const json& id, const int code,
                         const std::string& message) {
    json response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

json make_error_response(const json& id, const core::errors::ServerError& error) {
    return make_error_response(id, to_rpc_code(error.category), error.message);
}

int to_rpc_code(const ErrorCategory category) {
    switch (category) {
        case ErrorCategory::Protocol:
            return kMethodNotFound;
        case ErrorCategory::Input:
            return kInvalidParams;
        case ErrorCategory::Execution:
        case ErrorCategory::Internal:
        default:
            return kInternalError;
    }
}

std::string serialize(const json& message) {
    return message.dump(-1, ' ', false, json::error_handler_t::replace);
}

json object_or_empty(const json& object, const std::string& key) {
    if (!object.is_object()) {
        return json::object();
    }
    const auto it = object.find(key);
    if (it == object.end() || !it->is_object()) {
        return json::object();
    }
    return *it;
}

std::string display_value(const json& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    return serialize(value);
}

}  // namespace gemini_mcp::protocol
