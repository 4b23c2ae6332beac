#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/server_errors.hpp"

namespace gemini_mcp::protocol {

inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

// One parsed request line. `method` keeps the raw JSON value so a missing or
// non-string method can still be echoed back in the error message.
struct RequestEnvelope {
    nlohmann::json id;
    nlohmann::json method;
    nlohmann::json params = nlohmann::json::object();
    bool has_id = false;
};

// Fails with code "parse_error" when the line is not JSON and
// "invalid_request" when it is JSON but not an object.
core::errors::Result<RequestEnvelope> parse_request_line(const std::string& line);

// The method name as a string; non-string values are rendered as compact JSON.
std::string method_name(const RequestEnvelope& request);

nlohmann::json make_result_response(const nlohmann::json& id,
                                    const nlohmann::json& result);

nlohmann::json make_error_response(const nlohmann::json& id, int code,
                                   const std::string& message);

nlohmann::json make_error_response(const nlohmann::json& id,
                                   const core::errors::ServerError& error);

int to_rpc_code(core::errors::ErrorCategory category);

// Compact single-line JSON; invalid UTF-8 is replaced rather than thrown on.
std::string serialize(const nlohmann::json& message);

// A missing key or a non-object value yields {}.
nlohmann::json object_or_empty(const nlohmann::json& object,
                               const std::string& key);

// Strings verbatim, anything else as compact JSON.
std::string display_value(const nlohmann::json& value);

}  // namespace gemini_mcp::protocol
