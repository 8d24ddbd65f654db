#pragma once
#include <exception>
#include <string>
#include <nlohmann/json.hpp>
#include "hooks.hpp"

constexpr unsigned kHttpOk = 200;
constexpr unsigned kHttpBadRequest = 400;
constexpr unsigned kHttpNotFound = 404;
constexpr unsigned kHttpInternalError = 500;

struct RouteResponse {
    unsigned status;
    nlohmann::json body;
};

// Status and body for a failure raised while serving a request:
// configuration and JSON errors are 400, command failures 500 with the
// failing command, item and completed count, anything else 500.
RouteResponse error_response(std::exception_ptr error);

RouteResponse not_found();

// Serves one daemon request. Failures are mapped through error_response.
RouteResponse handle_request(const std::string& method, const std::string& path, const std::string& body,
                             FileBatchPlugin& plugin, HookHost& host);
