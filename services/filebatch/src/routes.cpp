#include "../include/routes.hpp"
#include <iostream>
#include "../../../shared/cpp/filebatch_core/include/errors.hpp"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {
json describe_bindings(const FileBatchPlugin& plugin) {
    json arr = json::array();
    for (const auto& b : plugin.bindings()) {
        json commands = json::array();
        for (const auto& entry : b.commands) {
            commands.push_back({{"command", entry.name}, {"items", entry.items.size()}});
        }
        arr.push_back({
            {"hookType", b.hook_type},
            {"hookName", b.hook_name},
            {"registerName", b.register_name},
            {"commands", commands}
        });
    }
    return json{{"bindings", arr}, {"total_tasks", count_total_tasks(plugin.bindings())}};
}

RouteResponse run_batch(const std::string& body, FileBatchPlugin& plugin) {
    auto j = ordered_json::parse(body.empty() ? std::string("{}") : body);
    if (!j.is_object()) throw BatchConfigError("request body must be an object");
    CommandBatch batch = parse_batch(j.contains("commands") ? j["commands"] : ordered_json());
    json options = j.contains("options") ? json::parse(j["options"].dump()) : json::object();
    auto summary = plugin.run_async(batch, options).get();
    return {kHttpOk, summary.to_json()};
}
}

RouteResponse error_response(std::exception_ptr error) {
    try {
        std::rethrow_exception(error);
    } catch (const BatchConfigError& e) {
        return {kHttpBadRequest, {{"error", e.what()}}};
    } catch (const json::exception& e) {
        return {kHttpBadRequest, {{"error", e.what()}}};
    } catch (const CommandError& e) {
        std::cerr << "[filebatch] " << e.what() << std::endl;
        return {kHttpInternalError, {
            {"error", e.what()},
            {"command", command_name(e.command())},
            {"item", e.item()},
            {"completed", e.completed()}
        }};
    } catch (const std::exception& e) {
        std::cerr << "[filebatch] " << e.what() << std::endl;
        return {kHttpInternalError, {{"error", e.what()}}};
    } catch (...) {
        std::cerr << "[filebatch] unknown error" << std::endl;
        return {kHttpInternalError, {{"error", "unknown error"}}};
    }
}

RouteResponse not_found() {
    return {kHttpNotFound, {{"error", "not found"}}};
}

RouteResponse handle_request(const std::string& method, const std::string& path, const std::string& body,
                             FileBatchPlugin& plugin, HookHost& host) {
    try {
        if (method == "POST" && path == "/run") {
            return run_batch(body, plugin);
        }
        if (method == "POST" && path.rfind("/hooks/", 0) == 0) {
            std::string hook = path.substr(std::string("/hooks/").size());
            if (hook.empty()) return {kHttpBadRequest, {{"error", "hook name required"}}};
            std::size_t taps = host.call(hook);
            std::cout << "[filebatch] Hook " << hook << " ran " << taps << " taps" << std::endl;
            return {kHttpOk, {{"ok", true}, {"hook", hook}, {"taps", taps}}};
        }
        if (method == "GET" && path == "/hooks") {
            return {kHttpOk, describe_bindings(plugin)};
        }
        if (method == "GET" && path == "/cache") {
            return {kHttpOk, plugin.cache_snapshot()};
        }
        if (method == "GET" && path == "/progress") {
            const ConsoleProgress* p = plugin.progress();
            return {kHttpOk, p ? json({{"enabled", true}, {"done", p->done()}, {"total", p->total()}})
                               : json({{"enabled", false}})};
        }
        return not_found();
    } catch (...) {
        return error_response(std::current_exception());
    }
}
