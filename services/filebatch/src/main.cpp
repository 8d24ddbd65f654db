#include <iostream>
#include <fstream>
#include <sstream>
#include <string>
#include <memory>
#include <cstdlib>
#include <cstring>
#include <csignal>
#include <unistd.h>
#include <microhttpd.h>
#include <nlohmann/json.hpp>
#include "../include/hooks.hpp"
#include "../include/routes.hpp"
#include "../../../shared/cpp/file_ops/include/file_ops.hpp"

using ordered_json = nlohmann::ordered_json;

#if MHD_VERSION >= 0x00097002
using MhdResult = enum MHD_Result;
#else
using MhdResult = int;
#endif

static const std::vector<std::string> kLifecycleHooks = {
    "beforeRun", "run", "beforeCompile", "compile", "emit", "afterEmit", "done"
};

static CommandSet g_commands = make_file_command_set();
static InMemoryFingerprintStore g_cache;
static HookHost g_host(kLifecycleHooks);
static std::unique_ptr<FileBatchPlugin> g_plugin;

static std::string getenv_or(const char* key, const std::string& def) {
    const char* v = std::getenv(key);
    return v ? std::string(v) : def;
}

struct ConnInfo {
    std::string method;
    std::string url;
    std::string body;
};

static MhdResult send_response(struct MHD_Connection* conn, unsigned int status, const std::string& body,
                               const char* ctype = "application/json") {
    struct MHD_Response* resp = MHD_create_response_from_buffer(body.size(), (void*)body.data(), MHD_RESPMEM_MUST_COPY);
    if (!resp) return MHD_NO;
    MHD_add_response_header(resp, MHD_HTTP_HEADER_CONTENT_TYPE, ctype);
    MhdResult ret = MHD_queue_response(conn, status, resp);
    MHD_destroy_response(resp);
    return ret;
}

static void request_completed(void* /*cls*/, struct MHD_Connection* /*connection*/, void** con_cls,
                              enum MHD_RequestTerminationCode /*toe*/) {
    delete static_cast<ConnInfo*>(*con_cls);
    *con_cls = nullptr;
}

static MhdResult handler(void* /*cls*/, struct MHD_Connection* connection, const char* url, const char* method,
                         const char* /*version*/, const char* upload_data, size_t* upload_data_size, void** con_cls) {
    ConnInfo* ci = static_cast<ConnInfo*>(*con_cls);
    if (!ci) {
        ci = new ConnInfo{method, url, {}};
        *con_cls = ci;
        return MHD_YES;
    }

    if (0 == strcmp(method, MHD_HTTP_METHOD_POST)) {
        if (*upload_data_size) {
            ci->body.append(upload_data, *upload_data_size);
            *upload_data_size = 0;
            return MHD_YES;
        }
    }

    RouteResponse r = handle_request(ci->method, url, ci->body, *g_plugin, g_host);
    return send_response(connection, r.status, r.body.dump());
}

static ordered_json load_config(const std::string& path) {
    if (path.empty()) return ordered_json::object();
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open config " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ordered_json::parse(ss.str());
}

int main(int, char**) {
    int port = 7100;
    if (const char* p = std::getenv("FILEBATCH_PORT")) {
        try {
            port = std::stoi(p);
        } catch (const std::exception&) {
            std::cerr << "[filebatch] Ignoring invalid FILEBATCH_PORT=" << p << std::endl;
        }
    }
    const std::string config_path = getenv_or("FILEBATCH_CONFIG", "");

    try {
        g_plugin = std::make_unique<FileBatchPlugin>(load_config(config_path), g_commands, g_cache, std::cerr);
    } catch (const std::exception& e) {
        std::cerr << "[filebatch] Invalid configuration: " << e.what() << std::endl;
        return 1;
    }
    std::size_t registered = g_plugin->apply(g_host);
    std::cout << "[filebatch] Registered " << registered << " hooks, "
              << count_total_tasks(g_plugin->bindings()) << " tasks"
              << (config_path.empty() ? "" : " from " + config_path) << std::endl;

    std::cout << "[filebatch] Starting HTTP server on port " << port << "...\n";
    struct MHD_Daemon* d = MHD_start_daemon(MHD_USE_AUTO | MHD_USE_INTERNAL_POLLING_THREAD, port, nullptr, nullptr,
                                            &handler, nullptr,
                                            MHD_OPTION_NOTIFY_COMPLETED, &request_completed, nullptr,
                                            MHD_OPTION_END);
    if (!d) {
        std::cerr << "[filebatch] Failed to start HTTP server" << std::endl;
        return 1;
    }
    std::signal(SIGTERM, [](int){ /* allow graceful stop */ });
    std::signal(SIGINT, [](int){ /* allow graceful stop */ });
    pause();
    MHD_stop_daemon(d);
    g_plugin.reset();
    return 0;
}
