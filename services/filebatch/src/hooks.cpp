#include "../include/hooks.hpp"
#include "../../../shared/cpp/filebatch_core/include/errors.hpp"
#include <chrono>
#include <iostream>
#include <stdexcept>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace {
const char* const kRegisterPrefix = "REGISTER_";
const char* const kProgressTask = "file manager";

struct BuiltinEvent {
    const char* event;
    const char* hook_type;
    const char* hook_name;
};

const BuiltinEvent kBuiltinEvents[] = {
    {"start", "tapAsync", "beforeRun"},
    {"end", "tapAsync", "afterEmit"},
};

std::string string_field(const ordered_json& obj, const char* key, const std::string& where) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return {};
    if (!it->is_string()) throw BatchConfigError(where + "." + key + " must be a string");
    return it->get<std::string>();
}

std::future<void> without_result(std::future<RunSummary> f) {
    return std::async(std::launch::deferred, [shared = f.share()] { shared.get(); });
}
}

std::optional<HookType> parse_hook_type(const std::string& name) {
    if (name == "tap") return HookType::Tap;
    if (name == "tapAsync") return HookType::TapAsync;
    if (name == "tapPromise") return HookType::TapPromise;
    return std::nullopt;
}

const char* hook_type_name(HookType t) {
    switch (t) {
        case HookType::Tap: return "tap";
        case HookType::TapAsync: return "tapAsync";
        case HookType::TapPromise: return "tapPromise";
    }
    return "unknown";
}

std::vector<HookBinding> translate_hooks(const ordered_json& config) {
    std::vector<HookBinding> out;
    if (config.is_null()) return out;
    if (!config.is_object()) throw BatchConfigError("configuration must be an object");

    auto custom = config.find("customHooks");
    if (custom != config.end() && !custom->is_null() && !custom->is_array()) {
        throw BatchConfigError("customHooks must be an array");
    }
    if (custom != config.end() && custom->is_array() && !custom->empty()) {
        for (std::size_t i = 0; i < custom->size(); ++i) {
            const auto& hook = (*custom)[i];
            std::string where = "customHooks[" + std::to_string(i) + "]";
            if (!hook.is_object()) throw BatchConfigError(where + " must be an object");
            HookBinding b;
            b.hook_type = string_field(hook, "hookType", where);
            b.hook_name = string_field(hook, "hookName", where);
            if (b.hook_name.empty()) throw BatchConfigError(where + ".hookName is required");
            b.register_name = string_field(hook, "registerName", where);
            if (b.register_name.empty()) b.register_name = kRegisterPrefix + b.hook_name;
            b.commands = parse_batch(hook.contains("commands") ? hook["commands"] : ordered_json());
            out.push_back(std::move(b));
        }
        return out;
    }

    auto events = config.find("events");
    if (events == config.end() || events->is_null()) return out;
    if (!events->is_object()) throw BatchConfigError("events must be an object");
    for (auto it = events->begin(); it != events->end(); ++it) {
        if (it.value().is_null()) continue;
        for (const auto& builtin : kBuiltinEvents) {
            if (it.key() != builtin.event) continue;
            HookBinding b;
            b.hook_type = builtin.hook_type;
            b.hook_name = builtin.hook_name;
            b.register_name = std::string(kRegisterPrefix) + builtin.hook_name;
            b.commands = parse_batch(it.value());
            out.push_back(std::move(b));
        }
    }
    return out;
}

std::size_t count_total_tasks(const std::vector<HookBinding>& bindings) {
    std::size_t total = 0;
    for (const auto& b : bindings) {
        if (!parse_hook_type(b.hook_type)) continue;
        for (const auto& entry : b.commands) {
            if (parse_command(entry.name)) total += entry.items.size();
        }
    }
    return total;
}

// ---- HookHost ----

HookHost::HookHost(const std::vector<std::string>& hook_names) {
    for (const auto& n : hook_names) hooks_[n];
}

std::vector<HookHost::Tap>& HookHost::slot(const std::string& hook) {
    auto it = hooks_.find(hook);
    if (it == hooks_.end()) throw std::out_of_range("unknown hook '" + hook + "'");
    return it->second;
}

void HookHost::tap(const std::string& hook, const std::string& name, SyncTap fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    slot(hook).push_back(Tap{HookType::Tap, name, std::move(fn), nullptr, nullptr});
}

void HookHost::tap_async(const std::string& hook, const std::string& name, AsyncTap fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    slot(hook).push_back(Tap{HookType::TapAsync, name, nullptr, std::move(fn), nullptr});
}

void HookHost::tap_promise(const std::string& hook, const std::string& name, PromiseTap fn) {
    std::lock_guard<std::mutex> lock(mtx_);
    slot(hook).push_back(Tap{HookType::TapPromise, name, nullptr, nullptr, std::move(fn)});
}

std::size_t HookHost::call(const std::string& hook) {
    std::vector<Tap> taps;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        auto it = hooks_.find(hook);
        if (it == hooks_.end()) return 0;
        taps = it->second;
    }
    for (const auto& t : taps) {
        switch (t.type) {
            case HookType::Tap:
                t.sync();
                break;
            case HookType::TapPromise:
                t.promise().get();
                break;
            case HookType::TapAsync: {
                auto done = std::make_shared<std::promise<void>>();
                auto finished = done->get_future();
                t.async([done](std::exception_ptr error) {
                    if (error) done->set_exception(error);
                    else done->set_value();
                });
                finished.get();
                break;
            }
        }
    }
    return taps.size();
}

std::vector<std::string> HookHost::hook_names() const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    for (const auto& kv : hooks_) out.push_back(kv.first);
    return out;
}

std::vector<std::string> HookHost::tap_names(const std::string& hook) const {
    std::lock_guard<std::mutex> lock(mtx_);
    std::vector<std::string> out;
    auto it = hooks_.find(hook);
    if (it == hooks_.end()) return out;
    for (const auto& t : it->second) out.push_back(t.name);
    return out;
}

// ---- FileBatchPlugin ----

FileBatchPlugin::FileBatchPlugin(const ordered_json& config, const CommandSet& commands, FingerprintStore& cache,
                                 std::ostream& progress_out)
    : commands_(commands), cache_(cache), options_(json::object()) {
    if (config.is_object() && config.contains("options") && !config["options"].is_null()) {
        if (!config["options"].is_object()) throw BatchConfigError("options must be an object");
        options_ = json::parse(config["options"].dump());
    }
    bindings_ = translate_hooks(config);
    if (option_flag(options_, "progress", false)) {
        progress_ = std::make_unique<ConsoleProgress>(kProgressTask, progress_out);
    }
}

FileBatchPlugin::~FileBatchPlugin() {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    for (auto& f : pending_) f.wait();
}

std::future<RunSummary> FileBatchPlugin::run_async(const CommandBatch& batch, const json& global_options) {
    return std::async(std::launch::async, [this, batch, global_options] {
        std::lock_guard<std::mutex> lock(run_mtx_);
        BatchOrchestrator orchestrator(commands_, cache_, progress_.get());
        return orchestrator.run(batch, global_options);
    });
}

json FileBatchPlugin::cache_snapshot() {
    std::lock_guard<std::mutex> lock(run_mtx_);
    json out = json::object();
    for (Command c : all_commands()) {
        auto fp = cache_.get(c);
        out[command_name(c)] = fp ? json(*fp) : json(nullptr);
    }
    return out;
}

void FileBatchPlugin::track(std::future<void> f) {
    std::lock_guard<std::mutex> lock(pending_mtx_);
    for (auto it = pending_.begin(); it != pending_.end();) {
        if (it->wait_for(std::chrono::seconds(0)) == std::future_status::ready) it = pending_.erase(it);
        else ++it;
    }
    pending_.push_back(std::move(f));
}

std::size_t FileBatchPlugin::apply(HookHost& host) {
    std::size_t registered = 0;
    for (const auto& b : bindings_) {
        auto type = parse_hook_type(b.hook_type);
        if (!type) continue;
        const CommandBatch batch = b.commands;
        try {
            switch (*type) {
                case HookType::Tap:
                    host.tap(b.hook_name, b.register_name, [this, batch] {
                        run_async(batch, options_).get();
                    });
                    break;
                case HookType::TapPromise:
                    host.tap_promise(b.hook_name, b.register_name, [this, batch] {
                        return without_result(run_async(batch, options_));
                    });
                    break;
                case HookType::TapAsync:
                    host.tap_async(b.hook_name, b.register_name, [this, batch](HookHost::Done done) {
                        auto running = run_async(batch, options_);
                        track(std::async(std::launch::async, [running = std::move(running), done]() mutable {
                            std::exception_ptr error;
                            try {
                                running.get();
                            } catch (...) {
                                error = std::current_exception();
                            }
                            done(error);
                        }));
                    });
                    break;
            }
            ++registered;
        } catch (const std::exception& e) {
            std::cerr << "[filebatch] File manager error: " << e.what() << std::endl;
        }
    }
    return registered;
}
