#pragma once
#include <exception>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/filebatch_core/include/batch.hpp"
#include "../../../shared/cpp/filebatch_core/include/command.hpp"
#include "../../../shared/cpp/filebatch_core/include/fingerprint_store.hpp"
#include "../../../shared/cpp/filebatch_core/include/orchestrator.hpp"
#include "../../../shared/cpp/filebatch_core/include/progress.hpp"

enum class HookType {
    Tap,        // blocking
    TapAsync,   // callback with continuation
    TapPromise  // returns a future
};

std::optional<HookType> parse_hook_type(const std::string& name);
const char* hook_type_name(HookType t);

struct HookBinding {
    std::string hook_type; // as configured; may be unrecognized
    std::string hook_name;
    std::string register_name;
    CommandBatch commands;
};

// Builds bindings from `{events, customHooks}`. Non-empty customHooks replace
// events. Throws BatchConfigError on malformed entries.
std::vector<HookBinding> translate_hooks(const nlohmann::ordered_json& config);

// Items of recognized commands over bindings with a recognized hook type.
std::size_t count_total_tasks(const std::vector<HookBinding>& bindings);

// Named lifecycle hooks with taps in registration order.
class HookHost {
public:
    using Done = std::function<void(std::exception_ptr)>;
    using SyncTap = std::function<void()>;
    using AsyncTap = std::function<void(Done)>;
    using PromiseTap = std::function<std::future<void>()>;

    explicit HookHost(const std::vector<std::string>& hook_names);

    // Throw std::out_of_range for a hook the host does not expose.
    void tap(const std::string& hook, const std::string& name, SyncTap fn);
    void tap_async(const std::string& hook, const std::string& name, AsyncTap fn);
    void tap_promise(const std::string& hook, const std::string& name, PromiseTap fn);

    // Runs every tap of `hook`, waiting for each; the first failure is
    // rethrown and later taps do not run. Returns the number of taps run.
    std::size_t call(const std::string& hook);

    std::vector<std::string> hook_names() const;
    std::vector<std::string> tap_names(const std::string& hook) const;

private:
    struct Tap {
        HookType type;
        std::string name;
        SyncTap sync;
        AsyncTap async;
        PromiseTap promise;
    };

    std::vector<Tap>& slot(const std::string& hook);

    mutable std::mutex mtx_;
    std::map<std::string, std::vector<Tap>> hooks_;
};

// Registers configured command batches against a HookHost. All runs go
// through one asynchronous operation and are serialized.
class FileBatchPlugin {
public:
    FileBatchPlugin(const nlohmann::ordered_json& config, const CommandSet& commands, FingerprintStore& cache,
                    std::ostream& progress_out);
    ~FileBatchPlugin();

    // Returns the number of taps registered.
    std::size_t apply(HookHost& host);

    std::future<RunSummary> run_async(const CommandBatch& batch, const nlohmann::json& global_options);

    nlohmann::json cache_snapshot();

    const std::vector<HookBinding>& bindings() const { return bindings_; }
    const nlohmann::json& global_options() const { return options_; }
    const ConsoleProgress* progress() const { return progress_.get(); }

private:
    void track(std::future<void> f);

    const CommandSet& commands_;
    FingerprintStore& cache_;
    nlohmann::json options_;
    std::vector<HookBinding> bindings_;
    std::unique_ptr<ConsoleProgress> progress_;
    std::mutex run_mtx_;
    std::mutex pending_mtx_;
    std::vector<std::future<void>> pending_;
};
