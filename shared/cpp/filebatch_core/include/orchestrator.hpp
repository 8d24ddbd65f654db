#pragma once
#include <cstddef>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "batch.hpp"
#include "command.hpp"
#include "fingerprint_store.hpp"
#include "progress.hpp"

enum class UnitStatus {
    Executed,
    SkippedCached,
    SkippedEmpty
};

const char* unit_status_name(UnitStatus s);

// One command's resolved work package.
struct DispatchUnit {
    Command command{Command::Copy};
    nlohmann::json items = nlohmann::json::array();
    nlohmann::json options = nlohmann::json::object();
    unsigned workers{0}; // 0 = sequential
    bool cache_enabled{true};
    bool progress_enabled{false};
    std::string fingerprint;
    UnitStatus status{UnitStatus::Executed};
};

struct UnitResult {
    Command command{Command::Copy};
    UnitStatus status{UnitStatus::Executed};
    std::size_t items{0};
    std::size_t completed{0};
    unsigned workers{0};
};

struct RunSummary {
    std::vector<UnitResult> units;

    std::size_t completed() const;
    nlohmann::json to_json() const;
};

class BatchOrchestrator {
public:
    BatchOrchestrator(const CommandSet& commands, FingerprintStore& cache, ProgressSink* progress = nullptr);

    // Validates the whole batch and resolves every recognized command
    // without executing anything. Throws BatchConfigError.
    std::vector<DispatchUnit> plan(const CommandBatch& batch, const nlohmann::json& global_options) const;

    // Runs the batch in order, stopping at the first failing command
    // (CommandError). The cache entry of a command is written only after
    // all of its items succeed.
    RunSummary run(const CommandBatch& batch, const nlohmann::json& global_options);

private:
    std::size_t run_sequential(const DispatchUnit& unit);

    const CommandSet& commands_;
    FingerprintStore& cache_;
    ProgressSink* progress_;
};
