#include "../include/orchestrator.hpp"
#include "../include/cluster_runner.hpp"
#include "../include/errors.hpp"
#include <iostream>

using json = nlohmann::json;

const char* unit_status_name(UnitStatus s) {
    switch (s) {
        case UnitStatus::Executed: return "executed";
        case UnitStatus::SkippedCached: return "skipped_cached";
        case UnitStatus::SkippedEmpty: return "skipped_empty";
    }
    return "unknown";
}

std::size_t RunSummary::completed() const {
    std::size_t n = 0;
    for (const auto& u : units) n += u.completed;
    return n;
}

json RunSummary::to_json() const {
    json arr = json::array();
    for (const auto& u : units) {
        arr.push_back({
            {"command", command_name(u.command)},
            {"status", unit_status_name(u.status)},
            {"items", u.items},
            {"completed", u.completed},
            {"workers", u.workers}
        });
    }
    return json{{"units", arr}, {"completed", completed()}};
}

BatchOrchestrator::BatchOrchestrator(const CommandSet& commands, FingerprintStore& cache, ProgressSink* progress)
    : commands_(commands), cache_(cache), progress_(progress) {}

std::vector<DispatchUnit> BatchOrchestrator::plan(const CommandBatch& batch, const json& global_options) const {
    if (!global_options.is_null() && !global_options.is_object()) {
        throw BatchConfigError("options must be an object");
    }
    std::vector<DispatchUnit> units;
    for (const auto& entry : batch) {
        auto command = parse_command(entry.name);
        if (!command) continue;

        DispatchUnit unit;
        unit.command = *command;
        unit.items = entry.items;
        unit.options = merge_options(global_options, entry.options);
        unit.workers = resolve_workers(unit.options);
        unit.cache_enabled = option_flag(unit.options, "cache", true);
        unit.progress_enabled = option_flag(unit.options, "progress", false);
        unit.fingerprint = fingerprint(unit.items);

        if (unit.items.empty()) {
            unit.status = UnitStatus::SkippedEmpty;
        } else if (unit.cache_enabled && cache_.get(unit.command) == unit.fingerprint) {
            unit.status = UnitStatus::SkippedCached;
        }
        units.push_back(std::move(unit));
    }
    return units;
}

RunSummary BatchOrchestrator::run(const CommandBatch& batch, const json& global_options) {
    auto units = plan(batch, global_options);

    if (progress_) {
        std::size_t total = 0;
        for (const auto& u : units) {
            if (u.status == UnitStatus::Executed && u.progress_enabled) total += u.items.size();
        }
        if (total > 0) progress_->add_total(total);
    }

    RunSummary summary;
    for (const auto& unit : units) {
        UnitResult result;
        result.command = unit.command;
        result.status = unit.status;
        result.items = unit.items.size();
        result.workers = unit.workers;

        if (unit.status != UnitStatus::Executed) {
            std::cout << "[filebatch] " << command_name(unit.command) << ": skipped ("
                      << (unit.status == UnitStatus::SkippedEmpty ? "no items" : "unchanged") << ")" << std::endl;
            summary.units.push_back(result);
            continue;
        }

        if (unit.workers > 0) {
            try {
                result.completed = run_parallel(unit.items, unit.workers, unit.command, unit.options, commands_);
            } catch (const CommandError& e) {
                if (progress_ && unit.progress_enabled && e.completed() > 0) progress_->advance(e.completed());
                throw;
            }
            if (progress_ && unit.progress_enabled && result.completed > 0) progress_->advance(result.completed);
        } else {
            result.completed = run_sequential(unit);
        }

        if (unit.cache_enabled) cache_.set(unit.command, unit.fingerprint);
        std::cout << "[filebatch] " << command_name(unit.command) << ": " << result.completed << " items done"
                  << std::endl;
        summary.units.push_back(result);
    }
    return summary;
}

std::size_t BatchOrchestrator::run_sequential(const DispatchUnit& unit) {
    std::size_t done = 0;
    for (std::size_t i = 0; i < unit.items.size(); ++i) {
        try {
            commands_.execute(unit.command, unit.items[i], unit.options);
        } catch (const std::exception& e) {
            std::cerr << "[filebatch] " << command_name(unit.command) << ": item " << i << " failed: "
                      << e.what() << std::endl;
            throw CommandError(unit.command, i, e.what(), done);
        } catch (...) {
            std::cerr << "[filebatch] " << command_name(unit.command) << ": item " << i
                      << " failed: unknown error" << std::endl;
            throw CommandError(unit.command, i, "unknown error", done);
        }
        ++done;
        if (progress_ && unit.progress_enabled) progress_->advance(1);
    }
    return done;
}
