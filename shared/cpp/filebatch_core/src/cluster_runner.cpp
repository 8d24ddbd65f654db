#include "../include/cluster_runner.hpp"
#include "../include/errors.hpp"
#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <iostream>
#include <stdexcept>

namespace {
struct WorkerReport {
    std::size_t completed{0};
    std::size_t failed_index{0};
    std::exception_ptr error;
};

WorkerReport run_slice(const nlohmann::json& items,
                       std::size_t begin,
                       std::size_t end,
                       Command command,
                       const nlohmann::json& options,
                       const CommandSet& commands,
                       std::atomic<bool>& abort) {
    WorkerReport report;
    for (std::size_t i = begin; i < end; ++i) {
        if (abort.load()) break;
        try {
            commands.execute(command, items[i], options);
        } catch (...) {
            report.failed_index = i;
            report.error = std::current_exception();
            abort.store(true);
            break;
        }
        ++report.completed;
    }
    return report;
}

std::string reason_of(const std::exception_ptr& error) {
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}
}

std::vector<std::pair<std::size_t, std::size_t>> partition_slices(std::size_t count, unsigned workers) {
    std::vector<std::pair<std::size_t, std::size_t>> slices;
    if (count == 0 || workers == 0) return slices;
    std::size_t n = std::min<std::size_t>(workers, count);
    std::size_t base = count / n, extra = count % n, begin = 0;
    slices.reserve(n);
    for (std::size_t w = 0; w < n; ++w) {
        std::size_t size = base + (w < extra ? 1 : 0);
        slices.emplace_back(begin, begin + size);
        begin += size;
    }
    return slices;
}

std::size_t run_parallel(const nlohmann::json& items,
                         unsigned workers,
                         Command command,
                         const nlohmann::json& options,
                         const CommandSet& commands) {
    if (!items.is_array()) throw std::invalid_argument("run_parallel: items must be an array");
    if (workers == 0) throw std::invalid_argument("run_parallel: workers must be positive");

    auto slices = partition_slices(items.size(), workers);
    std::cout << "[cluster] " << command_name(command) << ": " << items.size() << " items on "
              << slices.size() << " workers" << std::endl;

    std::atomic<bool> abort{false};
    std::vector<std::future<WorkerReport>> running;
    running.reserve(slices.size());
    for (const auto& s : slices) {
        running.push_back(std::async(std::launch::async, run_slice, std::cref(items), s.first, s.second,
                                     command, std::cref(options), std::cref(commands), std::ref(abort)));
    }

    std::size_t completed = 0;
    const WorkerReport* first_failure = nullptr;
    std::vector<WorkerReport> reports;
    reports.reserve(running.size());
    for (auto& f : running) reports.push_back(f.get());
    for (const auto& r : reports) {
        completed += r.completed;
        if (r.error && (!first_failure || r.failed_index < first_failure->failed_index)) first_failure = &r;
    }

    if (first_failure) {
        std::string reason = reason_of(first_failure->error);
        std::cerr << "[cluster] " << command_name(command) << ": item " << first_failure->failed_index
                  << " failed: " << reason << " (" << completed << " completed)" << std::endl;
        throw CommandError(command, first_failure->failed_index, reason, completed);
    }
    return completed;
}
