#pragma once
#include <cstddef>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>
#include "command.hpp"

// [begin, end) ranges of `count` items split into `workers` contiguous
// slices whose sizes differ by at most one. Never more slices than items.
std::vector<std::pair<std::size_t, std::size_t>> partition_slices(std::size_t count, unsigned workers);

// Runs `items` on min(workers, items.size()) threads, one contiguous slice
// per thread, each slice in order. After a failure no worker starts another
// item; items already running are allowed to finish. Returns the number of
// items that completed, or throws CommandError for the lowest failing index.
std::size_t run_parallel(const nlohmann::json& items,
                         unsigned workers,
                         Command command,
                         const nlohmann::json& options,
                         const CommandSet& commands);
