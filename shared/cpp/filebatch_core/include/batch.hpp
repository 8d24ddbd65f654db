#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

// One `{items, options}` pair of a batch. `items` is always an array and
// `options` always an object once parsed.
struct CommandEntry {
    std::string name;
    nlohmann::json items = nlohmann::json::array();
    nlohmann::json options = nlohmann::json::object();
};

// Entries in submission order; that order is the execution order.
using CommandBatch = std::vector<CommandEntry>;

// Parses the `commands` object of a request. Unrecognized command names are
// kept verbatim and left unvalidated. Throws BatchConfigError.
CommandBatch parse_batch(const nlohmann::ordered_json& commands);

// Shallow merge; keys of `local` win.
nlohmann::json merge_options(const nlohmann::json& global, const nlohmann::json& local);

// Worker count from the `parallel` option; 0 means sequential.
unsigned resolve_workers(const nlohmann::json& options);

bool option_flag(const nlohmann::json& options, const char* key, bool fallback);
