#include "../include/batch.hpp"
#include "../include/command.hpp"
#include "../include/errors.hpp"
#include <cstdint>
#include <limits>
#include <thread>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

static json to_sorted(const ordered_json& v) {
    return json::parse(v.dump());
}

CommandBatch parse_batch(const ordered_json& commands) {
    CommandBatch batch;
    if (commands.is_null()) return batch;
    if (!commands.is_object()) {
        throw BatchConfigError("commands must be an object, got " + std::string(commands.type_name()));
    }
    for (auto it = commands.begin(); it != commands.end(); ++it) {
        CommandEntry entry;
        entry.name = it.key();
        const auto& body = it.value();
        if (!parse_command(entry.name)) {
            batch.push_back(std::move(entry));
            continue;
        }
        if (body.is_null()) {
            batch.push_back(std::move(entry));
            continue;
        }
        if (!body.is_object()) {
            throw BatchConfigError("'" + entry.name + "' must be an object with items and options");
        }
        if (body.contains("items") && !body["items"].is_null()) {
            if (!body["items"].is_array()) {
                throw BatchConfigError("'" + entry.name + ".items' must be an array");
            }
            entry.items = to_sorted(body["items"]);
        }
        if (body.contains("options") && !body["options"].is_null()) {
            if (!body["options"].is_object()) {
                throw BatchConfigError("'" + entry.name + ".options' must be an object");
            }
            entry.options = to_sorted(body["options"]);
        }
        batch.push_back(std::move(entry));
    }
    return batch;
}

json merge_options(const json& global, const json& local) {
    json merged = global.is_object() ? global : json::object();
    if (local.is_object()) {
        for (auto it = local.begin(); it != local.end(); ++it) merged[it.key()] = it.value();
    }
    return merged;
}

unsigned resolve_workers(const json& options) {
    auto it = options.find("parallel");
    if (it == options.end() || it->is_null()) return 0;
    if (it->is_boolean()) {
        if (!it->get<bool>()) return 0;
        unsigned hw = std::thread::hardware_concurrency();
        return hw == 0 ? 1 : hw;
    }
    constexpr unsigned max_workers = std::numeric_limits<unsigned>::max();
    if (it->is_number_unsigned()) {
        auto n = it->get<std::uint64_t>();
        return n > max_workers ? max_workers : static_cast<unsigned>(n);
    }
    if (it->is_number_integer()) {
        auto n = it->get<long long>();
        if (n < 0) throw BatchConfigError("parallel must not be negative: " + std::to_string(n));
        return static_cast<unsigned long long>(n) > max_workers ? max_workers : static_cast<unsigned>(n);
    }
    throw BatchConfigError("parallel must be a worker count or a boolean, got " + std::string(it->type_name()));
}

bool option_flag(const json& options, const char* key, bool fallback) {
    auto it = options.find(key);
    if (it == options.end() || it->is_null()) return fallback;
    if (!it->is_boolean()) {
        throw BatchConfigError(std::string(key) + " must be a boolean, got " + it->type_name());
    }
    return it->get<bool>();
}
