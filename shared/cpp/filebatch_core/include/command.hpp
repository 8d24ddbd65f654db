#pragma once
#include <array>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

enum class Command {
    Copy,
    Move,
    Del,
    Zip,
    Unzip,
    Rename
};

constexpr std::size_t kCommandCount = 6;

const std::array<Command, kCommandCount>& all_commands();
const char* command_name(Command c);
std::optional<Command> parse_command(const std::string& name);

// One executor operation: runs a single job, throws on failure.
using CommandFn = std::function<void(const nlohmann::json& job, const nlohmann::json& options)>;

// Fixed table from command identifier to executor operation.
class CommandSet {
public:
    void bind(Command c, CommandFn fn);
    bool bound(Command c) const;
    void execute(Command c, const nlohmann::json& job, const nlohmann::json& options) const;

private:
    std::array<CommandFn, kCommandCount> table_;
};
