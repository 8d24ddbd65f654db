#include "../include/command.hpp"
#include <stdexcept>

static std::size_t index_of(Command c) {
    return static_cast<std::size_t>(c);
}

const std::array<Command, kCommandCount>& all_commands() {
    static const std::array<Command, kCommandCount> list = {
        Command::Copy, Command::Move, Command::Del, Command::Zip, Command::Unzip, Command::Rename
    };
    return list;
}

const char* command_name(Command c) {
    switch (c) {
        case Command::Copy: return "copy";
        case Command::Move: return "move";
        case Command::Del: return "del";
        case Command::Zip: return "zip";
        case Command::Unzip: return "unzip";
        case Command::Rename: return "rename";
    }
    return "unknown";
}

std::optional<Command> parse_command(const std::string& name) {
    for (Command c : all_commands()) {
        if (name == command_name(c)) return c;
    }
    return std::nullopt;
}

void CommandSet::bind(Command c, CommandFn fn) {
    table_[index_of(c)] = std::move(fn);
}

bool CommandSet::bound(Command c) const {
    return static_cast<bool>(table_[index_of(c)]);
}

void CommandSet::execute(Command c, const nlohmann::json& job, const nlohmann::json& options) const {
    const auto& fn = table_[index_of(c)];
    if (!fn) {
        throw std::runtime_error(std::string("no executor bound for command '") + command_name(c) + "'");
    }
    fn(job, options);
}
