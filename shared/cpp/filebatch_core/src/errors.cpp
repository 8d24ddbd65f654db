#include "../include/errors.hpp"

static std::string describe(Command command, std::size_t item, const std::string& reason) {
    return std::string("command '") + command_name(command) + "' failed at item " +
           std::to_string(item) + ": " + reason;
}

CommandError::CommandError(Command command, std::size_t item, std::string reason, std::size_t completed)
    : std::runtime_error(describe(command, item, reason)),
      command_(command),
      item_(item),
      reason_(std::move(reason)),
      completed_(completed) {}
