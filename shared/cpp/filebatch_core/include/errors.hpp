#pragma once
#include <cstddef>
#include <stdexcept>
#include <string>
#include "command.hpp"

// Malformed batch or option set. Raised before any executor call.
class BatchConfigError : public std::runtime_error {
public:
    explicit BatchConfigError(const std::string& what) : std::runtime_error(what) {}
};

// An executor failure while running one command.
class CommandError : public std::runtime_error {
public:
    CommandError(Command command, std::size_t item, std::string reason, std::size_t completed);

    Command command() const { return command_; }
    std::size_t item() const { return item_; }
    const std::string& reason() const { return reason_; }
    std::size_t completed() const { return completed_; }

private:
    Command command_;
    std::size_t item_;
    std::string reason_;
    std::size_t completed_;
};
