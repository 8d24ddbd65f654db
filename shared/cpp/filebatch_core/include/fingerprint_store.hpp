#pragma once
#include <array>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "command.hpp"

// Hex SHA-256 of the canonical serialization of an item list.
std::string fingerprint(const nlohmann::json& items);

// Last successful fingerprint per command. Implementations need not be
// thread-safe; callers serialize access per command.
class FingerprintStore {
public:
    virtual ~FingerprintStore() = default;
    virtual std::optional<std::string> get(Command c) const = 0;
    virtual void set(Command c, const std::string& fp) = 0;
};

class InMemoryFingerprintStore : public FingerprintStore {
public:
    std::optional<std::string> get(Command c) const override;
    void set(Command c, const std::string& fp) override;

private:
    std::array<std::optional<std::string>, kCommandCount> entries_;
};
