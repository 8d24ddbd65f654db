#include "../include/fingerprint_store.hpp"
#include <openssl/sha.h>
#include <sstream>

std::string fingerprint(const nlohmann::json& items) {
    const std::string canonical = items.dump();
    unsigned char md[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(canonical.data()), canonical.size(), md);
    std::ostringstream oss;
    for (int i = 0; i < SHA256_DIGEST_LENGTH; ++i) {
        oss << std::hex << std::nouppercase << ((md[i] >> 4) & 0xF) << (md[i] & 0xF);
    }
    return oss.str();
}

std::optional<std::string> InMemoryFingerprintStore::get(Command c) const {
    return entries_[static_cast<std::size_t>(c)];
}

void InMemoryFingerprintStore::set(Command c, const std::string& fp) {
    entries_[static_cast<std::size_t>(c)] = fp;
}
