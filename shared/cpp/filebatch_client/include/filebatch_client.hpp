#pragma once
#include <string>
#include <nlohmann/json.hpp>

struct ClientResponse {
    long status{0};
    nlohmann::json body;

    bool ok() const { return status >= 200 && status < 300; }
};

// HTTP client for filebatchd. Throws std::runtime_error when the service
// cannot be reached.
class FileBatchClient {
public:
    explicit FileBatchClient(std::string base_url);
    ClientResponse run(const nlohmann::ordered_json& request);
    ClientResponse fire(const std::string& hook);
    ClientResponse hooks();
    ClientResponse cache();
    ClientResponse progress();

private:
    ClientResponse send(const char* method, const std::string& path, const std::string* body);

    std::string base_;
};
