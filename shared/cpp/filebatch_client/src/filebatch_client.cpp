#include "../include/filebatch_client.hpp"
#include <curl/curl.h>
#include <stdexcept>

using json = nlohmann::json;

namespace {
static size_t write_cb(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total = size * nmemb;
    std::string* s = static_cast<std::string*>(userp);
    s->append(static_cast<char*>(contents), total);
    return total;
}

struct CurlHandle {
    CURL* h{nullptr};
    CurlHandle() { h = curl_easy_init(); if (!h) throw std::runtime_error("curl_easy_init failed"); }
    ~CurlHandle() { if (h) curl_easy_cleanup(h); }
};

struct HeaderList {
    struct curl_slist* list{nullptr};
    ~HeaderList() { curl_slist_free_all(list); }
};
}

FileBatchClient::FileBatchClient(std::string base_url) : base_(std::move(base_url)) {
    if (!base_.empty() && base_.back() == '/') base_.pop_back();
}

ClientResponse FileBatchClient::send(const char* method, const std::string& path, const std::string* body) {
    CurlHandle c;
    HeaderList headers;
    std::string url = base_ + path;
    std::string buf;
    curl_easy_setopt(c.h, CURLOPT_URL, url.c_str());
    curl_easy_setopt(c.h, CURLOPT_CUSTOMREQUEST, method);
    if (body) {
        headers.list = curl_slist_append(headers.list, "Content-Type: application/json");
        curl_easy_setopt(c.h, CURLOPT_HTTPHEADER, headers.list);
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDS, body->c_str());
        curl_easy_setopt(c.h, CURLOPT_POSTFIELDSIZE, (long)body->size());
    }
    curl_easy_setopt(c.h, CURLOPT_WRITEFUNCTION, write_cb);
    curl_easy_setopt(c.h, CURLOPT_WRITEDATA, &buf);
    CURLcode code = curl_easy_perform(c.h);
    if (code != CURLE_OK) {
        throw std::runtime_error(std::string(method) + " " + url + " failed: " + curl_easy_strerror(code));
    }
    ClientResponse resp;
    curl_easy_getinfo(c.h, CURLINFO_RESPONSE_CODE, &resp.status);
    resp.body = buf.empty() ? json::object() : json::parse(buf, nullptr, false);
    if (resp.body.is_discarded()) resp.body = json{{"error", buf}};
    return resp;
}

ClientResponse FileBatchClient::run(const nlohmann::ordered_json& request) {
    std::string body = request.dump();
    return send("POST", "/run", &body);
}

ClientResponse FileBatchClient::fire(const std::string& hook) {
    std::string body = "{}";
    return send("POST", "/hooks/" + hook, &body);
}

ClientResponse FileBatchClient::hooks() {
    return send("GET", "/hooks", nullptr);
}

ClientResponse FileBatchClient::cache() {
    return send("GET", "/cache", nullptr);
}

ClientResponse FileBatchClient::progress() {
    return send("GET", "/progress", nullptr);
}
