#include <iostream>
#include <fstream>
#include <sstream>
#include <cstdlib>
#include <memory>
#include <nlohmann/json.hpp>
#include "../../../shared/cpp/filebatch_client/include/filebatch_client.hpp"
#include "../../../shared/cpp/filebatch_core/include/batch.hpp"
#include "../../../shared/cpp/filebatch_core/include/errors.hpp"
#include "../../../shared/cpp/filebatch_core/include/fingerprint_store.hpp"
#include "../../../shared/cpp/filebatch_core/include/orchestrator.hpp"
#include "../../../shared/cpp/filebatch_core/include/progress.hpp"
#include "../../../shared/cpp/file_ops/include/file_ops.hpp"

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

static std::string getenv_or(const char* k, const std::string& def) {
    const char* v = std::getenv(k);
    return v ? std::string(v) : def;
}

static void usage() {
    std::cerr << "filebatch-ctl usage:\n"
              << "  run --batch <file> [--local] [--parallel N] [--no-cache] [--progress] [--url <url>]\n"
              << "  fire <hook> [--url <url>]\n"
              << "  hooks | cache | progress [--url <url>]\n";
}

static ordered_json read_json_file(const std::string& path) {
    std::ifstream f(path);
    if (!f) throw std::runtime_error("cannot open " + path);
    std::stringstream ss;
    ss << f.rdbuf();
    return ordered_json::parse(ss.str());
}

static int print_response(const ClientResponse& r) {
    std::cout << r.body.dump(2) << "\n";
    if (!r.ok()) {
        std::cerr << "[filebatch-ctl] Service returned " << r.status << "\n";
        return 1;
    }
    return 0;
}

static int run_local(const ordered_json& request) {
    CommandBatch batch = parse_batch(request.contains("commands") ? request["commands"] : ordered_json());
    json options = request.contains("options") ? json::parse(request["options"].dump()) : json::object();
    CommandSet commands = make_file_command_set();
    InMemoryFingerprintStore cache;
    std::unique_ptr<ConsoleProgress> progress;
    if (option_flag(options, "progress", false)) progress = std::make_unique<ConsoleProgress>("file manager", std::cerr);
    BatchOrchestrator orchestrator(commands, cache, progress.get());
    auto summary = orchestrator.run(batch, options);
    std::cout << summary.to_json().dump(2) << "\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 1; }
    std::string cmd = argv[1];
    std::string url = getenv_or("FILEBATCH_URL", "http://localhost:7100");
    try {
        if (cmd == "run") {
            std::string batch_file;
            bool local = false;
            ordered_json overrides = ordered_json::object();
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--batch" && i + 1 < argc) batch_file = argv[++i];
                else if (a == "--local") local = true;
                else if (a == "--parallel" && i + 1 < argc) overrides["parallel"] = std::stoi(argv[++i]);
                else if (a == "--no-cache") overrides["cache"] = false;
                else if (a == "--progress") overrides["progress"] = true;
                else if (a == "--url" && i + 1 < argc) url = argv[++i];
                else { usage(); return 2; }
            }
            if (batch_file.empty()) { usage(); return 2; }
            ordered_json request = read_json_file(batch_file);
            if (!request.is_object()) throw BatchConfigError("batch file must contain an object");
            if (!request.contains("options") || request["options"].is_null()) request["options"] = ordered_json::object();
            request["options"].update(overrides);
            if (local) return run_local(request);
            FileBatchClient client(url);
            return print_response(client.run(request));
        }
        if (cmd == "fire") {
            if (argc < 3) { usage(); return 2; }
            std::string hook = argv[2];
            for (int i = 3; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--url" && i + 1 < argc) url = argv[++i];
            }
            FileBatchClient client(url);
            return print_response(client.fire(hook));
        }
        if (cmd == "hooks" || cmd == "cache" || cmd == "progress") {
            for (int i = 2; i < argc; ++i) {
                std::string a = argv[i];
                if (a == "--url" && i + 1 < argc) url = argv[++i];
            }
            FileBatchClient client(url);
            if (cmd == "hooks") return print_response(client.hooks());
            if (cmd == "cache") return print_response(client.cache());
            return print_response(client.progress());
        }
        usage();
        return 1;
    } catch (const CommandError& e) {
        std::cerr << "[ERROR] " << e.what() << " (" << e.completed() << " items completed)\n";
        return 3;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
