#include "../include/file_ops.hpp"
#include "../include/archive.hpp"
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

static std::string require_string(const json& job, const char* command, const char* field) {
    if (!job.is_object()) {
        throw std::runtime_error(std::string(command) + ": job must be an object");
    }
    auto it = job.find(field);
    if (it == job.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw std::runtime_error(std::string(command) + ": job field '" + field + "' must be a non-empty string");
    }
    return it->get<std::string>();
}

static std::string optional_string(const json& job, const char* field) {
    auto it = job.find(field);
    if (it == job.end() || it->is_null()) return {};
    if (!it->is_string()) throw std::runtime_error(std::string("job field '") + field + "' must be a string");
    return it->get<std::string>();
}

static bool names_directory(const std::string& raw) {
    return !raw.empty() && (raw.back() == '/' || raw.back() == '\\');
}

// Destination for copy/move: inside `dest` when it is (or names) a directory.
static fs::path target_for(const fs::path& src, const std::string& dest, const json& options) {
    fs::path d = resolve_path(dest, options);
    if (names_directory(dest) || fs::is_directory(d)) return d / src.filename();
    return d;
}

static void ensure_parent(const fs::path& p) {
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
}

static void require_exists(const fs::path& p, const char* command) {
    if (!fs::exists(fs::symlink_status(p))) {
        throw std::runtime_error(std::string(command) + ": no such file or directory: " + p.string());
    }
}

fs::path resolve_path(const std::string& path, const json& options) {
    fs::path p(path);
    if (p.is_relative() && options.is_object()) {
        auto it = options.find("context");
        if (it != options.end() && it->is_string() && !it->get<std::string>().empty()) {
            p = fs::path(it->get<std::string>()) / p;
        }
    }
    p = p.lexically_normal();
    if (!p.has_filename() && p.has_relative_path()) p = p.parent_path();
    return p;
}

void file_copy(const json& job, const json& options) {
    fs::path src = resolve_path(require_string(job, "copy", "source"), options);
    require_exists(src, "copy");
    fs::path dst = target_for(src, require_string(job, "copy", "destination"), options);
    ensure_parent(dst);
    if (fs::is_directory(src)) {
        fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    } else {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    }
}

void file_move(const json& job, const json& options) {
    fs::path src = resolve_path(require_string(job, "move", "source"), options);
    require_exists(src, "move");
    fs::path dst = target_for(src, require_string(job, "move", "destination"), options);
    ensure_parent(dst);
    std::error_code ec;
    fs::rename(src, dst, ec);
    if (!ec) return;
    if (ec != std::errc::cross_device_link) {
        throw fs::filesystem_error("move", src, dst, ec);
    }
    // Different file system: copy, then drop the source.
    if (fs::is_directory(src)) {
        fs::copy(src, dst, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
    } else {
        fs::copy_file(src, dst, fs::copy_options::overwrite_existing);
    }
    fs::remove_all(src);
}

void file_del(const json& job, const json& options) {
    fs::path target = resolve_path(require_string(job, "del", "source"), options);
    require_exists(target, "del");
    fs::remove_all(target);
}

void file_zip(const json& job, const json& options) {
    fs::path src = resolve_path(require_string(job, "zip", "source"), options);
    require_exists(src, "zip");
    fs::path archive = resolve_path(require_string(job, "zip", "destination"), options);
    std::string type = optional_string(job, "type");
    ensure_parent(archive);
    create_archive(src, archive, type.empty() ? archive_type_for(archive) : parse_archive_type(type));
}

void file_unzip(const json& job, const json& options) {
    fs::path archive = resolve_path(require_string(job, "unzip", "source"), options);
    require_exists(archive, "unzip");
    fs::path dest = resolve_path(require_string(job, "unzip", "destination"), options);
    std::string type = optional_string(job, "type");
    extract_archive(archive, dest, type.empty() ? archive_type_for(archive) : parse_archive_type(type));
}

void file_rename(const json& job, const json& options) {
    std::string old_name = require_string(job, "rename", "oldName");
    std::string new_name = require_string(job, "rename", "newName");
    fs::path dir = resolve_path(optional_string(job, "path"), options);
    fs::path from = dir / old_name;
    fs::path to = dir / new_name;
    require_exists(from, "rename");
    ensure_parent(to);
    fs::rename(from, to);
}

CommandSet make_file_command_set() {
    CommandSet set;
    set.bind(Command::Copy, file_copy);
    set.bind(Command::Move, file_move);
    set.bind(Command::Del, file_del);
    set.bind(Command::Zip, file_zip);
    set.bind(Command::Unzip, file_unzip);
    set.bind(Command::Rename, file_rename);
    return set;
}
