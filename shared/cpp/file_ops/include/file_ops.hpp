#pragma once
#include <filesystem>
#include <string>
#include <nlohmann/json.hpp>
#include "../../filebatch_core/include/command.hpp"

void file_copy(const nlohmann::json& job, const nlohmann::json& options);
void file_move(const nlohmann::json& job, const nlohmann::json& options);
void file_del(const nlohmann::json& job, const nlohmann::json& options);
void file_zip(const nlohmann::json& job, const nlohmann::json& options);
void file_unzip(const nlohmann::json& job, const nlohmann::json& options);
void file_rename(const nlohmann::json& job, const nlohmann::json& options);

// All six commands bound to the file operations above.
CommandSet make_file_command_set();

// `path` resolved against options.context when relative.
std::filesystem::path resolve_path(const std::string& path, const nlohmann::json& options);
