#pragma once
#include <filesystem>
#include <string>

enum class ArchiveType {
    Zip,
    Tar,
    Tgz
};

// "zip", "tar", "tgz" / "tar.gz". Throws std::runtime_error otherwise.
ArchiveType parse_archive_type(const std::string& name);
// Guesses from the file name; defaults to zip.
ArchiveType archive_type_for(const std::filesystem::path& p);

// Archives a file or a directory tree. A directory's entries are relative to
// the directory itself; a single file is stored under its file name.
void create_archive(const std::filesystem::path& source, const std::filesystem::path& archive, ArchiveType type);

// Extracts into `dest`, creating it. Rejects absolute entries and `..`.
void extract_archive(const std::filesystem::path& archive, const std::filesystem::path& dest, ArchiveType type);
