#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace infra::storage {

// Writes content to <path>.tmp, fsyncs it, then renames it over path and fsyncs the directory.
// With keepBackup the previous content of path is first preserved as <path>.bak.
// Throws std::runtime_error on any failure; path is left untouched in that case.
void writeFileAtomic(const std::filesystem::path& path, std::string_view content, bool keepBackup = false);

// Whole-file read. std::nullopt when the file is missing or unreadable.
std::optional<std::string> readWholeFile(const std::filesystem::path& path);

std::filesystem::path backupPathFor(const std::filesystem::path& path);

}  // namespace infra::storage
