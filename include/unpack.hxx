#pragma once

#include <filesystem>
#include <string>

/**
 * True for the release archive formats an installer source may come in:
 * .zip, .tar, .tar.gz, .tgz, .tar.xz, .txz
 */
bool IsArchive(const std::filesystem::path &path);

/**
 * Extracts the first regular file whose name (without its directory) equals
 * `entry_name` from the archive into `destination`, replacing an existing
 * file. Returns 0 on success.
 */
int ExtractEntry(const std::filesystem::path &source, const std::string &entry_name, const std::filesystem::path &destination);
