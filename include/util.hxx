#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#if defined(SYSTEM_WINDOWS)
constexpr char PATH_DELIMITER = ';';
constexpr bool PATH_IGNORE_CASE = true;
#else
constexpr char PATH_DELIMITER = ':';
constexpr bool PATH_IGNORE_CASE = false;
#endif

/**
 * Appends the directory to the machine-wide PATH variable if it is not
 * already one of its segments. Where the machine PATH cannot be edited, the
 * user is told how to add it instead. `appended` is set when a new segment
 * was written.
 */
int AppendSystemPath(const std::filesystem::path &directory, bool &appended);
int RemoveSystemPath(const std::filesystem::path &directory);

bool IsElevated();

/**
 * The path itself if it exists, otherwise its closest existing ancestor. The
 * result is absolute.
 */
std::filesystem::path GetExistingAncestor(const std::filesystem::path &path);
bool IsWritable(const std::filesystem::path &directory);

/**
 * Whether writing into `directory`, and into the machine PATH when
 * `machine_path` is set, needs more rights than the process has.
 */
bool RequiresElevation(const std::filesystem::path &directory, bool machine_path);

/**
 * Runs the current executable again with elevated rights and the given
 * arguments. Returns 0 once the elevated process was started; on Unix the
 * call only returns on failure.
 */
int RelaunchElevated(const std::vector<std::string> &args);

std::filesystem::path GetHomeDirectory();
std::filesystem::path GetExecutablePath();

std::string Trim(std::string string);
std::string Lower(std::string string);

std::vector<std::string> SplitWords(std::string_view string);
std::vector<std::string> Split(std::string_view string, char delimiter);

#ifdef SYSTEM_WINDOWS
std::string GetErrorMessage(unsigned long error);
#endif
