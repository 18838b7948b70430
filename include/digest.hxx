#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace digest
{
    /**
     * SHA-256 of the data as 64 lower-case hex digits.
     */
    std::string Sha256(std::string_view data);

    /**
     * SHA-256 of the file content. Returns 0 and sets `hex` on success.
     */
    int Sha256File(const std::filesystem::path &path, std::string &hex);
}
