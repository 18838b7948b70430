#include <util.hxx>

std::filesystem::path GetExistingAncestor(const std::filesystem::path &path)
{
    auto existing = std::filesystem::absolute(path).lexically_normal();

    std::error_code error;
    while (!std::filesystem::exists(existing, error) && existing.has_parent_path() && existing != existing.parent_path())
        existing = existing.parent_path();

    return existing;
}
