#pragma once

#include <install.hxx>

#include <cstddef>
#include <functional>
#include <string>
#include <string_view>
#include <vector>

/**
 * The install and uninstall commands of gitex-setup: option parsing, the
 * privilege check and the elevated relaunch around install::Install and
 * install::Uninstall.
 */
namespace installer
{
    // marks the copy started by an elevated relaunch so it cannot relaunch again
    constexpr auto ELEVATED_FLAG = "--elevated";

    struct Arguments
    {
        install::Options Options = install::DefaultOptions();
        bool Elevated{};
    };

    struct Privileges
    {
        std::function<bool(const install::Options &options)> Requires;
        std::function<int(const std::vector<std::string> &args)> Relaunch;
    };

    /**
     * RequiresElevation and RelaunchElevated of the running system.
     */
    Privileges SystemPrivileges();

    int Parse(const std::vector<std::string_view> &args, std::size_t begin, Arguments &arguments);

    /**
     * Arguments for the elevated copy of the process. Paths are made
     * absolute, since the elevated process may start in another working
     * directory.
     */
    std::vector<std::string> RelaunchArguments(std::string_view operation, const Arguments &arguments);

    int Install(const Arguments &arguments, const Privileges &privileges);
    int Uninstall(const Arguments &arguments, const Privileges &privileges);
}
