#ifdef SYSTEM_WINDOWS

#include <pathlist.hxx>
#include <util.hxx>

#include <iostream>

#include <windows.h>

static constexpr auto ENVIRONMENT_KEY = L"SYSTEM\\CurrentControlSet\\Control\\Session Manager\\Environment";

static LSTATUS ReadPath(HKEY key, std::wstring &path)
{
    path.clear();

    DWORD type = 0;
    DWORD size = 0;
    auto status = RegQueryValueExW(key, L"Path", nullptr, &type, nullptr, &size);
    if (status == ERROR_FILE_NOT_FOUND)
        return ERROR_SUCCESS;
    if (status != ERROR_SUCCESS)
        return status;

    // the stored value is not guaranteed to be terminated
    path.resize(size / sizeof(WCHAR) + 1);
    status = RegQueryValueExW(
        key,
        L"Path",
        nullptr,
        &type,
        (LPBYTE) path.data(),
        &size);
    if (status != ERROR_SUCCESS)
        return status;

    path.resize(wcsnlen(path.data(), path.size()));
    return ERROR_SUCCESS;
}

static LSTATUS WritePath(HKEY key, const std::wstring &path)
{
    return RegSetValueExW(
        key,
        L"Path",
        0,
        REG_EXPAND_SZ,
        (LPCBYTE) path.c_str(),
        static_cast<DWORD>((path.size() + 1) * sizeof(WCHAR)));
}

static void BroadcastChange()
{
    SendMessageTimeoutW(
        HWND_BROADCAST,
        WM_SETTINGCHANGE,
        0,
        (LPARAM) L"Environment",
        SMTO_ABORTIFHUNG,
        5000,
        nullptr);
}

static LSTATUS OpenEnvironment(HKEY &key)
{
    return RegOpenKeyExW(
        HKEY_LOCAL_MACHINE,
        ENVIRONMENT_KEY,
        0,
        KEY_READ | KEY_WRITE,
        &key);
}

int AppendSystemPath(const std::filesystem::path &directory, bool &appended)
{
    appended = false;

    const auto folder = std::filesystem::absolute(directory).wstring();

    HKEY key;
    if (const auto status = OpenEnvironment(key); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to open system environment: " << GetErrorMessage(status) << std::endl;
        return static_cast<int>(status);
    }

    std::wstring path;
    if (const auto status = ReadPath(key, path); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to read system path: " << GetErrorMessage(status) << std::endl;
        RegCloseKey(key);
        return static_cast<int>(status);
    }

    if (pathlist::Contains<wchar_t>(path, folder, L';', PATH_IGNORE_CASE))
    {
        RegCloseKey(key);
        std::cout << directory.string() << " is already on the system PATH." << std::endl;
        return 0;
    }

    path = pathlist::Append<wchar_t>(std::move(path), folder, L';', PATH_IGNORE_CASE);

    if (const auto status = WritePath(key, path); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to write system path: " << GetErrorMessage(status) << std::endl;
        RegCloseKey(key);
        return static_cast<int>(status);
    }

    RegCloseKey(key);
    BroadcastChange();

    appended = true;
    std::cout << "Added " << directory.string() << " to the system PATH." << std::endl;
    return 0;
}

int RemoveSystemPath(const std::filesystem::path &directory)
{
    const auto folder = std::filesystem::absolute(directory).wstring();

    HKEY key;
    if (const auto status = OpenEnvironment(key); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to open system environment: " << GetErrorMessage(status) << std::endl;
        return static_cast<int>(status);
    }

    std::wstring path;
    if (const auto status = ReadPath(key, path); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to read system path: " << GetErrorMessage(status) << std::endl;
        RegCloseKey(key);
        return static_cast<int>(status);
    }

    if (!pathlist::Contains<wchar_t>(path, folder, L';', PATH_IGNORE_CASE))
    {
        RegCloseKey(key);
        return 0;
    }

    path = pathlist::Remove<wchar_t>(path, folder, L';', PATH_IGNORE_CASE);

    if (const auto status = WritePath(key, path); status != ERROR_SUCCESS)
    {
        std::cerr << "failed to write system path: " << GetErrorMessage(status) << std::endl;
        RegCloseKey(key);
        return static_cast<int>(status);
    }

    RegCloseKey(key);
    BroadcastChange();

    std::cout << "Removed " << directory.string() << " from the system PATH." << std::endl;
    return 0;
}

#endif
