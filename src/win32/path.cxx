#ifdef SYSTEM_WINDOWS

#include <util.hxx>

#include <cstdlib>

#include <shlobj.h>
#include <windows.h>

std::filesystem::path GetHomeDirectory()
{
    static std::pair<bool, std::filesystem::path> directory{ false, {} };

    if (directory.first)
        return directory.second;

    PWSTR path = nullptr;
    if (SHGetKnownFolderPath(FOLDERID_Profile, 0, nullptr, &path) == S_OK)
    {
        directory = { true, std::filesystem::path(path) };
    }
    else if (const auto profile = _wgetenv(L"USERPROFILE"))
    {
        directory = { true, std::filesystem::path(profile) };
    }
    else
    {
        directory = { true, std::filesystem::current_path() };
    }

    CoTaskMemFree(path);

    return directory.second;
}

std::filesystem::path GetExecutablePath()
{
    std::wstring buffer(MAX_PATH, L'\0');

    while (true)
    {
        const auto len = GetModuleFileNameW(nullptr, buffer.data(), static_cast<DWORD>(buffer.size()));
        if (len == 0)
            return {};

        if (len < buffer.size())
        {
            buffer.resize(len);
            return buffer;
        }

        buffer.resize(buffer.size() * 2);
    }
}

#endif
