#ifdef SYSTEM_WINDOWS

#include <process.hxx>
#include <util.hxx>

#include <iostream>
#include <string>

#include <windows.h>
#include <shellapi.h>

bool IsElevated()
{
    HANDLE token = nullptr;
    if (!OpenProcessToken(GetCurrentProcess(), TOKEN_QUERY, &token))
        return false;

    TOKEN_ELEVATION elevation{};
    DWORD size = sizeof(elevation);

    bool elevated = false;
    if (GetTokenInformation(token, TokenElevation, &elevation, sizeof(elevation), &size))
        elevated = elevation.TokenIsElevated != 0;

    CloseHandle(token);
    return elevated;
}

bool IsWritable(const std::filesystem::path &directory)
{
    // access rights come from the ACL, so try to create a file
    const auto marker = (directory / (L".gitex-" + std::to_wstring(GetCurrentProcessId()))).wstring();

    const auto handle = CreateFileW(
        marker.c_str(),
        GENERIC_WRITE,
        0,
        nullptr,
        CREATE_NEW,
        FILE_ATTRIBUTE_TEMPORARY | FILE_FLAG_DELETE_ON_CLOSE,
        nullptr);
    if (handle == INVALID_HANDLE_VALUE)
        return false;

    CloseHandle(handle);
    return true;
}

bool RequiresElevation(const std::filesystem::path &directory, const bool machine_path)
{
    if (IsElevated())
        return false;

    // the machine PATH lives under HKEY_LOCAL_MACHINE
    if (machine_path)
        return true;

    return !IsWritable(GetExistingAncestor(directory));
}

int RelaunchElevated(const std::vector<std::string> &args)
{
    const auto self = GetExecutablePath().wstring();
    const auto parameters = process::BuildCommandLine(args);

    SHELLEXECUTEINFOW info{};
    info.cbSize = sizeof(info);
    info.fMask = SEE_MASK_NOASYNC;
    info.lpVerb = L"runas";
    info.lpFile = self.c_str();
    info.lpParameters = parameters.c_str();
    info.nShow = SW_SHOWNORMAL;

    if (!ShellExecuteExW(&info))
    {
        const auto error = GetLastError();
        if (error == ERROR_CANCELLED)
        {
            std::cerr << "elevation was declined." << std::endl;
            return 1;
        }

        std::cerr << "failed to relaunch elevated: " << GetErrorMessage(error) << std::endl;
        return 1;
    }

    return 0;
}

#endif
