#ifdef SYSTEM_WINDOWS

#include <util.hxx>

#include <windows.h>

std::string GetErrorMessage(const unsigned long error)
{
    LPWSTR buffer = nullptr;

    DWORD len = FormatMessageW(
        FORMAT_MESSAGE_ALLOCATE_BUFFER
        | FORMAT_MESSAGE_FROM_SYSTEM
        | FORMAT_MESSAGE_IGNORE_INSERTS,
        nullptr,
        error,
        MAKELANGID(LANG_NEUTRAL, SUBLANG_DEFAULT),
        (LPWSTR) &buffer,
        0,
        nullptr);

    std::wstring message;
    if (len && buffer)
    {
        message.assign(buffer, len);
        LocalFree(buffer);
    }

    while (!message.empty() && (message.back() == L'\r' || message.back() == L'\n'))
        message.pop_back();

    if (message.empty())
        return "error " + std::to_string(error);

    return std::filesystem::path(message).string();
}

#endif
