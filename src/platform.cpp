#include "platform.h"

#ifdef _WIN32
#    ifndef NOMINMAX
#        define NOMINMAX 1
#    endif
#    include <windows.h>
#else
#    include <unistd.h>
#endif

namespace ntree {

#ifdef _WIN32

namespace {

// Console mode of standard output, or false when it is not a console.
bool stdoutConsoleMode(HANDLE& handle, DWORD& mode)
{
    handle = GetStdHandle(STD_OUTPUT_HANDLE);
    if (handle == INVALID_HANDLE_VALUE || handle == nullptr) {
        return false;
    }
    return GetConsoleMode(handle, &mode) != 0;
}

} // namespace

bool Platform::enableVirtualTerminal()
{
    SetConsoleOutputCP(CP_UTF8);
    HANDLE handle = nullptr;
    DWORD mode = 0;
    if (!stdoutConsoleMode(handle, mode)) {
        return false;
    }
    if (mode & ENABLE_VIRTUAL_TERMINAL_PROCESSING) {
        return true;
    }
    return SetConsoleMode(handle, mode | ENABLE_VIRTUAL_TERMINAL_PROCESSING) != 0;
}

bool Platform::isOutputTerminal()
{
    HANDLE handle = nullptr;
    DWORD mode = 0;
    return stdoutConsoleMode(handle, mode);
}

#else

bool Platform::enableVirtualTerminal()
{
    return true;
}

bool Platform::isOutputTerminal()
{
    return ::isatty(STDOUT_FILENO) == 1;
}

#endif

} // namespace ntree
