#include "Core/Process/ToolhelpSnapshot.hpp"
#include "Core/Process/ProcessQuery.hpp"
#include "Core/Process/Snapshotter.hpp"

#include <Windows.h>
#include <TlHelp32.h>

using namespace FindProcess;

static_assert(sizeof(PROCESSENTRY32W::szExeFile) / sizeof(WCHAR) == kExeNameCapacity,
    "szExeFile non è MAX_PATH");

namespace {
    FetchStatus toNative(BOOL ok, const PROCESSENTRY32W& pe, NativeProcessEntry& out, unsigned long& err) {
        if (!ok) {
            const DWORD e = GetLastError();
            err = e;
            return e == ERROR_NO_MORE_FILES ? FetchStatus::NoMoreEntries : FetchStatus::Failed;
        }
        out.processId = (uint32_t)pe.th32ProcessID;
        for (size_t i = 0; i < kExeNameCapacity; ++i) out.exeFile[i] = (char16_t)pe.szExeFile[i];
        return FetchStatus::Ok;
    }
}

SnapshotApi FindProcess::ToolhelpSnapshotApi() {
    SnapshotApi api;

    api.open = [](void*& handle, unsigned long& err) -> bool {
        HANDLE h = CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS, 0);
        if (h == INVALID_HANDLE_VALUE) {
            err = GetLastError();
            handle = nullptr;
            return false;
        }
        handle = h;
        return true;
    };

    api.first = [](void* handle, NativeProcessEntry& out, unsigned long& err) {
        PROCESSENTRY32W pe{};
        pe.dwSize = sizeof(pe);
        const BOOL ok = Process32FirstW((HANDLE)handle, &pe);
        return toNative(ok, pe, out, err);
    };

    api.next = [](void* handle, NativeProcessEntry& out, unsigned long& err) {
        PROCESSENTRY32W pe{};
        pe.dwSize = sizeof(pe);
        const BOOL ok = Process32NextW((HANDLE)handle, &pe);
        return toNative(ok, pe, out, err);
    };

    api.close = [](void* handle) {
        CloseHandle((HANDLE)handle);
    };

    return api;
}

// -----------------------------------------------------------------------------
// Varianti "di sistema" di snapshot e query
// -----------------------------------------------------------------------------
std::vector<ProcessRecord> FindProcess::EnumerateProcesses() {
    return EnumerateProcesses(ToolhelpSnapshotApi());
}

QueryResult FindProcess::ByName(const std::string& name) {
    return ByName(name, ToolhelpSnapshotApi());
}

QueryResult FindProcess::ByID(uint32_t pid) {
    return ByID(pid, ToolhelpSnapshotApi());
}
