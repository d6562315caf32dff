#pragma once
#include <string>
#include <vector>
#include "Core/Process/ProcessRecord.hpp"
#include "Core/Process/SnapshotApi.hpp"

namespace FindProcess {

// SnapshotApi su Toolhelp32:
// CreateToolhelp32Snapshot(TH32CS_SNAPPROCESS) / Process32FirstW / Process32NextW / CloseHandle
// ERROR_NO_MORE_FILES -> FetchStatus::NoMoreEntries
SnapshotApi ToolhelpSnapshotApi();

// Snapshot e query sulla tabella processi reale (ToolhelpSnapshotApi)
std::vector<ProcessRecord> EnumerateProcesses();
QueryResult ByName(const std::string& name);
QueryResult ByID(uint32_t pid);

} // namespace FindProcess
