#pragma once
#include <optional>
#include <string>
#include <vector>
#include "Core/Process/ProcessRecord.hpp"

namespace FindProcess {

// Prima entry (in ordine di snapshot) con exeName uguale a name, case-insensitive anche fuori ASCII
std::optional<ProcessRecord> FindByName(const std::vector<ProcessRecord>& records, const std::string& name);

// Prima entry con processId == pid
std::optional<ProcessRecord> FindByID(const std::vector<ProcessRecord>& records, uint32_t pid);

} // namespace FindProcess
