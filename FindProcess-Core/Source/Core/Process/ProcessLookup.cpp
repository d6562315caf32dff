#include "Core/Process/ProcessLookup.hpp"
#include "Core/Process/ExeName.hpp"

std::optional<FindProcess::ProcessRecord> FindProcess::FindByName(
    const std::vector<ProcessRecord>& records, const std::string& name) {
    const std::string wanted = ToLowerName(name);
    for (const auto& r : records) {
        if (ToLowerName(r.exeName) == wanted) return r;
    }
    return std::nullopt;
}

std::optional<FindProcess::ProcessRecord> FindProcess::FindByID(
    const std::vector<ProcessRecord>& records, uint32_t pid) {
    for (const auto& r : records) {
        if (r.processId == pid) return r;
    }
    return std::nullopt;
}
