#include "Core/Process/ProcessQuery.hpp"
#include "Core/Process/ProcessLookup.hpp"
#include "Core/Process/Snapshotter.hpp"

FindProcess::QueryResult FindProcess::ByName(const std::string& name, const SnapshotApi& api) {
    QueryResult res;
    res.subjectName = name;

    const auto procs = EnumerateProcesses(api);
    if (auto p = FindByName(procs, name)) {
        res.subjectId = p->processId;
        res.found = true;
    }
    return res;
}

FindProcess::QueryResult FindProcess::ByID(uint32_t pid, const SnapshotApi& api) {
    QueryResult res;
    res.subjectId = pid;

    const auto procs = EnumerateProcesses(api);
    if (auto p = FindByID(procs, pid)) {
        res.subjectName = p->exeName;
        res.found = true;
    }
    return res;
}
