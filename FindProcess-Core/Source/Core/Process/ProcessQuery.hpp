#pragma once
#include <string>
#include "Core/Process/ProcessRecord.hpp"
#include "Core/Process/SnapshotApi.hpp"

namespace FindProcess {

// Ogni chiamata fa un nuovo snapshot; SnapshotError passa al chiamante così com'è.

// subjectName = name (verbatim), subjectId = pid trovato o 0
QueryResult ByName(const std::string& name, const SnapshotApi& api);

// subjectId = pid, subjectName = exe trovato o ""
QueryResult ByID(uint32_t pid, const SnapshotApi& api);

} // namespace FindProcess
