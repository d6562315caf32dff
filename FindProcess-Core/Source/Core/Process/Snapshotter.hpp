#pragma once
#include <vector>
#include "Core/Process/ProcessRecord.hpp"
#include "Core/Process/SnapshotApi.hpp"

namespace FindProcess {

// Apre uno snapshot, lo legge tutto e lo chiude.
// Lancia SnapshotError se l'apertura fallisce, se la prima entry non arriva
// (anche per "no more entries") o se una next fallisce per un motivo diverso
// dalla fine dati. L'handle viene chiuso in ogni caso.
std::vector<ProcessRecord> EnumerateProcesses(const SnapshotApi& api);

// entry nativa -> record (id copiato, nome decodificato fino al terminatore)
ProcessRecord ToProcessRecord(const NativeProcessEntry& entry);

} // namespace FindProcess
