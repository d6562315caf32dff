#include "Core/Process/Snapshotter.hpp"
#include "Core/Process/SnapshotError.hpp"
#include "Core/Process/ExeName.hpp"

using namespace FindProcess;

ProcessRecord FindProcess::ToProcessRecord(const NativeProcessEntry& entry) {
    ProcessRecord r;
    r.processId = entry.processId;
    r.exeName = DecodeExeName(entry.exeFile.data(), entry.exeFile.size());
    return r;
}

std::vector<ProcessRecord> FindProcess::EnumerateProcesses(const SnapshotApi& api) {
    void* handle = nullptr;
    unsigned long err = 0;
    const bool opened = api.open(handle, err);
    ScopedSnapshot snap{ api, handle };   // chiude anche un handle "parziale"
    if (!opened) throw SnapshotError(SnapshotStage::Open, err);

    NativeProcessEntry entry{};
    err = 0;
    // snapshot vuoto = errore, non "zero processi"
    if (api.first(snap.get(), entry, err) != FetchStatus::Ok)
        throw SnapshotError(SnapshotStage::First, err);

    std::vector<ProcessRecord> results;
    results.reserve(256);
    for (;;) {
        results.push_back(ToProcessRecord(entry));

        entry = NativeProcessEntry{};
        err = 0;
        const FetchStatus st = api.next(snap.get(), entry, err);
        if (st == FetchStatus::Ok) continue;
        if (st == FetchStatus::NoMoreEntries) break;   // unica uscita "buona"
        throw SnapshotError(SnapshotStage::Next, err);
    }

    snap.release();
    return results;
}
