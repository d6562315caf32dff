#pragma once
#include <system_error>

namespace FindProcess {

// Passo dello snapshot che è fallito
enum class SnapshotStage {
    Open,   // CreateToolhelp32Snapshot
    First,  // Process32FirstW
    Next    // Process32NextW
};

// Lettura della tabella processi fallita (acquisizione o enumerazione interrotta).
// code() contiene il codice nativo (GetLastError) in std::system_category().
class SnapshotError : public std::system_error {
public:
    SnapshotError(SnapshotStage stage, unsigned long nativeCode);

    [[nodiscard]] SnapshotStage stage() const noexcept { return m_stage; }

private:
    SnapshotStage m_stage;
};

// "open" / "first" / "next"
const char* StageName(SnapshotStage stage);

} // namespace FindProcess
