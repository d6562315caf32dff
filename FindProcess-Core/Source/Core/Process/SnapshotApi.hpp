#pragma once
#include <array>
#include <cstddef>
#include <cstdint>
#include <functional>

namespace FindProcess {

// MAX_PATH: dimensione di PROCESSENTRY32W::szExeFile (in code unit UTF-16)
constexpr size_t kExeNameCapacity = 260;

// Entry "grezza" come la consegna il sistema: nome a larghezza fissa, terminato da 0
struct NativeProcessEntry {
    uint32_t processId = 0;
    std::array<char16_t, kExeNameCapacity> exeFile{};
};

enum class FetchStatus {
    Ok,             // entry valida in output
    NoMoreEntries,  // fine dati (ERROR_NO_MORE_FILES)
    Failed          // qualsiasi altro errore, codice in err
};

// Primitive dello snapshot di sistema (open / first / next / close).
// L'handle è opaco (HANDLE su Windows); nullptr = nessun handle.
struct SnapshotApi {
    // false su errore. Se handle != nullptr viene chiuso comunque.
    std::function<bool(void*& handle, unsigned long& err)> open;
    std::function<FetchStatus(void* handle, NativeProcessEntry& out, unsigned long& err)> first;
    std::function<FetchStatus(void* handle, NativeProcessEntry& out, unsigned long& err)> next;
    std::function<void(void* handle)> close;
};

// Possesso esclusivo dell'handle: close() una sola volta, su ogni percorso di uscita
class ScopedSnapshot {
public:
    ScopedSnapshot(const SnapshotApi& api, void* handle) : m_api(api), m_handle(handle) {}
    ~ScopedSnapshot() { release(); }

    ScopedSnapshot(const ScopedSnapshot&) = delete;
    ScopedSnapshot& operator=(const ScopedSnapshot&) = delete;

    [[nodiscard]] void* get() const { return m_handle; }

    void release() {
        if (!m_handle) return;
        void* h = m_handle;
        m_handle = nullptr;
        if (m_api.close) m_api.close(h);
    }

private:
    const SnapshotApi& m_api;
    void* m_handle = nullptr;
};

} // namespace FindProcess
