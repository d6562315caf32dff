#pragma once
#include <cstdint>
#include <string>

namespace FindProcess {

// Un processo così come compare in uno snapshot (valore puro, non dipende dall'handle)
struct ProcessRecord {
    uint32_t    processId = 0;
    std::string exeName;        // basename UTF-8, es. "notepad.exe"
};

// Esito di una query by-name / by-id.
// Uno dei due campi è l'input del chiamante, l'altro arriva dal record trovato
// (oppure resta "" / 0 se il processo non c'è).
struct QueryResult {
    std::string subjectName;
    uint32_t    subjectId = 0;
    bool        found = false;
};

} // namespace FindProcess
