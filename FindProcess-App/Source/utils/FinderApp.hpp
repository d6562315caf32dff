#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"
#include "Core/Process/SnapshotApi.hpp"

// Exit code del tool
enum ExitCode : int {
    kExitAllRunning = 0,
    kExitSomeMissing = 1,
    kExitUsage = 2,
    kExitSnapshot = 3,
    kExitOther = 4
};

class FinderApp {
public:
    using Json = nlohmann::json;

    FinderApp(AppConfig cfg, FindProcess::SnapshotApi api);

    // Esegue le query (uno snapshot ciascuna) e, se richiesto, l'elenco completo.
    // Riempie outDoc col documento JSON da stampare; ritorna l'exit code.
    int run(std::string& outDoc);

    // {"queries":[...], "processes":[...]}; lancia SnapshotError
    Json collect(bool& allRunning);

private:
    std::string dump(const Json& j) const;

    AppConfig               m_cfg;
    FindProcess::SnapshotApi m_api;
};
