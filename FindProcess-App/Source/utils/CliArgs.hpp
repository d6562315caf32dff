#pragma once
#include <string>
#include <vector>
#include "utils/Config.hpp"

// Opzioni da riga di comando:
//   --name <exe>   (ripetibile)
//   --pid <id>     (ripetibile)
//   --config <file.json>
//   --list  --pretty  --help
struct CliOptions {
    std::string configPath;             // vuoto = nessun file
    std::vector<QuerySpec> queries;     // in ordine di apparizione
    bool pretty = false;
    bool listAll = false;
    bool help = false;
};

// Ritorna false con outErr su argomento sconosciuto/valore mancante o non valido
bool ParseCommandLine(int argc, const char* const* argv, CliOptions& out, std::string& outErr);

// Config finale: query del file (se presente) + query da CLI, flag in OR.
// Serve almeno una query oppure --list.
bool BuildAppConfig(const CliOptions& cli, AppConfig& cfg, std::string& outErr);

std::string UsageText(const std::string& prog);
