#pragma once
#include <cstdint>
#include <string>
#include <vector>

// Una query: per nome eseguibile oppure per PID
enum class QueryKind {
    ByName,
    ByPid
};

struct QuerySpec {
    QueryKind   kind{};
    std::string name;       // valido per ByName (confronto case-insensitive)
    uint32_t    pid = 0;    // valido per ByPid
};

struct AppConfig {
    std::vector<QuerySpec> queries;   // eseguite in ordine, uno snapshot per query

    // output
    bool pretty = false;    // JSON indentato
    bool listAll = false;   // include l'elenco completo dei processi
};
