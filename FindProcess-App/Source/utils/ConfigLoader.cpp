#include "utils/ConfigLoader.hpp"
#include <fstream>

using nlohmann::json;

static bool parseQuery(AppConfig& cfg, std::string& outErr, size_t i, const json& q) {
    const std::string where = "queries[" + std::to_string(i) + "]";
    if (!q.is_object()) { outErr = where + " deve essere un oggetto."; return false; }

    const bool hasName = q.contains("name");
    const bool hasPid = q.contains("pid");
    if (hasName == hasPid) { outErr = where + " deve avere esattamente una chiave tra 'name' e 'pid'."; return false; }
    if (q.size() != 1) { outErr = where + " contiene chiavi sconosciute."; return false; }

    QuerySpec spec;
    if (hasName) {
        const auto& n = q["name"];
        if (!n.is_string()) { outErr = where + ".name deve essere una stringa."; return false; }
        spec.kind = QueryKind::ByName;
        spec.name = n.get<std::string>();   // nessun lower-case: il nome torna verbatim nel risultato
        if (spec.name.empty()) { outErr = where + ".name vuoto."; return false; }
    }
    else {
        const auto& p = q["pid"];
        if (!p.is_number_unsigned()) { outErr = where + ".pid deve essere un intero positivo."; return false; }
        const auto v = p.get<uint64_t>();
        if (v > UINT32_MAX) { outErr = where + ".pid fuori range."; return false; }
        spec.kind = QueryKind::ByPid;
        spec.pid = (uint32_t)v;
    }
    cfg.queries.push_back(std::move(spec));
    return true;
}

static bool parseOutput(AppConfig& cfg, std::string& outErr, const json& o) {
    if (!o.is_object()) { outErr = "Chiave 'output' non oggetto."; return false; }
    for (auto it = o.begin(); it != o.end(); ++it) {
        if (it.key() != "pretty" && it.key() != "list") { outErr = "Chiave 'output." + it.key() + "' sconosciuta."; return false; }
        if (!it.value().is_boolean()) { outErr = "Chiave 'output." + it.key() + "' non booleana."; return false; }
    }
    if (o.contains("pretty")) cfg.pretty = o["pretty"].get<bool>();
    if (o.contains("list")) cfg.listAll = o["list"].get<bool>();
    return true;
}

bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const json& j) {
    cfg = {};

    if (!j.is_object()) { outErr = "Il documento deve essere un oggetto JSON."; return false; }
    for (auto it = j.begin(); it != j.end(); ++it) {
        if (it.key() != "queries" && it.key() != "output") { outErr = "Chiave '" + it.key() + "' sconosciuta."; return false; }
    }

    // queries
    if (!j.contains("queries") || !j["queries"].is_array()) { outErr = "Chiave 'queries' mancante o non array."; return false; }
    const auto& qs = j["queries"];
    if (qs.empty()) { outErr = "'queries' array vuoto."; return false; }
    for (size_t i = 0; i < qs.size(); ++i) if (!parseQuery(cfg, outErr, i, qs[i])) return false;

    // output (opzionale)
    if (j.contains("output") && !parseOutput(cfg, outErr, j["output"])) return false;

    return true;
}

bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath) {
    cfg = {};
    try {
        std::ifstream f(configPath);
        if (!f) { outErr = "Impossibile aprire il file: " + configPath; return false; }

        json j; f >> j; // può lanciare
        return ParseConfigStrict(cfg, outErr, j);
    }
    catch (const json::exception& ex) {
        outErr = std::string("Errore di parsing JSON: ") + ex.what() + ". Ricorda: il JSON standard non supporta i commenti.";
        return false;
    }
}
