#include "utils/CliArgs.hpp"
#include "utils/ConfigLoader.hpp"
#include <charconv>
#include <fmt/core.h>
#include <string_view>

static inline std::string trim(const std::string& s) {
    auto b = s.find_first_not_of(" \t\r\n");
    auto e = s.find_last_not_of(" \t\r\n");
    if (b == std::string::npos) return {};
    return s.substr(b, e - b + 1);
}

static bool toPid(const std::string& s, uint32_t& out) {
    auto sv = std::string_view(s);
    auto first = sv.data();
    auto last = sv.data() + sv.size();
    std::from_chars_result r = std::from_chars(first, last, out);
    return r.ec == std::errc() && r.ptr == last && first != last;
}

bool ParseCommandLine(int argc, const char* const* argv, CliOptions& out, std::string& outErr) {
    out = {};
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i] ? argv[i] : "";

        // opzioni con valore
        auto value = [&](std::string& v) -> bool {
            if (i + 1 >= argc || !argv[i + 1]) { outErr = a + " richiede un valore."; return false; }
            v = argv[++i];
            return true;
        };

        if (a == "--help" || a == "-h") { out.help = true; continue; }
        if (a == "--pretty") { out.pretty = true; continue; }
        if (a == "--list") { out.listAll = true; continue; }

        if (a == "--config") {
            if (!value(out.configPath)) return false;
            if (out.configPath.empty()) { outErr = "--config: percorso vuoto."; return false; }
            continue;
        }

        if (a == "--name") {
            QuerySpec q; q.kind = QueryKind::ByName;
            if (!value(q.name)) return false;
            if (q.name.empty()) { outErr = "--name: nome vuoto."; return false; }
            out.queries.push_back(std::move(q));
            continue;
        }

        if (a == "--pid") {
            std::string raw;
            if (!value(raw)) return false;
            QuerySpec q; q.kind = QueryKind::ByPid;
            if (!toPid(trim(raw), q.pid)) { outErr = "--pid non valido: '" + raw + "'"; return false; }
            out.queries.push_back(std::move(q));
            continue;
        }

        outErr = "argomento sconosciuto: '" + a + "'";
        return false;
    }
    return true;
}

bool BuildAppConfig(const CliOptions& cli, AppConfig& cfg, std::string& outErr) {
    cfg = {};
    if (!cli.configPath.empty()) {
        if (!LoadConfigStrict(cfg, outErr, cli.configPath)) return false;
    }

    cfg.queries.insert(cfg.queries.end(), cli.queries.begin(), cli.queries.end());
    cfg.pretty = cfg.pretty || cli.pretty;
    cfg.listAll = cfg.listAll || cli.listAll;

    if (cfg.queries.empty() && !cfg.listAll) {
        outErr = "Nessuna query: usa --name, --pid, --config oppure --list.";
        return false;
    }
    return true;
}

std::string UsageText(const std::string& prog) {
    return fmt::format(
        "Uso: {} [--name <exe>]... [--pid <id>]... [--config <file.json>] [--list] [--pretty]\n"
        "  --name <exe>     processo per nome eseguibile (case-insensitive)\n"
        "  --pid <id>       processo per PID\n"
        "  --config <file>  query da file JSON (strict), vedi queries.example.json\n"
        "  --list           include l'elenco completo dei processi\n"
        "  --pretty         JSON indentato\n"
        "Exit code: 0 tutti trovati, 1 almeno uno assente, 2 uso/config, 3 snapshot, 4 altro\n",
        prog);
}
