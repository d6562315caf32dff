#include "utils/FinderApp.hpp"
#include "utils/ResultJson.hpp"
#include "utils/Log.hpp"
#include "Core/Process/ProcessQuery.hpp"
#include "Core/Process/Snapshotter.hpp"
#include "Core/Process/SnapshotError.hpp"

using Json = nlohmann::json;

FinderApp::FinderApp(AppConfig cfg, FindProcess::SnapshotApi api)
    : m_cfg(std::move(cfg)), m_api(std::move(api)) {
}

Json FinderApp::collect(bool& allRunning) {
    allRunning = true;
    Json result = { {"queries", Json::array()} };

    for (const auto& q : m_cfg.queries) {
        FindProcess::QueryResult r;
        if (q.kind == QueryKind::ByName) r = FindProcess::ByName(q.name, m_api);
        else                             r = FindProcess::ByID(q.pid, m_api);

        LOGF("[QUERY] {}={} -> {}", q.kind == QueryKind::ByName ? "name" : "pid",
            q.kind == QueryKind::ByName ? q.name : std::to_string(q.pid),
            r.found ? fmt::format("running (pid {}, exe '{}')", r.subjectId, r.subjectName) : "not running");

        if (!r.found) allRunning = false;
        result["queries"].push_back(ResultJson::Query(q.kind, r));
    }

    if (m_cfg.listAll) {
        const auto procs = FindProcess::EnumerateProcesses(m_api);
        Json list = Json::array();
        for (const auto& p : procs) list.push_back(ResultJson::Process(p));
        LOGF("[QUERY] list -> {} processi", procs.size());
        result["processes"] = std::move(list);
    }
    return result;
}

int FinderApp::run(std::string& outDoc) {
    try {
        bool allRunning = true;
        Json result = collect(allRunning);
        outDoc = dump(ResultJson::Ok(result));
        return allRunning ? kExitAllRunning : kExitSomeMissing;
    }
    catch (const FindProcess::SnapshotError& e) {
        LOGF("[QUERY] snapshot fallito ({}): {} (code {})", FindProcess::StageName(e.stage()), e.what(), e.code().value());
        outDoc = dump(ResultJson::SnapshotFailure(e));
        return kExitSnapshot;
    }
}

std::string FinderApp::dump(const Json& j) const {
    // i messaggi di sistema non sono sempre UTF-8 valido
    return j.dump(m_cfg.pretty ? 2 : -1, ' ', false, Json::error_handler_t::replace);
}
