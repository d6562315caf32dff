#include "utils/ResultJson.hpp"

using nlohmann::json;

namespace ResultJson {

json Query(QueryKind kind, const FindProcess::QueryResult& r) {
    return json{
        {"query", kind == QueryKind::ByName ? "name" : "pid"},
        {"name", r.subjectName},
        {"pid", r.subjectId},
        {"running", r.found}
    };
}

json Process(const FindProcess::ProcessRecord& p) {
    return json{ {"pid", p.processId}, {"exe", p.exeName} };
}

json Ok(const json& result) {
    return json{ {"ok", true}, {"result", result} };
}

json SnapshotFailure(const FindProcess::SnapshotError& e) {
    return json{
        {"ok", false},
        {"error", "snapshot_failed"},
        {"stage", FindProcess::StageName(e.stage())},
        {"code", e.code().value()},
        {"message", e.what()}
    };
}

json Fail(const std::string& error, const std::string& message) {
    return json{ {"ok", false}, {"error", error}, {"message", message} };
}

} // namespace ResultJson
