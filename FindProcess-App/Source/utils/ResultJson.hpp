#pragma once
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"
#include "Core/Process/ProcessRecord.hpp"
#include "Core/Process/SnapshotError.hpp"

namespace ResultJson {
    // {"query":"name"|"pid","name":..,"pid":..,"running":..}
    nlohmann::json Query(QueryKind kind, const FindProcess::QueryResult& r);

    // {"pid":..,"exe":..}
    nlohmann::json Process(const FindProcess::ProcessRecord& p);

    // Envelope come l'API REST: {"ok":true,"result":..}
    nlohmann::json Ok(const nlohmann::json& result);

    // {"ok":false,"error":"snapshot_failed","stage":..,"code":..,"message":..}
    nlohmann::json SnapshotFailure(const FindProcess::SnapshotError& e);

    // {"ok":false,"error":<code>,"message":..}
    nlohmann::json Fail(const std::string& error, const std::string& message);
}
