#pragma once
#include <string>
#include <nlohmann/json.hpp>
#include "utils/Config.hpp"

// Carica e valida il JSON (strict). Ritorna true se valido.
// "configPath" può essere, ad esempio, "queries.json".
bool LoadConfigStrict(AppConfig& cfg, std::string& outErr, const std::string& configPath);

// Come sopra ma su un JSON già parsato (usato anche dai test)
bool ParseConfigStrict(AppConfig& cfg, std::string& outErr, const nlohmann::json& j);
