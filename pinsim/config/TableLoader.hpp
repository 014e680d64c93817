#pragma once

#include <string>
#include <vector>

#include "pinsim/core/SimulationConfig.hpp"
#include "pinsim/scene/PlayfieldData.hpp"
#include "pinsim/wiring/SignalNetwork.hpp"

namespace pinsim::config
{
constexpr int kTableAssetVersion = 1;

/// Authored playfield: simulation settings, device data and wiring.
struct TableDefinition
{
    int assetVersion = kTableAssetVersion;
    core::SimulationConfig simulation;
    std::vector<scene::KickerData> kickers;
    std::vector<scene::PlungerData> plungers;
    std::vector<scene::RampData> ramps;
    std::vector<scene::RubberData> rubbers;
    std::vector<wiring::WireMapping> wires;
};

// Missing fields keep their defaults. Returns false on I/O errors, malformed JSON,
// wrong field types and unsupported asset versions.
bool ParseTableJson(const std::string& text, TableDefinition* outTable, std::string* outError = nullptr);
bool LoadTableFromJsonFile(const std::string& path, TableDefinition* outTable, std::string* outError = nullptr);

[[nodiscard]] std::string TableToJsonString(const TableDefinition& table);
bool SaveTableToJsonFile(const std::string& path, const TableDefinition& table, std::string* outError = nullptr);
} // namespace pinsim::config
