/**
 * Card Battle Engine - Effect Descriptor Parsing
 *
 * Converts card-data JSON into typed descriptors. Malformed input throws
 * std::invalid_argument naming the offending field; CardRepository catches
 * and reports it.
 */

#pragma once

#include "card_repository.hpp"
#include <nlohmann/json_fwd.hpp>

namespace cardbattle {

AmountSpec parse_amount(const nlohmann::json& j);
FieldCriteria parse_field_criteria(const nlohmann::json& j);
FieldTarget parse_field_target(const nlohmann::json& j);
EnergySource parse_energy_source(const nlohmann::json& j);
Trigger parse_trigger(const nlohmann::json& j);
DurationKind parse_duration(const nlohmann::json& j);
Effect parse_effect(const nlohmann::json& j);
std::vector<Effect> parse_effects(const nlohmann::json& j);

CreatureData parse_creature(const nlohmann::json& j);
SupporterData parse_supporter(const nlohmann::json& j);
ItemData parse_item(const nlohmann::json& j);
ToolData parse_tool(const nlohmann::json& j);

} // namespace cardbattle
