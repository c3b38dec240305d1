/**
 * Card Battle Engine - Python Bindings
 *
 * pybind11 wrapper for the C++ engine.
 * Exposes game setup, actions, state inspection and the pending
 * selection as JSON for transports written in Python.
 */

#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/operators.h>

#include <nlohmann/json.hpp>

#include "card_battle.hpp"

namespace py = pybind11;

PYBIND11_MODULE(card_battle_cpp, m) {
    m.doc() = "Effect-resolution engine for a two-player creature card battle game";

    // ========================================================================
    // ENUMS
    // ========================================================================

    py::enum_<cardbattle::EnergyType>(m, "EnergyType")
        .value("FIRE", cardbattle::EnergyType::FIRE)
        .value("WATER", cardbattle::EnergyType::WATER)
        .value("GRASS", cardbattle::EnergyType::GRASS)
        .value("LIGHTNING", cardbattle::EnergyType::LIGHTNING)
        .value("PSYCHIC", cardbattle::EnergyType::PSYCHIC)
        .value("FIGHTING", cardbattle::EnergyType::FIGHTING)
        .value("DARKNESS", cardbattle::EnergyType::DARKNESS)
        .value("METAL", cardbattle::EnergyType::METAL)
        .value("COLORLESS", cardbattle::EnergyType::COLORLESS)
        .export_values();

    py::enum_<cardbattle::StatusCondition>(m, "StatusCondition")
        .value("SLEEP", cardbattle::StatusCondition::SLEEP)
        .value("BURN", cardbattle::StatusCondition::BURN)
        .value("CONFUSION", cardbattle::StatusCondition::CONFUSION)
        .value("PARALYSIS", cardbattle::StatusCondition::PARALYSIS)
        .value("POISON", cardbattle::StatusCondition::POISON)
        .export_values();

    py::enum_<cardbattle::CardCategory>(m, "CardCategory")
        .value("CREATURE", cardbattle::CardCategory::CREATURE)
        .value("SUPPORTER", cardbattle::CardCategory::SUPPORTER)
        .value("ITEM", cardbattle::CardCategory::ITEM)
        .value("TOOL", cardbattle::CardCategory::TOOL)
        .export_values();

    py::enum_<cardbattle::GameResult>(m, "GameResult")
        .value("ONGOING", cardbattle::GameResult::ONGOING)
        .value("PLAYER_0_WIN", cardbattle::GameResult::PLAYER_0_WIN)
        .value("PLAYER_1_WIN", cardbattle::GameResult::PLAYER_1_WIN)
        .value("DRAW", cardbattle::GameResult::DRAW)
        .export_values();

    py::enum_<cardbattle::ActionType>(m, "ActionType")
        .value("PLAY_CARD", cardbattle::ActionType::PLAY_CARD)
        .value("ATTACH_ENERGY", cardbattle::ActionType::ATTACH_ENERGY)
        .value("EVOLVE", cardbattle::ActionType::EVOLVE)
        .value("RETREAT", cardbattle::ActionType::RETREAT)
        .value("ATTACK", cardbattle::ActionType::ATTACK)
        .value("USE_ABILITY", cardbattle::ActionType::USE_ABILITY)
        .value("SELECT_TARGET", cardbattle::ActionType::SELECT_TARGET)
        .value("PROMOTE_ACTIVE", cardbattle::ActionType::PROMOTE_ACTIVE)
        .value("END_TURN", cardbattle::ActionType::END_TURN)
        .export_values();

    py::enum_<cardbattle::TurnStage>(m, "TurnStage")
        .value("MAIN", cardbattle::TurnStage::MAIN)
        .value("END_OF_TURN", cardbattle::TurnStage::END_OF_TURN)
        .value("CHECKUP", cardbattle::TurnStage::CHECKUP)
        .value("START_OF_TURN", cardbattle::TurnStage::START_OF_TURN)
        .export_values();

    py::enum_<cardbattle::TargetRole>(m, "TargetRole")
        .value("SOURCE", cardbattle::TargetRole::SOURCE)
        .value("TARGET", cardbattle::TargetRole::TARGET)
        .export_values();

    // ========================================================================
    // CARDS AND ZONES
    // ========================================================================

    py::class_<cardbattle::CardRef>(m, "CardRef")
        .def(py::init<>())
        .def_readwrite("instance_id", &cardbattle::CardRef::instance_id)
        .def_readwrite("template_id", &cardbattle::CardRef::template_id);

    py::class_<cardbattle::Zone>(m, "Zone")
        .def(py::init<>())
        .def_readonly("cards", &cardbattle::Zone::cards)
        .def("count", &cardbattle::Zone::count)
        .def("is_empty", &cardbattle::Zone::is_empty);

    py::class_<cardbattle::FieldPosition>(m, "FieldPosition")
        .def(py::init<>())
        .def_readwrite("player_id", &cardbattle::FieldPosition::player_id)
        .def_readwrite("field_index", &cardbattle::FieldPosition::field_index)
        .def(py::self == py::self)
        .def(py::self != py::self);

    py::class_<cardbattle::FieldCard>(m, "FieldCard")
        .def_readonly("damage_taken", &cardbattle::FieldCard::damage_taken)
        .def_readonly("turn_played", &cardbattle::FieldCard::turn_played)
        .def_readonly("ability_used_this_turn", &cardbattle::FieldCard::ability_used_this_turn)
        .def("field_instance_id", &cardbattle::FieldCard::field_instance_id)
        .def("instance_id", &cardbattle::FieldCard::instance_id)
        .def("template_id", &cardbattle::FieldCard::template_id)
        .def("has_status", &cardbattle::FieldCard::has_status);

    py::class_<cardbattle::Field>(m, "Field")
        .def_readonly("active_spot", &cardbattle::Field::active_spot)
        .def_readonly("bench", &cardbattle::Field::bench)
        .def_readonly("max_bench_size", &cardbattle::Field::max_bench_size)
        .def("has_active", &cardbattle::Field::has_active)
        .def("get_bench_count", &cardbattle::Field::get_bench_count)
        .def("count_creatures", &cardbattle::Field::count_creatures);

    py::class_<cardbattle::PlayerState>(m, "PlayerState")
        .def_readonly("player_id", &cardbattle::PlayerState::player_id)
        .def_readonly("deck", &cardbattle::PlayerState::deck)
        .def_readonly("hand", &cardbattle::PlayerState::hand)
        .def_readonly("discard", &cardbattle::PlayerState::discard)
        .def_readonly("field", &cardbattle::PlayerState::field)
        .def_readonly("points", &cardbattle::PlayerState::points)
        .def_readonly("supporter_played_this_turn", &cardbattle::PlayerState::supporter_played_this_turn)
        .def_readonly("energy_attached_this_turn", &cardbattle::PlayerState::energy_attached_this_turn)
        .def_readonly("retreated_this_turn", &cardbattle::PlayerState::retreated_this_turn)
        .def_readonly("awaiting_promotion", &cardbattle::PlayerState::awaiting_promotion)
        .def("collect_instance_ids", &cardbattle::PlayerState::collect_instance_ids);

    // ========================================================================
    // ACTION
    // ========================================================================

    py::class_<cardbattle::Action>(m, "Action")
        .def(py::init<>())
        .def(py::init<cardbattle::ActionType, cardbattle::PlayerID>())
        .def_readwrite("action_type", &cardbattle::Action::action_type)
        .def_readwrite("player_id", &cardbattle::Action::player_id)
        .def_readwrite("card_id", &cardbattle::Action::card_id)
        .def_readwrite("position", &cardbattle::Action::position)
        .def_readwrite("attack_index", &cardbattle::Action::attack_index)
        .def_readwrite("choice_index", &cardbattle::Action::choice_index)
        .def("__str__", &cardbattle::Action::to_string)
        .def("__repr__", &cardbattle::Action::to_string)
        // Factory methods
        .def_static("end_turn", &cardbattle::Action::end_turn)
        .def_static("play_card", &cardbattle::Action::play_card,
                    py::arg("player"), py::arg("card"), py::arg("position") = py::none())
        .def_static("attach_energy", &cardbattle::Action::attach_energy)
        .def_static("evolve", &cardbattle::Action::evolve)
        .def_static("retreat", &cardbattle::Action::retreat)
        .def_static("attack", &cardbattle::Action::attack)
        .def_static("use_ability", &cardbattle::Action::use_ability)
        .def_static("select_target", &cardbattle::Action::select_target)
        .def_static("promote_active", &cardbattle::Action::promote_active);

    py::class_<cardbattle::ActionResult>(m, "ActionResult")
        .def_readonly("success", &cardbattle::ActionResult::success)
        .def_readonly("message", &cardbattle::ActionResult::message)
        .def("__bool__", [](const cardbattle::ActionResult& r) { return r.success; });

    // ========================================================================
    // GAME STATE
    // ========================================================================

    py::class_<cardbattle::GameConfig>(m, "GameConfig")
        .def(py::init<>())
        .def_readwrite("win_points", &cardbattle::GameConfig::win_points)
        .def_readwrite("max_bench_size", &cardbattle::GameConfig::max_bench_size)
        .def_readwrite("max_hand_size", &cardbattle::GameConfig::max_hand_size)
        .def_readwrite("initial_hand_size", &cardbattle::GameConfig::initial_hand_size)
        .def_readwrite("max_resolution_steps", &cardbattle::GameConfig::max_resolution_steps)
        .def_readwrite("starting_player", &cardbattle::GameConfig::starting_player)
        .def_static("load", [](const std::string& path) {
            cardbattle::GameConfig config;
            if (!cardbattle::load_game_config(path, config)) {
                throw std::invalid_argument("Cannot load game config: " + path);
            }
            return config;
        });

    py::class_<cardbattle::DeckList>(m, "DeckList")
        .def(py::init<>())
        .def(py::init([](std::vector<cardbattle::TemplateID> cards,
                         std::vector<cardbattle::EnergyType> energy_types) {
            return cardbattle::DeckList{std::move(cards), std::move(energy_types)};
        }))
        .def_readwrite("cards", &cardbattle::DeckList::cards)
        .def_readwrite("energy_types", &cardbattle::DeckList::energy_types);

    py::class_<cardbattle::GameState>(m, "GameState")
        .def(py::init<>())
        .def_readonly("players", &cardbattle::GameState::players)
        .def_readonly("turn_number", &cardbattle::GameState::turn_number)
        .def_readonly("current_player", &cardbattle::GameState::current_player)
        .def_readonly("turn_stage", &cardbattle::GameState::turn_stage)
        .def_readonly("result", &cardbattle::GameState::result)
        .def_readonly("winner_id", &cardbattle::GameState::winner_id)
        .def_readonly("config", &cardbattle::GameState::config)
        .def_readonly("executed_actions", &cardbattle::GameState::executed_actions)
        .def("get_player", py::overload_cast<cardbattle::PlayerID>(&cardbattle::GameState::get_player),
             py::return_value_policy::reference_internal)
        .def("current_energy", [](const cardbattle::GameState& s, cardbattle::PlayerID player) {
            return s.energy.current_energy.at(player);
        })
        .def("attached_energy", [](const cardbattle::GameState& s, const cardbattle::InstanceID& id) {
            return s.energy.get_attached(id);
        })
        .def("discarded_energy", [](const cardbattle::GameState& s, cardbattle::PlayerID player) {
            return s.energy.discarded.at(player);
        })
        .def("is_game_over", &cardbattle::GameState::is_game_over)
        .def("is_awaiting_selection", &cardbattle::GameState::is_awaiting_selection)
        .def("is_awaiting_promotion", &cardbattle::GameState::is_awaiting_promotion)
        .def("pending_selection_json", [](const cardbattle::GameState& s) -> py::object {
            if (!s.pending_selection) {
                return py::none();
            }
            return py::str(nlohmann::json(*s.pending_selection).dump());
        })
        .def("clone", &cardbattle::GameState::clone);

    // ========================================================================
    // CARD REPOSITORY
    // ========================================================================

    py::class_<cardbattle::CardRepository>(m, "CardRepository")
        .def(py::init<>())
        .def("load_from_json", &cardbattle::CardRepository::load_from_json)
        .def("load_from_string", &cardbattle::CardRepository::load_from_string)
        .def("has_card", &cardbattle::CardRepository::has_card)
        .def("get_category", &cardbattle::CardRepository::get_category)
        .def("get_evolution_stage", &cardbattle::CardRepository::get_evolution_stage)
        .def("get_all_template_ids", &cardbattle::CardRepository::get_all_template_ids)
        .def("card_count", &cardbattle::CardRepository::card_count);

    // ========================================================================
    // ENGINE
    // ========================================================================

    py::class_<cardbattle::XRayLogger>(m, "XRayLogger")
        .def(py::init<const cardbattle::CardRepository*, const std::string&>(),
             py::arg("repo") = nullptr, py::arg("output_dir") = "xrays")
        .def("get_log_path", &cardbattle::XRayLogger::get_log_path)
        .def("is_enabled", &cardbattle::XRayLogger::is_enabled)
        .def("set_enabled", &cardbattle::XRayLogger::set_enabled);

    py::class_<cardbattle::BattleEngine>(m, "BattleEngine")
        .def(py::init<>())
        .def(py::init<cardbattle::CardRepository>())
        .def("load_cards", &cardbattle::BattleEngine::load_cards)
        .def("create_game", &cardbattle::BattleEngine::create_game,
             py::arg("deck0"), py::arg("deck1"), py::arg("seed"),
             py::arg("config") = cardbattle::GameConfig())
        .def("get_legal_actions", &cardbattle::BattleEngine::get_legal_actions)
        .def("validate_action", &cardbattle::BattleEngine::validate_action)
        .def("step", [](const cardbattle::BattleEngine& engine, const cardbattle::GameState& state,
                        const cardbattle::Action& action) {
            cardbattle::ActionResult result;
            cardbattle::GameState next = engine.step(state, action, &result);
            return py::make_tuple(std::move(next), result);
        })
        .def("step_inplace", &cardbattle::BattleEngine::step_inplace)
        .def("restore_pending_selection", [](const cardbattle::BattleEngine&, cardbattle::GameState& state,
                                             const std::string& text) {
            state.pending_selection = nlohmann::json::parse(text).get<cardbattle::PendingSelection>();
        })
        .def("calculate_retreat_cost", &cardbattle::BattleEngine::calculate_retreat_cost)
        .def("calculate_attack_damage", &cardbattle::BattleEngine::calculate_attack_damage)
        .def("check_win_conditions", &cardbattle::BattleEngine::check_win_conditions)
        .def("get_card_repository",
             py::overload_cast<>(&cardbattle::BattleEngine::get_card_repository, py::const_),
             py::return_value_policy::reference_internal)
        .def("set_logger", &cardbattle::BattleEngine::set_logger, py::keep_alive<1, 2>());

    // ========================================================================
    // MODULE INFO
    // ========================================================================

    m.attr("VERSION") = cardbattle::get_version();
    m.attr("__version__") = cardbattle::get_version();
}
