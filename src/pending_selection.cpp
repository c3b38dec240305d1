/**
 * Card Battle Engine - Pending Selection Serialization
 *
 * JSON form of a suspended effect, so a paused game can be handed to a
 * transport and restored.
 */

#include "pending_selection.hpp"
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace cardbattle {

NLOHMANN_JSON_SERIALIZE_ENUM(ContextType, {
    {ContextType::ATTACK, "attack"},
    {ContextType::ABILITY, "ability"},
    {ContextType::TRAINER, "trainer"},
    {ContextType::TOOL, "tool"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(EffectOrigin, {
    {EffectOrigin::CARD, "card"},
    {EffectOrigin::ATTACK, "attack"},
    {EffectOrigin::ABILITY, "ability"},
    {EffectOrigin::TOOL, "tool"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TargetRole, {
    {TargetRole::SOURCE, "source"},
    {TargetRole::TARGET, "target"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(TriggerKind, {
    {TriggerKind::MANUAL, "manual"},
    {TriggerKind::END_OF_TURN, "end-of-turn"},
    {TriggerKind::START_OF_TURN, "start-of-turn"},
    {TriggerKind::ON_CHECKUP, "on-checkup"},
    {TriggerKind::DAMAGED, "damaged"},
    {TriggerKind::ENERGY_ATTACHMENT, "energy-attachment"},
    {TriggerKind::ON_PLAY, "on-play"},
    {TriggerKind::BEFORE_KNOCKOUT, "before-knockout"},
    {TriggerKind::ON_RETREAT, "on-retreat"},
    {TriggerKind::PASSIVE, "passive"},
})

void to_json(json& j, const FieldPosition& p) {
    j = json{{"playerId", p.player_id}, {"fieldIndex", p.field_index}};
}

void from_json(const json& j, FieldPosition& p) {
    p.player_id = j.at("playerId").get<PlayerID>();
    p.field_index = j.at("fieldIndex").get<int>();
}

void to_json(json& j, const EffectRef& ref) {
    j = json{
        {"templateId", ref.template_id},
        {"origin", ref.origin},
        {"groupIndex", ref.group_index},
        {"effectIndex", ref.effect_index}
    };
}

void from_json(const json& j, EffectRef& ref) {
    ref.template_id = j.at("templateId").get<std::string>();
    ref.origin = j.at("origin").get<EffectOrigin>();
    ref.group_index = j.value("groupIndex", 0);
    ref.effect_index = j.value("effectIndex", 0);
}

void to_json(json& j, const EffectContext& ctx) {
    j = json{
        {"type", ctx.type},
        {"sourcePlayer", ctx.source_player},
        {"effectName", ctx.effect_name}
    };
    if (ctx.source_instance_id) j["sourceInstanceId"] = *ctx.source_instance_id;
    if (ctx.trigger) j["trigger"] = *ctx.trigger;
}

void from_json(const json& j, EffectContext& ctx) {
    ctx.type = j.at("type").get<ContextType>();
    ctx.source_player = j.at("sourcePlayer").get<PlayerID>();
    ctx.effect_name = j.value("effectName", "");
    ctx.source_instance_id.reset();
    if (j.contains("sourceInstanceId")) {
        ctx.source_instance_id = j["sourceInstanceId"].get<std::string>();
    }
    ctx.trigger.reset();
    if (j.contains("trigger")) {
        ctx.trigger = j["trigger"].get<TriggerKind>();
    }
}

void to_json(json& j, const QueuedEffect& q) {
    j = json{{"effect", q.ref}, {"context", q.context}};
    if (q.slots.source) j["resolvedSource"] = *q.slots.source;
    if (q.slots.target) j["resolvedTarget"] = *q.slots.target;
}

void from_json(const json& j, QueuedEffect& q) {
    q.ref = j.at("effect").get<EffectRef>();
    q.context = j.at("context").get<EffectContext>();
    q.slots = ResolvedSlots{};
    if (j.contains("resolvedSource")) {
        q.slots.source = j["resolvedSource"].get<std::vector<FieldPosition>>();
    }
    if (j.contains("resolvedTarget")) {
        q.slots.target = j["resolvedTarget"].get<std::vector<FieldPosition>>();
    }
}

void to_json(json& j, const PendingSelection& s) {
    j = json{
        {"pending", s.effect},
        {"role", s.role},
        {"chooser", s.chooser},
        {"candidates", s.candidates}
    };
}

void from_json(const json& j, PendingSelection& s) {
    s.effect = j.at("pending").get<QueuedEffect>();
    s.role = j.at("role").get<TargetRole>();
    s.chooser = j.at("chooser").get<PlayerID>();
    s.candidates = j.at("candidates").get<std::vector<FieldPosition>>();
}

} // namespace cardbattle
