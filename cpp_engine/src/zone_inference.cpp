/**
 * Arena Tracker - Zone-Role Inference Implementation
 */

#include "zone_inference.hpp"
#include <algorithm>
#include <cstdlib>
#include <functional>
#include <sstream>

namespace arena {

namespace {

const char* const UNKNOWN_ZONE = "unknown zone";
const char* const TOKEN_CREATED = "TokenCreated";

bool is_labeled(const ZoneRoleMap& roles, ZoneId zone) {
    return roles.find(zone) != roles.end();
}

std::optional<ZoneRole> role_of(const ZoneRoleMap& roles, std::optional<ZoneId> zone) {
    if (!zone.has_value()) return std::nullopt;
    auto it = roles.find(*zone);
    if (it == roles.end()) return std::nullopt;
    return it->second;
}

/**
 * Highest-scoring unlabeled zone that passes the filter. Zones are visited
 * in encounter order and only a strictly better score replaces the leader.
 */
std::optional<ZoneId> pick_best(const ZoneAnalysis& analysis, const ZoneRoleMap& roles,
                                const std::function<bool(const ZoneStats&)>& eligible,
                                const std::function<int(const ZoneStats&)>& score) {
    std::optional<ZoneId> best;
    int best_score = 0;
    for (ZoneId zone : analysis.encounter_order) {
        if (is_labeled(roles, zone)) continue;
        const ZoneStats& s = analysis.stats.at(zone);
        if (!eligible(s)) continue;
        int value = score(s);
        if (!best.has_value() || value > best_score) {
            best = zone;
            best_score = value;
        }
    }
    return best;
}

void note_zone(ZoneAnalysis& analysis, ZoneId zone) {
    if (analysis.stats.find(zone) == analysis.stats.end()) {
        ZoneStats s;
        s.first_seen = analysis.encounter_order.size();
        analysis.stats[zone] = s;
        analysis.encounter_order.push_back(zone);
    }
}

} // namespace

bool is_named_transfer(const ZoneTransferRecord& transfer) {
    return transfer.card_grp_id.has_value() && *transfer.card_grp_id != 0;
}

ZoneAnalysis compute_zone_stats(const std::vector<ZoneTransferRecord>& transfers) {
    ZoneAnalysis analysis;
    analysis.transfers = transfers;

    for (const auto& t : transfers) {
        bool named = is_named_transfer(t);

        if (t.from_zone.has_value()) {
            note_zone(analysis, *t.from_zone);
            ZoneStats& src = analysis.stats[*t.from_zone];
            if (named) {
                src.named_departures++;
                if (t.to_zone.has_value()) {
                    src.named_destinations.insert(*t.to_zone);
                }
            } else {
                src.anonymous_departures++;
            }
        }
        if (t.to_zone.has_value()) {
            note_zone(analysis, *t.to_zone);
            if (named) {
                analysis.stats[*t.to_zone].named_arrivals++;
            }
        }
    }

    return analysis;
}

// ============================================================================
// PASSES
// ============================================================================

ZoneRoleMap assign_battlefield(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    auto zone = pick_best(analysis, roles,
        [](const ZoneStats& s) { return s.named_arrivals >= 1; },
        [](const ZoneStats& s) { return s.net(); });
    if (zone) roles[*zone] = ZoneRole::BATTLEFIELD;
    return roles;
}

ZoneRoleMap assign_stack(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    auto zone = pick_best(analysis, roles,
        [](const ZoneStats& s) { return s.named_arrivals >= 3 && std::abs(s.net()) <= 3; },
        [](const ZoneStats& s) { return s.named_arrivals; });
    if (zone) roles[*zone] = ZoneRole::STACK;
    return roles;
}

ZoneRoleMap assign_opponent_library(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    auto zone = pick_best(analysis, roles,
        [](const ZoneStats& s) { return s.anonymous_departures >= 1; },
        [](const ZoneStats& s) { return s.anonymous_departures; });
    if (zone) roles[*zone] = ZoneRole::OPPONENT_LIBRARY;
    return roles;
}

ZoneRoleMap assign_opponent_hand(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    std::optional<ZoneId> library;
    for (const auto& [zone, role] : roles) {
        if (role == ZoneRole::OPPONENT_LIBRARY) {
            library = zone;
            break;
        }
    }
    if (!library.has_value()) {
        return roles;
    }

    auto first_destination = [&](bool named) -> std::optional<ZoneId> {
        for (const auto& t : analysis.transfers) {
            if (is_named_transfer(t) != named) continue;
            if (t.from_zone != library || !t.to_zone.has_value()) continue;
            if (!is_labeled(roles, *t.to_zone)) return t.to_zone;
        }
        return std::nullopt;
    };

    // Opponent draws are face down, so fall back to anonymous transfers
    auto zone = first_destination(true);
    if (!zone) zone = first_destination(false);
    if (zone) roles[*zone] = ZoneRole::OPPONENT_HAND;
    return roles;
}

ZoneRoleMap assign_player_library(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    auto zone = pick_best(analysis, roles,
        [](const ZoneStats& s) {
            return s.named_departures >= 3 && s.net() <= -3 && s.named_destinations.size() == 1;
        },
        [](const ZoneStats&) { return 0; });
    if (zone) roles[*zone] = ZoneRole::LIBRARY;
    return roles;
}

ZoneRoleMap assign_hands(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    const ZoneRoleMap labeled = roles;
    for (const auto& t : analysis.transfers) {
        if (!is_named_transfer(t) || !t.to_zone.has_value()) continue;
        auto from = role_of(labeled, t.from_zone);
        if (!from || base_role(*from) != ZoneRole::LIBRARY) continue;
        if (is_labeled(roles, *t.to_zone)) continue;
        roles[*t.to_zone] = (*from == ZoneRole::OPPONENT_LIBRARY) ? ZoneRole::OPPONENT_HAND
                                                                  : ZoneRole::HAND;
    }
    return roles;
}

ZoneRoleMap assign_graveyards(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    const ZoneRoleMap labeled = roles;
    for (const auto& t : analysis.transfers) {
        if (!is_named_transfer(t) || !t.to_zone.has_value()) continue;
        auto from = role_of(labeled, t.from_zone);
        if (!from || (*from != ZoneRole::BATTLEFIELD && *from != ZoneRole::STACK)) continue;
        if (is_labeled(roles, *t.to_zone)) continue;
        if (analysis.stats.at(*t.to_zone).net() >= 1) {
            roles[*t.to_zone] = ZoneRole::GRAVEYARD;
        }
    }
    return roles;
}

ZoneRoleMap assign_exile(const ZoneAnalysis& analysis, ZoneRoleMap roles) {
    for (ZoneId zone : analysis.encounter_order) {
        if (is_labeled(roles, zone)) continue;
        if (analysis.stats.at(zone).named_arrivals <= 2) {
            roles[zone] = ZoneRole::EXILE;
        }
    }
    return roles;
}

ZoneRoleMap infer_zone_roles(const ZoneAnalysis& analysis) {
    using Pass = ZoneRoleMap (*)(const ZoneAnalysis&, ZoneRoleMap);
    static const Pass passes[] = {
        assign_battlefield,
        assign_stack,
        assign_opponent_library,
        assign_opponent_hand,
        assign_player_library,
        assign_hands,
        assign_graveyards,
        assign_exile,
    };

    ZoneRoleMap roles;
    for (Pass pass : passes) {
        roles = pass(analysis, std::move(roles));
    }
    return roles;
}

ZoneRoleMap infer_zone_roles(const std::vector<ZoneTransferRecord>& transfers) {
    return infer_zone_roles(compute_zone_stats(transfers));
}

// ============================================================================
// REPLAY
// ============================================================================

std::string replay_verb(ZoneRole from, ZoneRole to) {
    ZoneRole f = base_role(from);
    ZoneRole t = base_role(to);

    switch (f) {
        case ZoneRole::HAND:
            if (t == ZoneRole::BATTLEFIELD) return "entered the battlefield";
            if (t == ZoneRole::STACK) return "cast";
            break;
        case ZoneRole::STACK:
            if (t == ZoneRole::BATTLEFIELD) return "entered the battlefield";
            if (t == ZoneRole::EXILE) return "was exiled";
            if (t == ZoneRole::GRAVEYARD) return "resolved";
            break;
        case ZoneRole::LIBRARY:
            if (t == ZoneRole::BATTLEFIELD) return "put onto the battlefield";
            if (t == ZoneRole::HAND) return "drawn";
            break;
        case ZoneRole::BATTLEFIELD:
            if (t == ZoneRole::GRAVEYARD) return "died";
            if (t == ZoneRole::EXILE) return "was exiled";
            if (t == ZoneRole::HAND) return "bounced to hand";
            if (t == ZoneRole::LIBRARY) return "shuffled into library";
            break;
        default:
            break;
    }
    return "";
}

Replay build_replay(const std::vector<ZoneTransferRecord>& transfers,
                    const std::vector<LifeChangeRecord>& life_changes,
                    const ReplayOptions& options) {
    Replay replay;
    ZoneAnalysis analysis = compute_zone_stats(transfers);
    replay.roles = infer_zone_roles(analysis);

    // Player hand: a Hand zone fed by a named transfer from a Library
    for (const auto& t : transfers) {
        if (!is_named_transfer(t)) continue;
        auto from = role_of(replay.roles, t.from_zone);
        auto to = role_of(replay.roles, t.to_zone);
        if (from == ZoneRole::LIBRARY && to == ZoneRole::HAND) {
            replay.player_hand = t.to_zone;
            break;
        }
    }
    for (const auto& [zone, role] : replay.roles) {
        if (role == ZoneRole::OPPONENT_HAND) {
            replay.opponent_hand = zone;
            break;
        }
    }

    std::vector<LifeChangeRecord> life = life_changes;
    std::stable_sort(life.begin(), life.end(),
        [](const LifeChangeRecord& a, const LifeChangeRecord& b) {
            return a.game_state_id < b.game_state_id;
        });
    std::map<SeatId, int> totals;
    size_t life_pos = 0;

    auto label_for = [&](std::optional<ZoneRole> role) -> std::string {
        return role ? to_string(*role) : UNKNOWN_ZONE;
    };

    for (const auto& t : transfers) {
        if (!is_named_transfer(t)) continue;

        while (life_pos < life.size() && life[life_pos].game_state_id <= t.game_state_id) {
            totals[life[life_pos].seat_id] = life[life_pos].life_total;
            life_pos++;
        }

        auto from = role_of(replay.roles, t.from_zone);
        auto to = role_of(replay.roles, t.to_zone);

        std::string verb;
        if (t.category == TOKEN_CREATED) {
            verb = "token created";
        } else if (!from || !to) {
            verb = "moved";
        } else {
            if (base_role(*to) == ZoneRole::STACK && base_role(*from) != ZoneRole::HAND) {
                continue;
            }
            verb = replay_verb(*from, *to);
            if (verb.empty()) {
                continue;
            }
        }

        ReplayStep step;
        step.game_state_id = t.game_state_id;
        step.turn_number = t.turn_number;
        step.verb = verb;
        step.grp_id = *t.card_grp_id;
        step.instance_id = t.instance_id;
        step.from_zone = t.from_zone;
        step.to_zone = t.to_zone;
        step.from_label = label_for(from);
        step.to_label = label_for(to);

        if (t.from_zone.has_value() && t.from_zone == replay.player_hand) {
            step.actor = Actor::YOU;
        } else if (t.from_zone.has_value() && t.from_zone == replay.opponent_hand) {
            step.actor = Actor::OPPONENT;
        } else if (t.to_zone.has_value() && t.to_zone == replay.player_hand) {
            step.actor = Actor::YOU;
        } else if (t.to_zone.has_value() && t.to_zone == replay.opponent_hand) {
            step.actor = Actor::OPPONENT;
        }

        const CardFacts* card = options.cards ? options.cards->lookup(step.grp_id) : nullptr;
        step.card_name = card ? card->name
                              : "Unknown Card (" + std::to_string(step.grp_id) + ")";

        for (const auto& [seat, total] : totals) {
            if (seat == options.player_seat) {
                step.player_life = total;
            } else if (!step.opponent_life.has_value()) {
                step.opponent_life = total;
            }
        }

        replay.steps.push_back(std::move(step));
    }

    return replay;
}

std::string format_replay_step(const ReplayStep& step) {
    std::ostringstream out;
    out << "T" << step.turn_number << " " << to_string(step.actor) << ": "
        << step.card_name << " " << step.verb
        << " (" << step.from_label << " -> " << step.to_label << ")";

    if (step.player_life.has_value() || step.opponent_life.has_value()) {
        out << " [";
        if (step.player_life) out << *step.player_life; else out << "?";
        out << " / ";
        if (step.opponent_life) out << *step.opponent_life; else out << "?";
        out << "]";
    }
    return out.str();
}

} // namespace arena
