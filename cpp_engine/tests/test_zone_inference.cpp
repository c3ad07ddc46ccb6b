/**
 * Tests for Zone-Role Inference and Match Replay
 */

#include <sstream>
#include <filesystem>
#include <fstream>
#include "zone_inference.hpp"
#include "replay_logger.hpp"

using namespace arena;

namespace {

// Zone ids used by the sample match
constexpr ZoneId LIB = 31;
constexpr ZoneId HAND = 32;
constexpr ZoneId STACK = 33;
constexpr ZoneId FIELD = 34;
constexpr ZoneId YARD = 35;
constexpr ZoneId OPP_LIB = 36;
constexpr ZoneId OPP_HAND = 37;
constexpr ZoneId EXILE = 38;

/**
 * Zone transfer shorthand. grp_id == 0 builds an anonymous (face-down) transfer.
 */
ZoneTransferRecord zt(int gsid, InstanceId instance, GrpId grp_id,
                      std::optional<ZoneId> from, std::optional<ZoneId> to,
                      const std::string& category = "") {
    ZoneTransferRecord t;
    t.game_state_id = gsid;
    t.turn_number = 1 + gsid / 10;
    t.instance_id = instance;
    if (grp_id != 0) {
        t.card_grp_id = grp_id;
    }
    t.from_zone = from;
    t.to_zone = to;
    t.category = category;
    return t;
}

/**
 * A short two-player game: ten draws, spells on both sides, a land drop,
 * one creature dying and one flickered through exile.
 */
std::vector<ZoneTransferRecord> sample_game() {
    std::vector<ZoneTransferRecord> transfers;
    int gsid = 1;

    for (InstanceId id = 101; id <= 110; id++) {
        transfers.push_back(zt(gsid++, id, 70000 + id, LIB, HAND, "Draw"));
    }
    for (InstanceId id = 101; id <= 104; id++) {
        transfers.push_back(zt(gsid++, id, 70000 + id, HAND, STACK, "CastSpell"));
    }
    for (InstanceId id = 101; id <= 103; id++) {
        transfers.push_back(zt(gsid++, id, 70000 + id, STACK, FIELD, "Resolve"));
    }
    transfers.push_back(zt(gsid++, 104, 70104, STACK, YARD, "Resolve"));
    transfers.push_back(zt(gsid++, 105, 70105, HAND, FIELD, "PlayLand"));
    transfers.push_back(zt(gsid++, 106, 70106, HAND, FIELD, "PlayLand"));
    transfers.push_back(zt(gsid++, 101, 70101, FIELD, YARD, "SBA_Damage"));
    transfers.push_back(zt(gsid++, 102, 70102, FIELD, EXILE, "Exile"));
    transfers.push_back(zt(gsid++, 102, 70102, EXILE, FIELD, "Return"));
    for (InstanceId id = 201; id <= 203; id++) {
        transfers.push_back(zt(gsid++, id, 0, OPP_LIB, OPP_HAND, "Draw"));
    }
    for (InstanceId id = 201; id <= 202; id++) {
        transfers.push_back(zt(gsid++, id, 80000 + id, OPP_HAND, STACK, "CastSpell"));
    }
    for (InstanceId id = 201; id <= 202; id++) {
        transfers.push_back(zt(gsid++, id, 80000 + id, STACK, FIELD, "Resolve"));
    }
    return transfers;
}

LifeChangeRecord life_change(int gsid, SeatId seat, int total) {
    LifeChangeRecord change;
    change.game_state_id = gsid;
    change.seat_id = seat;
    change.life_total = total;
    return change;
}

std::string role_name(const ZoneRoleMap& roles, ZoneId zone) {
    auto it = roles.find(zone);
    return it != roles.end() ? to_string(it->second) : "(none)";
}

} // namespace

// ============================================================================
// ZONE STATISTICS TESTS
// ============================================================================

TEST(ZoneStats, CountsNamedAndAnonymous) {
    auto analysis = compute_zone_stats(sample_game());

    const ZoneStats& lib = analysis.stats.at(LIB);
    TEST_ASSERT_EQ(10, lib.named_departures);
    TEST_ASSERT_EQ(-10, lib.net());
    TEST_ASSERT_EQ(1u, lib.named_destinations.size());

    const ZoneStats& opp_lib = analysis.stats.at(OPP_LIB);
    TEST_ASSERT_EQ(3, opp_lib.anonymous_departures);
    TEST_ASSERT_EQ(0, opp_lib.named_departures);

    TEST_ASSERT_EQ(6, analysis.stats.at(FIELD).net());
    TEST_ASSERT_EQ(0, analysis.stats.at(OPP_HAND).named_arrivals);
}

TEST(ZoneStats, EncounterOrder) {
    auto analysis = compute_zone_stats(sample_game());

    TEST_ASSERT_EQ(8u, analysis.encounter_order.size());
    TEST_ASSERT_EQ(LIB, analysis.encounter_order[0]);
    TEST_ASSERT_EQ(HAND, analysis.encounter_order[1]);
    TEST_ASSERT_EQ(EXILE, analysis.encounter_order[5]);
    TEST_ASSERT_EQ(5u, analysis.stats.at(EXILE).first_seen);
}

// ============================================================================
// ROLE INFERENCE TESTS
// ============================================================================

TEST(ZoneRoles, SampleGame) {
    auto roles = infer_zone_roles(sample_game());

    TEST_ASSERT_EQ(8u, roles.size());
    TEST_ASSERT_EQ(std::string("Library"), role_name(roles, LIB));
    TEST_ASSERT_EQ(std::string("Hand"), role_name(roles, HAND));
    TEST_ASSERT_EQ(std::string("Stack"), role_name(roles, STACK));
    TEST_ASSERT_EQ(std::string("Battlefield"), role_name(roles, FIELD));
    TEST_ASSERT_EQ(std::string("Graveyard"), role_name(roles, YARD));
    TEST_ASSERT_EQ(std::string("Library (opponent)"), role_name(roles, OPP_LIB));
    TEST_ASSERT_EQ(std::string("Hand (opponent)"), role_name(roles, OPP_HAND));
    TEST_ASSERT_EQ(std::string("Exile"), role_name(roles, EXILE));
}

TEST(ZoneRoles, BattlefieldTieGoesToFirstSeen) {
    std::vector<ZoneTransferRecord> transfers = {
        zt(1, 1, 500, 10, 20),
        zt(2, 2, 501, 10, 30),
    };
    auto roles = assign_battlefield(compute_zone_stats(transfers), {});

    TEST_ASSERT_EQ(1u, roles.size());
    TEST_ASSERT_EQ(std::string("Battlefield"), role_name(roles, 20));
}

TEST(ZoneRoles, StackNeedsBalancedFlow) {
    std::vector<ZoneTransferRecord> transfers;
    for (int i = 0; i < 4; i++) {
        transfers.push_back(zt(i + 1, 100 + i, 500 + i, 10, 20));
    }
    auto analysis = compute_zone_stats(transfers);

    // Four arrivals and nothing leaving: net 4 is too lopsided for a stack
    auto roles = assign_stack(analysis, {});
    TEST_ASSERT_TRUE(roles.empty());

    transfers.push_back(zt(9, 100, 500, 20, 30));
    roles = assign_stack(compute_zone_stats(transfers), {});
    TEST_ASSERT_EQ(std::string("Stack"), role_name(roles, 20));
}

TEST(ZoneRoles, PassesNeverRelabel) {
    auto analysis = compute_zone_stats(sample_game());
    ZoneRoleMap preset = {{STACK, ZoneRole::EXILE}};

    auto roles = assign_stack(analysis, preset);
    TEST_ASSERT_EQ(std::string("Exile"), role_name(roles, STACK));
    TEST_ASSERT_EQ(std::string("(none)"), role_name(roles, HAND));
}

TEST(ZoneRoles, LibraryNeedsSingleDestination) {
    std::vector<ZoneTransferRecord> transfers;
    for (int i = 0; i < 3; i++) {
        transfers.push_back(zt(i + 1, 100 + i, 500 + i, 10, 20));
    }
    transfers.push_back(zt(5, 103, 503, 10, 30));

    auto roles = assign_player_library(compute_zone_stats(transfers), {});
    TEST_ASSERT_TRUE(roles.empty());

    transfers.pop_back();
    roles = assign_player_library(compute_zone_stats(transfers), {});
    TEST_ASSERT_EQ(std::string("Library"), role_name(roles, 10));
}

TEST(ZoneRoles, OpponentHandPrefersNamedTransfer) {
    std::vector<ZoneTransferRecord> transfers = {
        zt(1, 201, 0, 40, 41),
        zt(2, 202, 0, 40, 41),
        zt(3, 203, 80203, 40, 42),
    };
    auto analysis = compute_zone_stats(transfers);
    auto roles = assign_opponent_library(analysis, {});
    roles = assign_opponent_hand(analysis, roles);

    TEST_ASSERT_EQ(std::string("Library (opponent)"), role_name(roles, 40));
    TEST_ASSERT_EQ(std::string("Hand (opponent)"), role_name(roles, 42));
    TEST_ASSERT_EQ(std::string("(none)"), role_name(roles, 41));
}

TEST(ZoneRoles, GraveyardNeedsPositiveNet) {
    auto analysis = compute_zone_stats(sample_game());
    ZoneRoleMap roles = {{STACK, ZoneRole::STACK}, {FIELD, ZoneRole::BATTLEFIELD}};

    roles = assign_graveyards(analysis, roles);
    TEST_ASSERT_EQ(std::string("Graveyard"), role_name(roles, YARD));
    TEST_ASSERT_EQ(std::string("(none)"), role_name(roles, EXILE));
}

TEST(ZoneRoles, ExileSkipsBusyZones) {
    std::vector<ZoneTransferRecord> transfers;
    for (int i = 0; i < 3; i++) {
        transfers.push_back(zt(i + 1, 100 + i, 500 + i, 10, 20));
    }
    auto roles = assign_exile(compute_zone_stats(transfers), {});

    TEST_ASSERT_EQ(std::string("Exile"), role_name(roles, 10));
    TEST_ASSERT_EQ(std::string("(none)"), role_name(roles, 20));
}

TEST(ZoneRoles, EmptyInput) {
    TEST_ASSERT_TRUE(infer_zone_roles(std::vector<ZoneTransferRecord>{}).empty());
}

// ============================================================================
// REPLAY TESTS
// ============================================================================

TEST(ReplayVerb, Table) {
    TEST_ASSERT_EQ(std::string("cast"), replay_verb(ZoneRole::HAND, ZoneRole::STACK));
    TEST_ASSERT_EQ(std::string("cast"), replay_verb(ZoneRole::OPPONENT_HAND, ZoneRole::STACK));
    TEST_ASSERT_EQ(std::string("drawn"), replay_verb(ZoneRole::LIBRARY, ZoneRole::HAND));
    TEST_ASSERT_EQ(std::string("resolved"), replay_verb(ZoneRole::STACK, ZoneRole::GRAVEYARD));
    TEST_ASSERT_EQ(std::string("died"), replay_verb(ZoneRole::BATTLEFIELD, ZoneRole::GRAVEYARD));
    TEST_ASSERT_EQ(std::string("shuffled into library"),
                   replay_verb(ZoneRole::BATTLEFIELD, ZoneRole::OPPONENT_LIBRARY));
    TEST_ASSERT_EQ(std::string(""), replay_verb(ZoneRole::EXILE, ZoneRole::BATTLEFIELD));
    TEST_ASSERT_EQ(std::string(""), replay_verb(ZoneRole::GRAVEYARD, ZoneRole::HAND));
}

TEST(Replay, SampleGameSteps) {
    auto replay = build_replay(sample_game(), {});

    TEST_ASSERT_EQ(HAND, replay.player_hand.value_or(0));
    TEST_ASSERT_EQ(OPP_HAND, replay.opponent_hand.value_or(0));

    // 27 named transfers; the return from exile has no verb
    TEST_ASSERT_EQ(26u, replay.steps.size());

    const ReplayStep& draw = replay.steps[0];
    TEST_ASSERT_EQ(std::string("drawn"), draw.verb);
    TEST_ASSERT_EQ(std::string("you"), std::string(to_string(draw.actor)));
    TEST_ASSERT_EQ(std::string("Unknown Card (70101)"), draw.card_name);
    TEST_ASSERT_EQ(std::string("Library"), draw.from_label);

    const ReplayStep& cast = replay.steps[10];
    TEST_ASSERT_EQ(std::string("cast"), cast.verb);
    TEST_ASSERT_EQ(std::string("you"), std::string(to_string(cast.actor)));

    const ReplayStep& resolve = replay.steps[14];
    TEST_ASSERT_EQ(std::string("entered the battlefield"), resolve.verb);
    TEST_ASSERT_EQ(std::string("unknown"), std::string(to_string(resolve.actor)));

    TEST_ASSERT_EQ(std::string("resolved"), replay.steps[17].verb);
    TEST_ASSERT_EQ(std::string("you"), std::string(to_string(replay.steps[18].actor)));
    TEST_ASSERT_EQ(std::string("died"), replay.steps[20].verb);
    TEST_ASSERT_EQ(std::string("was exiled"), replay.steps[21].verb);

    const ReplayStep& opp_cast = replay.steps[22];
    TEST_ASSERT_EQ(std::string("cast"), opp_cast.verb);
    TEST_ASSERT_EQ(std::string("opponent"), std::string(to_string(opp_cast.actor)));
    TEST_ASSERT_EQ(80201, opp_cast.grp_id);
}

TEST(Replay, OpponentNamedDrawMirrored) {
    auto transfers = sample_game();
    transfers.push_back(zt(28, 204, 80204, OPP_LIB, OPP_HAND, "Draw"));

    auto replay = build_replay(transfers, {});

    TEST_ASSERT_EQ(OPP_HAND, replay.opponent_hand.value_or(0));
    TEST_ASSERT_EQ(27u, replay.steps.size());

    const ReplayStep& opp_draw = replay.steps.back();
    TEST_ASSERT_EQ(std::string("drawn"), opp_draw.verb);
    TEST_ASSERT_EQ(std::string("opponent"), std::string(to_string(opp_draw.actor)));
    TEST_ASSERT_EQ(std::string("Library (opponent)"), opp_draw.from_label);
    TEST_ASSERT_EQ(std::string("Hand (opponent)"), opp_draw.to_label);

    TEST_ASSERT_EQ(std::string("cast"), replay.steps[22].verb);
    TEST_ASSERT_EQ(std::string("opponent"), std::string(to_string(replay.steps[22].actor)));
}

TEST(Replay, CardNamesFromLookup) {
    CardDatabase db;
    CardFacts elves;
    elves.arena_id = 70101;
    elves.name = "Llanowar Elves";
    db.add_card(elves);

    ReplayOptions options;
    options.cards = &db;
    auto replay = build_replay(sample_game(), {}, options);

    TEST_ASSERT_EQ(std::string("Llanowar Elves"), replay.steps[0].card_name);
    TEST_ASSERT_EQ(std::string("Unknown Card (70102)"), replay.steps[1].card_name);
}

TEST(Replay, LifeTotalsMergedByGameState) {
    std::vector<LifeChangeRecord> life = {
        life_change(15, 1, 17),
        life_change(1, 1, 20),
        life_change(1, 2, 20),
    };
    auto replay = build_replay(sample_game(), life);

    // Transfer at gsid 1 sees the gsid 1 totals
    TEST_ASSERT_EQ(20, replay.steps[0].player_life.value_or(0));
    TEST_ASSERT_EQ(20, replay.steps[0].opponent_life.value_or(0));

    TEST_ASSERT_EQ(14, replay.steps[13].game_state_id);
    TEST_ASSERT_EQ(20, replay.steps[13].opponent_life.value_or(0));
    TEST_ASSERT_EQ(15, replay.steps[14].game_state_id);
    TEST_ASSERT_EQ(17, replay.steps[14].opponent_life.value_or(0));
    TEST_ASSERT_EQ(20, replay.steps[14].player_life.value_or(0));
}

TEST(Replay, UnlabeledZonesAndTokens) {
    std::vector<ZoneTransferRecord> transfers;
    int gsid = 1;
    for (int i = 0; i < 4; i++) {
        transfers.push_back(zt(gsid++, 100 + i, 500 + i, 10, 20));
    }
    for (int i = 0; i < 4; i++) {
        transfers.push_back(zt(gsid++, 200 + i, 600 + i, 10, 30));
    }
    transfers.push_back(zt(gsid++, 300, 900, std::nullopt, 20, "TokenCreated"));

    auto replay = build_replay(transfers, {});

    // 20 is the battlefield, 10 falls through to exile, 30 stays unlabeled
    TEST_ASSERT_EQ(std::string("Battlefield"), role_name(replay.roles, 20));
    TEST_ASSERT_EQ(std::string("Exile"), role_name(replay.roles, 10));
    TEST_ASSERT_EQ(std::string("(none)"), role_name(replay.roles, 30));

    TEST_ASSERT_EQ(5u, replay.steps.size());
    TEST_ASSERT_EQ(std::string("moved"), replay.steps[0].verb);
    TEST_ASSERT_EQ(std::string("unknown zone"), replay.steps[0].to_label);
    TEST_ASSERT_EQ(std::string("Exile"), replay.steps[0].from_label);

    const ReplayStep& token = replay.steps[4];
    TEST_ASSERT_EQ(std::string("token created"), token.verb);
    TEST_ASSERT_EQ(std::string("unknown zone"), token.from_label);
    TEST_ASSERT_EQ(std::string("Battlefield"), token.to_label);
}

TEST(Replay, FormatStep) {
    ReplayStep step;
    step.turn_number = 3;
    step.actor = Actor::YOU;
    step.card_name = "Shock";
    step.verb = "cast";
    step.from_label = "Hand";
    step.to_label = "Stack";

    TEST_ASSERT_EQ(std::string("T3 you: Shock cast (Hand -> Stack)"), format_replay_step(step));

    step.player_life = 20;
    TEST_ASSERT_EQ(std::string("T3 you: Shock cast (Hand -> Stack) [20 / ?]"), format_replay_step(step));

    step.opponent_life = 18;
    TEST_ASSERT_EQ(std::string("T3 you: Shock cast (Hand -> Stack) [20 / 18]"), format_replay_step(step));
}

// ============================================================================
// REPLAY LOGGER TESTS
// ============================================================================

TEST(ReplayLogger, WritesTraceFile) {
    auto dir = std::filesystem::temp_directory_path() / "arena_tracker_replay_test";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    MatchData match("m-trace");
    match.player_name = "Alice";
    match.opponent_name = "Bob";
    match.result = MatchResult::WIN;
    match.start_time = 1000;
    match.end_time = 121000;

    std::string path;
    {
        ReplayLogger logger(nullptr, dir.string());
        TEST_ASSERT_TRUE(logger.is_enabled());
        path = logger.get_log_path();
        logger.log_replay(match, build_replay(sample_game(), {}));
    }

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    std::string text = contents.str();

    TEST_ASSERT_TRUE(text.find("MATCH REPLAY - ZONE TRANSFER TRACE") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("[MATCH m-trace]") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Library (opponent)") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("you: Unknown Card (70101) drawn (Library -> Hand)") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Result: win") != std::string::npos);
    TEST_ASSERT_TRUE(text.find("Duration: 120s") != std::string::npos);

    std::filesystem::remove_all(dir, ec);
}

TEST(ReplayLogger, DisabledWritesNothing) {
    auto dir = std::filesystem::temp_directory_path() / "arena_tracker_replay_disabled";
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);

    std::string path;
    {
        ReplayLogger logger(nullptr, dir.string());
        logger.set_enabled(false);
        path = logger.get_log_path();
        logger.log_match_header(MatchData("m-hidden"));
    }

    std::ifstream in(path);
    std::stringstream contents;
    contents << in.rdbuf();
    TEST_ASSERT_TRUE(contents.str().find("m-hidden") == std::string::npos);

    std::filesystem::remove_all(dir, ec);
}
