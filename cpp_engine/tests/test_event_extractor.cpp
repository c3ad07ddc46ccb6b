/**
 * Tests for the Event Extractor
 */

#include <sstream>
#include "event_extractor.hpp"
#include "errors.hpp"
#include "test_fixtures.hpp"

using namespace arena;
using fixtures::TempLog;

// ============================================================================
// TIMESTAMP TESTS
// ============================================================================

TEST(LoggerTimestamp, ParsesAfternoonTime) {
    auto ts = EventExtractor::parse_logger_timestamp("[UnityCrossThreadLogger]1/15/2024 3:04:05 PM");
    TEST_ASSERT_TRUE(ts.has_value());
    TEST_ASSERT_EQ(fixtures::LOGGER_LINE_MS, *ts);
}

TEST(LoggerTimestamp, MidnightIsTwelveAm) {
    auto ts = EventExtractor::parse_logger_timestamp("[UnityCrossThreadLogger]1/1/1970 12:00:00 AM");
    TEST_ASSERT_TRUE(ts.has_value());
    TEST_ASSERT_EQ(0, *ts);
}

TEST(LoggerTimestamp, NoonIsTwelvePm) {
    auto ts = EventExtractor::parse_logger_timestamp("[UnityCrossThreadLogger]1/1/1970 12:00:00 PM");
    TEST_ASSERT_TRUE(ts.has_value());
    TEST_ASSERT_EQ(12LL * 3600 * 1000, *ts);
}

TEST(LoggerTimestamp, TrailingTextIgnored) {
    auto ts = EventExtractor::parse_logger_timestamp(
        "[UnityCrossThreadLogger]1/15/2024 3:04:05 PM: Match to U-ME: GreToClientEvent");
    TEST_ASSERT_TRUE(ts.has_value());
    TEST_ASSERT_EQ(fixtures::LOGGER_LINE_MS, *ts);
}

TEST(LoggerTimestamp, RejectsBadDate) {
    TEST_ASSERT_FALSE(EventExtractor::parse_logger_timestamp(
        "[UnityCrossThreadLogger]13/40/2024 3:04:05 PM").has_value());
    TEST_ASSERT_FALSE(EventExtractor::parse_logger_timestamp(
        "[UnityCrossThreadLogger]2/30/2023 3:04:05 PM").has_value());
}

TEST(LoggerTimestamp, RequiresPrefixAtLineStart) {
    TEST_ASSERT_FALSE(EventExtractor::parse_logger_timestamp("1/15/2024 3:04:05 PM").has_value());
    TEST_ASSERT_FALSE(EventExtractor::parse_logger_timestamp(
        "  [UnityCrossThreadLogger]1/15/2024 3:04:05 PM").has_value());
}

// ============================================================================
// LINE HELPER TESTS
// ============================================================================

TEST(ExtractTrailingJson, ReturnsSuffixAfterPrefix) {
    auto json = EventExtractor::extract_trailing_json("[Client GRE] to Match: {\"a\":{\"b\":1}}");
    TEST_ASSERT_TRUE(json.has_value());
    TEST_ASSERT_EQ(std::string("{\"a\":{\"b\":1}}"), *json);
}

TEST(ExtractTrailingJson, RequiresClosingBraceAtEnd) {
    TEST_ASSERT_FALSE(EventExtractor::extract_trailing_json("{\"a\":1} and more").has_value());
    TEST_ASSERT_FALSE(EventExtractor::extract_trailing_json("no json here").has_value());
    TEST_ASSERT_FALSE(EventExtractor::extract_trailing_json("}").has_value());
}

TEST(SanitizeUtf8, DropsInvalidBytes) {
    TEST_ASSERT_EQ(std::string("abcd"), EventExtractor::sanitize_utf8("ab\xFF" "cd"));
    TEST_ASSERT_EQ(std::string("ab"), EventExtractor::sanitize_utf8("ab\xE2\x82"));
}

TEST(SanitizeUtf8, KeepsValidMultibyte) {
    const std::string text = "Jeskai \xC3\xA9tude \xE2\x80\x94 \xF0\x9F\x83\x8F";
    TEST_ASSERT_EQ(text, EventExtractor::sanitize_utf8(text));
}

// ============================================================================
// CLASSIFICATION TESTS
// ============================================================================

TEST(Classify, MatchStateWinsOverGre) {
    nlohmann::json data = {
        {"matchGameRoomStateChangedEvent", nlohmann::json::object()},
        {"greToClientEvent", nlohmann::json::object()},
    };
    auto kind = EventExtractor::classify(data);
    TEST_ASSERT_TRUE(kind.has_value());
    TEST_ASSERT_EQ(std::string("match_state"), to_string(*kind));
}

TEST(Classify, CourseDeck) {
    auto kind = EventExtractor::classify(fixtures::course_deck("Mono Red", {{100, 4}}));
    TEST_ASSERT_TRUE(kind.has_value());
    TEST_ASSERT_EQ(std::string("course_deck"), to_string(*kind));
}

TEST(Classify, DeckRequestsByMarker) {
    nlohmann::json upsert = {{"id", "1"}, {"request", "{\"Type\":\"DeckUpsertDeckV2\"}"}};
    nlohmann::json set = {{"id", "2"}, {"request", "{\"Type\":\"EventSetDeckV2\"}"}};
    nlohmann::json no_request = {{"id", "3"}, {"note", "DeckUpsertDeckV2"}};

    TEST_ASSERT_EQ(std::string("deck_upsert"), to_string(*EventExtractor::classify(upsert)));
    TEST_ASSERT_EQ(std::string("deck_set"), to_string(*EventExtractor::classify(set)));
    TEST_ASSERT_FALSE(EventExtractor::classify(no_request).has_value());
}

TEST(Classify, GameStateAnywhereInPayload) {
    nlohmann::json data = {{"wrapper", {{"gameStateMessage", {{"gameStateId", 1}}}}}};
    auto kind = EventExtractor::classify(data);
    TEST_ASSERT_TRUE(kind.has_value());
    TEST_ASSERT_EQ(std::string("game_state"), to_string(*kind));
}

TEST(Classify, UnknownShapesIgnored) {
    TEST_ASSERT_FALSE(EventExtractor::classify(nlohmann::json{{"foo", 1}}).has_value());
    TEST_ASSERT_FALSE(EventExtractor::classify(nlohmann::json::array({1, 2})).has_value());
    TEST_ASSERT_FALSE(EventExtractor::classify(nlohmann::json("greToClientEvent")).has_value());
}

// ============================================================================
// FILE VALIDATION TESTS
// ============================================================================

TEST(ExtractorFile, MissingFileThrows) {
    TEST_ASSERT_THROWS(EventExtractor("/nonexistent/arena_tracker/Player.log"), LogFileNotFoundError);
}

TEST(ExtractorFile, EmptyFileThrows) {
    TempLog log("", "empty");
    TEST_ASSERT_THROWS(EventExtractor(log.path(), ExtractorOptions{true}), InvalidLogFormatError);
}

TEST(ExtractorFile, MissingMarkerIsOnlyAWarning) {
    TempLog log("just some text\n", "nomarker");
    EventExtractor extractor(log.path(), ExtractorOptions{true});
    TEST_ASSERT_FALSE(extractor.next().has_value());
    TEST_ASSERT_EQ(1, extractor.lines_read());
}

// ============================================================================
// STREAMING TESTS
// ============================================================================

TEST(ExtractorStream, SingleLineAfterLoggerPrefix) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        fixtures::LOGGER_LINE,
        fixtures::match_started("m1").dump(),
    }));

    EventExtractor extractor(log.path());
    auto event = extractor.next();
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_EQ(std::string("match_state"), to_string(event->kind));
    TEST_ASSERT_EQ(3, event->line_number);
    TEST_ASSERT_TRUE(event->logger_timestamp.has_value());
    TEST_ASSERT_EQ(fixtures::LOGGER_LINE_MS, *event->logger_timestamp);
    TEST_ASSERT_TRUE(event->timestamp.has_value());
    TEST_ASSERT_EQ(1705331000000LL, *event->timestamp);
    TEST_ASSERT_FALSE(extractor.next().has_value());
}

TEST(ExtractorStream, TrailingJsonOnPrefixedLine) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        std::string("[UnityCrossThreadLogger]1/15/2024 3:04:05 PM ") + fixtures::match_started("m1").dump(),
    }));

    EventExtractor extractor(log.path());
    auto event = extractor.next();
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_EQ(std::string("m1"),
        event->data["matchGameRoomStateChangedEvent"]["gameRoomInfo"]["gameRoomConfig"]["matchId"]
            .get<std::string>());
    TEST_ASSERT_EQ(fixtures::LOGGER_LINE_MS, *event->logger_timestamp);
}

TEST(ExtractorStream, OutOfRangeTimestampIgnored) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        "{\"timestamp\": 1e20, \"greToClientEvent\": {\"greToClientMessages\": []}}",
        "{\"timestamp\": 18446744073709551615, \"greToClientEvent\": {\"greToClientMessages\": []}}",
        "{\"timestamp\": -1e19, \"greToClientEvent\": {\"greToClientMessages\": []}}",
        "{\"timestamp\": 1705331000000.0, \"greToClientEvent\": {\"greToClientMessages\": []}}",
    }));

    EventExtractor extractor(log.path());
    for (int i = 0; i < 3; i++) {
        auto event = extractor.next();
        TEST_ASSERT_TRUE(event.has_value());
        TEST_ASSERT_EQ(std::string("gre_event"), to_string(event->kind));
        TEST_ASSERT_FALSE(event->timestamp.has_value());
    }

    auto in_range = extractor.next();
    TEST_ASSERT_TRUE(in_range.has_value());
    TEST_ASSERT_EQ(1705331000000LL, in_range->timestamp.value_or(0));
}

TEST(ExtractorStream, MultiLinePayload) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        "{",
        "  \"greToClientEvent\": {",
        "    \"greToClientMessages\": []",
        "  }",
        "}",
        "free text after",
    }));

    EventExtractor extractor(log.path());
    auto event = extractor.next();
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_EQ(std::string("gre_event"), to_string(event->kind));
    TEST_ASSERT_EQ(6, event->line_number);
    TEST_ASSERT_FALSE(extractor.is_accumulating());
    TEST_ASSERT_FALSE(extractor.next().has_value());
}

TEST(ExtractorStream, UnterminatedBufferDropped) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        "{",
        "  \"greToClientEvent\": {",
    }));

    EventExtractor extractor(log.path());
    TEST_ASSERT_FALSE(extractor.next().has_value());
    TEST_ASSERT_FALSE(extractor.is_accumulating());
}

TEST(ExtractorStream, UnrecognizedJsonSkipped) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        "{\"authenticateResponse\":{\"clientId\":\"abc\"}}",
        fixtures::match_started("m1").dump(),
    }));

    EventExtractor extractor(log.path());
    auto event = extractor.next();
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_EQ(3, event->line_number);
}

TEST(ExtractorStream, RawLineTruncated) {
    TempLog log(fixtures::lines({fixtures::LOG_HEADER, fixtures::match_started("m1").dump()}));

    EventExtractor extractor(log.path());
    auto event = extractor.next();
    TEST_ASSERT_TRUE(event.has_value());
    TEST_ASSERT_EQ(200u, event->raw_line.size());
}

TEST(ExtractorStream, ResetRereadsFromStart) {
    TempLog log(fixtures::lines({
        fixtures::LOG_HEADER,
        fixtures::match_started("m1").dump(),
        fixtures::match_started("m2").dump(),
    }));

    EventExtractor extractor(log.path());
    int first_pass = 0;
    while (extractor.next()) first_pass++;

    extractor.reset();
    int second_pass = 0;
    while (extractor.next()) second_pass++;

    TEST_ASSERT_EQ(2, first_pass);
    TEST_ASSERT_EQ(first_pass, second_pass);
}
