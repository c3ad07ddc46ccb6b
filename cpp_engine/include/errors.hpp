/**
 * Arena Tracker - Exceptions
 *
 * Fatal conditions are thrown; per-event problems are collected as ParseError
 * entries by the tracker instead (see match_tracker.hpp).
 */

#pragma once

#include "types.hpp"
#include <stdexcept>

namespace arena {

class TrackerError : public std::runtime_error {
public:
    explicit TrackerError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * Error while reading or parsing the client log.
 *
 * Rendered as "<message> (line N): <details>", omitting the parts that are unset.
 */
class LogParseError : public TrackerError {
public:
    LogParseError(const std::string& message,
                  std::optional<int> line_number = std::nullopt,
                  const std::string& details = "")
        : TrackerError(format(message, line_number, details))
        , line_number_(line_number)
        , details_(details) {}

    std::optional<int> line_number() const { return line_number_; }
    const std::string& details() const { return details_; }

private:
    std::optional<int> line_number_;
    std::string details_;

    static std::string format(const std::string& message,
                              std::optional<int> line_number,
                              const std::string& details) {
        std::string full = message;
        if (line_number.has_value()) {
            full += " (line " + std::to_string(*line_number) + ")";
        }
        if (!details.empty()) {
            full += ": " + details;
        }
        return full;
    }
};

class LogFileNotFoundError : public LogParseError {
public:
    explicit LogFileNotFoundError(const std::string& path)
        : LogParseError("Log file not found", std::nullopt, path) {}
};

class InvalidLogFormatError : public LogParseError {
public:
    using LogParseError::LogParseError;
};

class CardLookupError : public TrackerError {
public:
    CardLookupError(const std::string& message, GrpId grp_id)
        : TrackerError(message + " (grpId: " + std::to_string(grp_id) + ")")
        , grp_id_(grp_id) {}

    GrpId grp_id() const { return grp_id_; }

private:
    GrpId grp_id_;
};

class ConfigError : public TrackerError {
public:
    using TrackerError::TrackerError;
};

} // namespace arena
