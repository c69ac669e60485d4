// -----------------------------------------------------------------------------
// Review data model shared by sources, the pipeline and the UI
// -----------------------------------------------------------------------------
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace rev::source {

using Timestamp = std::chrono::system_clock::time_point;

struct ReviewSummary {
    std::string id;            ///< remote node id
    std::string owner;         ///< owning org / user
    std::string name;          ///< repository name
    std::string title;
    Timestamp   created_at {};
    uint64_t    number {};     ///< pull request number
};

struct Comment {
    std::string author;
    std::string text;
};

struct CommentThread {
    std::vector<Comment> comments;
    bool has_previous {false};  ///< older comments exist remotely
};

struct StatusContext {
    std::string id;
    std::string state;
    std::optional<std::string> description;
    std::string context;
};

struct CheckRun {
    std::string id;
    std::string name;
    std::string status;
    std::string conclusion;
};

using StatusCheck = std::variant<StatusContext, CheckRun>;

enum class CurrentState { Success, Pending, Failure, Expired };

/// Classifies a check for display (colour).
CurrentState CurrentStateOf(const StatusCheck& check);

struct ReviewDetail {
    std::string id;
    uint64_t    number {};
    std::string title;
    std::string repository;
    std::string description;
    std::string author;
    std::optional<Timestamp> publish_at;
    std::vector<std::string> labels;
    CommentThread comments;
    std::vector<StatusCheck> status_checks;
};

struct ReviewFilter {
    std::optional<std::string> requested;   ///< "org/team", "login" or unset (@me)
    std::optional<std::string> org;
    std::vector<std::string>   labels;
};

struct ReviewPage {
    std::vector<ReviewSummary> items;
    std::optional<std::string> next_cursor;
    bool has_more {false};
};

struct DetailReference {
    std::string owner;
    std::string repo;
    uint64_t    number {};

    static DetailReference From(const ReviewSummary& s) { return {s.owner, s.name, s.number}; }
};

/// "just now", "5 minutes ago", "3 days ago", ...
std::string FormatAge(Timestamp then, Timestamp now = std::chrono::system_clock::now());

/// Parses an ISO-8601 UTC timestamp ("2024-01-31T12:00:00Z").
std::optional<Timestamp> ParseTimestamp(const std::string& iso);

} // namespace rev::source
