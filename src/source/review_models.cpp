#include "source/review_models.hpp"

#include <cstdio>
#include <ctime>
#include <fmt/core.h>

namespace rev::source {

CurrentState CurrentStateOf(const StatusCheck& check)
{
    auto classify = [](const std::string& s) {
        if (s == "success" || s == "neutral" || s == "skipped")
            return CurrentState::Success;
        if (s == "stale")
            return CurrentState::Expired;
        if (s == "failure" || s == "error" || s == "cancelled" || s == "timed out" ||
            s == "action required" || s == "startup failure")
            return CurrentState::Failure;
        return CurrentState::Pending;
    };

    if (const auto* ctx = std::get_if<StatusContext>(&check))
        return classify(ctx->state);

    const auto& run = std::get<CheckRun>(check);
    if (run.status != "completed")
        return CurrentState::Pending;
    return classify(run.conclusion);
}

std::string FormatAge(Timestamp then, Timestamp now)
{
    using namespace std::chrono;
    auto secs = duration_cast<seconds>(now - then).count();
    if (secs < 0) secs = 0;

    struct Unit { long long size; const char* name; };
    static constexpr Unit units[] = {
        {365LL * 24 * 3600, "year"},
        {30LL * 24 * 3600,  "month"},
        {7LL * 24 * 3600,   "week"},
        {24LL * 3600,       "day"},
        {3600,              "hour"},
        {60,                "minute"},
    };
    for (const auto& u : units) {
        long long n = secs / u.size;
        if (n >= 1)
            return fmt::format("{} {}{} ago", n, u.name, n == 1 ? "" : "s");
    }
    return "just now";
}

std::optional<Timestamp> ParseTimestamp(const std::string& iso)
{
    std::tm tm{};
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    if (std::sscanf(iso.c_str(), "%d-%d-%dT%d:%d:%d",
                    &year, &month, &day, &hour, &minute, &second) != 6)
        return std::nullopt;

    tm.tm_year = year - 1900;
    tm.tm_mon  = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min  = minute;
    tm.tm_sec  = second;
    return std::chrono::system_clock::from_time_t(timegm(&tm));
}

} // namespace rev::source
