#include "common/time_utils.hpp"

#include <array>
#include <ctime>
#include <regex>

#include <QDateTime>
#include <QString>

namespace scrollkeep {

namespace {

const std::regex kCustomDatePattern(
    R"((\d{4})\s*-\s*(\d{2})\s*-\s*(\d{2})\s*(\d{2}):(\d{2}):(\d{2}))");

// "Wed Oct 10 20:19:24 +0000 2018"
const std::regex kProviderDatePattern(
    R"(^[A-Za-z]{3} ([A-Za-z]{3}) (\d{1,2}) (\d{2}):(\d{2}):(\d{2}) ([+-])(\d{2})(\d{2}) (\d{4})$)");

int monthFromName(const std::string &name)
{
    static const std::array<const char *, 12> kMonths = {
        "Jan", "Feb", "Mar", "Apr", "May", "Jun",
        "Jul", "Aug", "Sep", "Oct", "Nov", "Dec"};
    for (size_t i = 0; i < kMonths.size(); ++i) {
        if (name == kMonths[i]) {
            return static_cast<int>(i) + 1;
        }
    }
    return 0;
}

std::optional<int64_t> utcFromFields(int year, int month, int day,
                                     int hour, int minute, int second)
{
    if (month < 1 || month > 12 || day < 1 || day > 31 || hour > 23
        || minute > 59 || second > 60) {
        return std::nullopt;
    }
    std::tm tm{};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = minute;
    tm.tm_sec = second;
    const std::time_t time = timegm(&tm);
    if (time == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return static_cast<int64_t>(time) * 1000;
}

} // namespace

int64_t epochMillis(std::chrono::system_clock::time_point time)
{
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               time.time_since_epoch())
        .count();
}

int64_t nowEpochMillis()
{
    return epochMillis(std::chrono::system_clock::now());
}

std::string toIso8601Utc(int64_t epochMs)
{
    return QDateTime::fromMSecsSinceEpoch(epochMs, Qt::UTC)
        .toString(Qt::ISODateWithMs)
        .toStdString();
}

std::optional<int64_t> parseTweetDate(const std::string &value)
{
    if (value.empty()) {
        return std::nullopt;
    }

    std::smatch match;
    if (std::regex_search(value, match, kCustomDatePattern)) {
        return utcFromFields(std::stoi(match[1]), std::stoi(match[2]),
                             std::stoi(match[3]), std::stoi(match[4]),
                             std::stoi(match[5]), std::stoi(match[6]));
    }

    if (std::regex_match(value, match, kProviderDatePattern)) {
        const int month = monthFromName(match[1]);
        auto base = utcFromFields(std::stoi(match[9]), month, std::stoi(match[2]),
                                  std::stoi(match[3]), std::stoi(match[4]),
                                  std::stoi(match[5]));
        if (!base) {
            return std::nullopt;
        }
        const int64_t offsetMinutes =
            std::stoi(match[7]) * 60 + std::stoi(match[8]);
        const int64_t sign = match[6] == "-" ? -1 : 1;
        return *base - sign * offsetMinutes * 60 * 1000;
    }

    QDateTime iso = QDateTime::fromString(QString::fromStdString(value), Qt::ISODate);
    if (!iso.isValid()) {
        return std::nullopt;
    }
    // No offset in the string: read it as UTC like the custom form above.
    if (iso.timeSpec() == Qt::LocalTime) {
        iso.setTimeSpec(Qt::UTC);
    }
    return iso.toMSecsSinceEpoch();
}

std::string formatTweetDate(const std::string &value)
{
    const auto parsed = parseTweetDate(value);
    if (!parsed) {
        return value;
    }
    return QDateTime::fromMSecsSinceEpoch(*parsed, Qt::UTC)
        .toString(QStringLiteral("yyyy-MM-dd HH:mm:ss"))
        .toStdString();
}

std::string formatLocalClock(int64_t epochSeconds)
{
    return QDateTime::fromSecsSinceEpoch(epochSeconds)
        .toLocalTime()
        .toString(QStringLiteral("HH:mm:ss"))
        .toStdString();
}

std::string formatDateStamp(int64_t epochMs)
{
    return QDateTime::fromMSecsSinceEpoch(epochMs, Qt::UTC)
        .toString(QStringLiteral("yyyy-MM-dd"))
        .toStdString();
}

} // namespace scrollkeep
