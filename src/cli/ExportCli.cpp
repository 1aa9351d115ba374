#include "cli/ExportCli.hpp"

#include <iostream>
#include <memory>
#include <optional>

#include <QFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "engine/merge_engine.hpp"
#include "engine/resume_link.hpp"
#include "engine/timeline_decoder.hpp"
#include "engine/tweet_row_builder.hpp"
#include "replay/ReplayHarness.hpp"
#include "store/resume_store.hpp"

namespace scrollkeep {

namespace {

constexpr int kExitOk = 0;
constexpr int kExitFailure = 1;
constexpr int kExitUsage = 2;

QString usageText()
{
    return QStringLiteral(
        "Usage:\n"
        "  scrollkeep decode --input FILE [--user-id ID]\n"
        "  scrollkeep merge --new FILE --previous FILE [--out FILE]\n"
        "  scrollkeep replay --responses FILE --user NAME [--user-id ID] [--resume] [--out DIR]\n"
        "  scrollkeep resume status [--user NAME]\n"
        "  scrollkeep resume clear\n"
        "  scrollkeep resume save --input FILE --user NAME\n"
        "Global: --trace, --data-dir DIR, --max-scrolls N\n");
}

int usageError()
{
    std::cerr << usageText().toStdString();
    return kExitUsage;
}

QString getArgValue(const QStringList &args, const QString &key)
{
    const int idx = args.indexOf(key);
    if (idx < 0 || idx + 1 >= args.size()) {
        return {};
    }
    return args.at(idx + 1);
}

std::optional<nlohmann::json> readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        std::cerr << "Cannot read " << path.toStdString() << "\n";
        return std::nullopt;
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &ex) {
        std::cerr << "Invalid JSON in " << path.toStdString() << ": " << ex.what() << "\n";
        return std::nullopt;
    }
}

bool writeJsonFile(const QString &path, const nlohmann::json &payload)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        return false;
    }
    const QByteArray data = QByteArray::fromStdString(
        payload.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
    return file.write(data) == data.size();
}

std::unique_ptr<ResumeStore> openStore(const ExportConfig &config)
{
    ResumeStoreOptions options;
    options.maxAgeMs = config.resumeMaxAgeMs;
    options.chunkSize = config.chunkSize;
    return openDefaultResumeStore(config.dataDir, options);
}

} // namespace

ExportCli::ExportCli(ExportConfig config)
    : m_config(std::move(config))
{
}

int ExportCli::run(int argc, char *argv[])
{
    QStringList args;
    args.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        args.push_back(QString::fromLocal8Bit(argv[i]));
    }

    if (args.size() < 2) {
        return usageError();
    }

    const QString dataDir = getArgValue(args, QStringLiteral("--data-dir"));
    if (!dataDir.isEmpty()) {
        m_config.dataDir = dataDir.toStdString();
    }
    const QString maxScrolls = getArgValue(args, QStringLiteral("--max-scrolls"));
    if (!maxScrolls.isEmpty()) {
        bool ok = false;
        const int value = maxScrolls.toInt(&ok);
        if (!ok || value <= 0) {
            return usageError();
        }
        m_config.maxScrolls = value;
    }

    const QString command = args.at(1);
    SKLOG_INFO(QStringLiteral("ExportCli"),
               QStringLiteral("run"),
               QStringLiteral("cli_command"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"command", command.toStdString()}}));

    if (command == QStringLiteral("decode")) {
        return runDecode(args);
    }
    if (command == QStringLiteral("merge")) {
        return runMerge(args);
    }
    if (command == QStringLiteral("replay")) {
        return runReplay(args);
    }
    if (command == QStringLiteral("resume")) {
        return runResume(args);
    }
    return usageError();
}

int ExportCli::runDecode(const QStringList &args)
{
    // Decodes one raw timeline payload, or a recording of captured
    // responses, into export rows.
    const QString input = getArgValue(args, QStringLiteral("--input"));
    if (input.isEmpty()) {
        return usageError();
    }
    const auto document = readJsonFile(input);
    if (!document) {
        return kExitFailure;
    }

    nlohmann::json output;
    if (document->is_array() || (document->is_object() && document->contains("responses"))) {
        std::vector<CaptureEvent> events;
        for (const auto &response : loadRecordedResponses(*document)) {
            events.push_back(response.event);
        }
        const QString userId = getArgValue(args, QStringLiteral("--user-id"));
        const TweetList rows = extractTweetsFromResponses(
            events, userId.isEmpty() ? std::string("unknown") : userId.toStdString());
        output = nlohmann::json{{"items", rows}, {"nextCursor", nullptr}};
    } else {
        const auto extracted = extractTimeline<TweetItem>(*document, defaultTweetRowBuilder());
        output = nlohmann::json{{"items", extracted.items}};
        output["nextCursor"] = extracted.nextCursor ? nlohmann::json(*extracted.nextCursor)
                                                    : nlohmann::json();
    }

    std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
              << std::endl;
    return kExitOk;
}

int ExportCli::runMerge(const QStringList &args)
{
    const QString newPath = getArgValue(args, QStringLiteral("--new"));
    const QString previousPath = getArgValue(args, QStringLiteral("--previous"));
    if (newPath.isEmpty() || previousPath.isEmpty()) {
        return usageError();
    }

    const auto fresh = readJsonFile(newPath);
    const auto previous = readJsonFile(previousPath);
    if (!fresh || !previous) {
        return kExitFailure;
    }

    const MergeResult merged = mergeTweets(extractTweetsFromExportData(*fresh),
                                           extractTweetsFromExportData(*previous));
    nlohmann::json output{{"items", merged.tweets}};
    output["merge_info"] = merged.mergeInfo ? nlohmann::json(*merged.mergeInfo) : nlohmann::json();

    const QString outPath = getArgValue(args, QStringLiteral("--out"));
    if (outPath.isEmpty()) {
        std::cout << output.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  << std::endl;
        return kExitOk;
    }
    if (!writeJsonFile(outPath, output)) {
        std::cerr << "Cannot write " << outPath.toStdString() << "\n";
        return kExitFailure;
    }
    return kExitOk;
}

int ExportCli::runReplay(const QStringList &args)
{
    ReplayOptions options;
    options.responsesPath = getArgValue(args, QStringLiteral("--responses"));
    const auto username = normalizeUsername(getArgValue(args, QStringLiteral("--user")).toStdString());
    if (options.responsesPath.isEmpty() || !username) {
        return usageError();
    }
    options.username = *username;
    const QString userId = getArgValue(args, QStringLiteral("--user-id"));
    if (!userId.isEmpty()) {
        options.userId = userId.toStdString();
    }
    options.resume = args.contains(QStringLiteral("--resume"));
    options.outDir = getArgValue(args, QStringLiteral("--out"));

    ReplayHarness harness(m_config);
    return harness.run(options);
}

int ExportCli::runResume(const QStringList &args)
{
    if (args.size() < 3) {
        return usageError();
    }
    const QString action = args.at(2);
    auto store = openStore(m_config);

    if (action == QStringLiteral("status")) {
        const QString user = getArgValue(args, QStringLiteral("--user"));
        const auto snapshot = store->restore(user.isEmpty()
                                                 ? std::nullopt
                                                 : std::optional<std::string>(user.toStdString()));
        nlohmann::json output{{"present", snapshot.has_value()}};
        if (snapshot) {
            output["username"] = snapshot->username;
            output["saved_at"] = toIso8601Utc(snapshot->savedAt);
            output["tweets"] = snapshot->tweets.size();
            output["resume_until"] = resumeUntilDate(snapshot->tweets).value_or(std::string());
        }
        std::cout << output.dump(2) << std::endl;
        return kExitOk;
    }

    if (action == QStringLiteral("clear")) {
        store->clear();
        std::cout << "Resume snapshot cleared\n";
        return kExitOk;
    }

    if (action == QStringLiteral("save")) {
        // Seeds the resume snapshot from a previous export file.
        const QString input = getArgValue(args, QStringLiteral("--input"));
        const QString user = getArgValue(args, QStringLiteral("--user"));
        if (input.isEmpty()) {
            return usageError();
        }
        const auto document = readJsonFile(input);
        if (!document) {
            return kExitFailure;
        }

        const ResumeInput parsed = parseResumeInput(*document);
        const auto username = user.isEmpty() ? parsed.username
                                             : normalizeUsername(user.toStdString());
        if (!username) {
            return usageError();
        }
        if (parsed.tweets.empty()) {
            std::cerr << "No tweets found in " << input.toStdString() << "\n";
            return kExitFailure;
        }

        ResumeSnapshot snapshot;
        snapshot.username = *username;
        snapshot.savedAt = nowEpochMillis();
        snapshot.meta = parsed.meta;
        snapshot.tweets = sortTweetsByDateDesc(parsed.tweets);
        if (!store->persist(snapshot)) {
            std::cerr << "Could not persist resume snapshot\n";
            return kExitFailure;
        }

        const auto until = resumeUntilDate(snapshot.tweets);
        nlohmann::json output{{"username", snapshot.username},
                              {"tweets", snapshot.tweets.size()}};
        if (until) {
            output["resume_url"] = buildResumeUrl(buildResumeQuery("", snapshot.username, *until));
        }
        std::cout << output.dump(2) << std::endl;
        return kExitOk;
    }

    return usageError();
}

} // namespace scrollkeep
