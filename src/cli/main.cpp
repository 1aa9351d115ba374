#include <QCoreApplication>

#include "cli/ExportCli.hpp"
#include "common/config.hpp"
#include "common/logging.hpp"
#include "common/scrollkeep_version.hpp"

#include <nlohmann/json.hpp>

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("scrollkeep"));
    QCoreApplication::setApplicationVersion(QStringLiteral(SCROLLKEEP_VERSION));

    bool trace = qEnvironmentVariableIntValue("SCROLLKEEP_TRACE") == 1;
    QStringList filteredArgs;
    filteredArgs.reserve(argc);
    for (int i = 0; i < argc; ++i) {
        const QString arg = QString::fromLocal8Bit(argv[i]);
        if (arg == QStringLiteral("--trace")) {
            trace = true;
            continue;
        }
        filteredArgs.push_back(arg);
    }
    scrollkeep::logging::initLogging(QStringLiteral("scrollkeep"), trace);
    SKLOG_INFO(QStringLiteral("main"),
               QStringLiteral("main"),
               QStringLiteral("cli_start"),
               QStringLiteral("user_invocation"),
               QStringLiteral("cli"),
               scrollkeep::logging::defaultWho(),
               QString(),
               (nlohmann::json{{"args", filteredArgs.size()}, {"version", SCROLLKEEP_VERSION}}));

    scrollkeep::ExportCli cli(scrollkeep::loadExportConfig());
    std::vector<QByteArray> utf8Args;
    std::vector<char *> rawArgs;
    for (const QString &arg : filteredArgs) {
        utf8Args.push_back(arg.toLocal8Bit());
    }
    for (auto &arg : utf8Args) {
        rawArgs.push_back(arg.data());
    }
    return cli.run(static_cast<int>(rawArgs.size()), rawArgs.data());
}
