#pragma once

#include <QString>
#include <QStringList>

#include "common/config.hpp"

namespace scrollkeep {

class ExportCli
{
public:
    explicit ExportCli(ExportConfig config);

    // returns exit code: 0 success, 1 failure, 2 usage error
    int run(int argc, char *argv[]);

private:
    int runDecode(const QStringList &args);
    int runMerge(const QStringList &args);
    int runReplay(const QStringList &args);
    int runResume(const QStringList &args);

    ExportConfig m_config;
};

} // namespace scrollkeep
