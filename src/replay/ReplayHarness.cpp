#include "replay/ReplayHarness.hpp"

#include <iostream>
#include <stdexcept>

#include <QDir>
#include <QFile>
#include <QSaveFile>

#include "common/json_utils.hpp"
#include "common/logging.hpp"
#include "common/time_utils.hpp"
#include "session/export_session.hpp"
#include "session/resume_session.hpp"
#include "session/scheduler.hpp"
#include "session/session_context.hpp"
#include "store/resume_store.hpp"

namespace scrollkeep {

namespace {

const QString kComponent = QStringLiteral("ReplayHarness");

nlohmann::json readJsonFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        return nlohmann::json();
    }
    const QByteArray data = file.readAll();
    try {
        return nlohmann::json::parse(data.toStdString());
    } catch (const nlohmann::json::parse_error &) {
        return nlohmann::json();
    }
}

} // namespace

std::vector<RecordedResponse> loadRecordedResponses(const nlohmann::json &document)
{
    const nlohmann::json *entries = &document;
    if (document.is_object() && document.contains("responses")) {
        entries = &document.at("responses");
    }

    std::vector<RecordedResponse> responses;
    if (!entries->is_array()) {
        return responses;
    }
    for (const auto &entry : *entries) {
        if (!entry.is_object()) {
            continue;
        }
        RecordedResponse response;
        response.event = entry.get<CaptureEvent>();
        if (entry.contains("status") && entry.at("status").is_number_integer()) {
            response.status = entry.at("status").get<int>();
        }
        responses.push_back(std::move(response));
    }
    return responses;
}

ReplayPageDriver::ReplayPageDriver(std::vector<RecordedResponse> responses, std::string route)
    : m_responses(std::move(responses))
    , m_route(std::move(route))
{
}

void ReplayPageDriver::attach(RateLimitHandlers *handlers)
{
    m_handlers = handlers;
}

void ReplayPageDriver::triggerScrollStep()
{
    if (m_next >= m_responses.size() || !m_handlers) {
        return;
    }

    RecordedResponse &response = m_responses[m_next++];
    if (response.status == 429) {
        m_handlers->handleRateLimitHit(response.event.rateLimitInfo);
        return;
    }
    if (response.status == 401 || response.status == 403) {
        m_handlers->handleAuthError();
        return;
    }
    if (response.status >= 500) {
        m_errorPending = true;
        return;
    }

    m_handlers->handleInterceptedResponse(std::move(response.event));
    m_extent += 1000;
}

int64_t ReplayPageDriver::currentExtent()
{
    return m_extent;
}

bool ReplayPageDriver::detectErrorState()
{
    return m_errorPending;
}

void ReplayPageDriver::retry()
{
    m_errorPending = false;
}

bool ReplayPageDriver::detectRouteChange()
{
    return false;
}

std::string ReplayPageDriver::currentRoute()
{
    return m_route;
}

size_t ReplayPageDriver::delivered() const
{
    return m_next;
}

void ReplayPresentation::attach(ExportSession *session)
{
    m_session = session;
}

void ReplayPresentation::looksDone(int /*responsesCaptured*/)
{
    if (m_session) {
        m_session->onDownload();
    }
}

void ReplayPresentation::routeChanged(const std::string & /*route*/, int /*responsesCaptured*/)
{
    if (m_session) {
        m_session->onGoBack();
    }
}

void ReplayPresentation::rateLimited(const RateLimitState & /*state*/, int /*responsesCaptured*/)
{
    if (m_session) {
        m_session->onTryNow();
    }
}

DirectoryExportSink::DirectoryExportSink(QString directory)
    : m_directory(std::move(directory))
{
}

void DirectoryExportSink::deliver(const std::string &filename,
                                  const std::string &content,
                                  const std::string & /*mimeType*/)
{
    QDir dir(m_directory);
    if (!dir.exists() && !QDir().mkpath(m_directory)) {
        throw std::runtime_error("cannot create " + m_directory.toStdString());
    }

    const QString path = dir.filePath(QString::fromStdString(filename));
    QSaveFile file(path);
    if (!file.open(QIODevice::WriteOnly)) {
        throw std::runtime_error("cannot write " + path.toStdString());
    }
    const QByteArray data = QByteArray::fromStdString(content);
    if (file.write(data) != data.size() || !file.commit()) {
        throw std::runtime_error("failed to commit " + path.toStdString());
    }
    m_written.push_back(path.toStdString());
}

const std::vector<std::string> &DirectoryExportSink::writtenFiles() const
{
    return m_written;
}

ReplayHarness::ReplayHarness(ExportConfig config)
    : m_config(std::move(config))
{
}

int ReplayHarness::run(const ReplayOptions &options)
{
    const nlohmann::json document = readJsonFile(options.responsesPath);
    std::vector<RecordedResponse> responses = loadRecordedResponses(document);
    if (responses.empty()) {
        std::cerr << "No recorded responses in " << options.responsesPath.toStdString() << "\n";
        return 1;
    }

    SKLOG_INFO(kComponent,
               "run",
               "replay_start",
               "recorded_responses",
               "virtual_clock",
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"responses", responses.size()},
                               {"username", options.username},
                               {"resume", options.resume}}));

    VirtualScheduler scheduler(nowEpochMillis());

    ResumeStoreOptions storeOptions;
    storeOptions.maxAgeMs = m_config.resumeMaxAgeMs;
    storeOptions.chunkSize = m_config.chunkSize;
    storeOptions.clock = [&scheduler]() { return scheduler.now(); };
    auto store = openDefaultResumeStore(m_config.dataDir, storeOptions);

    SessionContext context(scheduler);
    ReplayPageDriver driver(std::move(responses), "/" + options.username);
    ReplayPresentation presentation;
    DirectoryExportSink sink(options.outDir.isEmpty() ? QDir::currentPath() : options.outDir);
    ResumeSession resume(store.get());

    ExportSession session(context, driver, presentation, sink, resume, m_config);
    driver.attach(&session.rateLimitHandlers());
    presentation.attach(&session);

    ExportRequest request;
    request.username = options.username;
    request.userId = options.userId;
    request.resume = options.resume;
    const ExportOutcome outcome = session.runExportSession(request);

    if (outcome.status != ExportStatus::Delivered) {
        std::cerr << "Export was not delivered\n";
        return 1;
    }

    nlohmann::json summary{
        {"file", sink.writtenFiles().empty() ? std::string() : sink.writtenFiles().back()},
        {"items", outcome.itemCount},
        {"responses", outcome.responsesCaptured},
        {"replayed", driver.delivered()},
        {"virtual_ms", scheduler.totalSlept()}
    };
    if (outcome.mergeInfo) {
        summary["merge_info"] = *outcome.mergeInfo;
    }
    std::cout << summary.dump(2) << std::endl;
    return 0;
}

} // namespace scrollkeep
