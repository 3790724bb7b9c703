#include "diagnostic_manager.hpp"

#include "report.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace alignkit::diag {

Severity severityFromChar(char c)
{
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    switch (c) {
    case 'D': return Severity::DEBUG;
    case 'I': return Severity::INFO;
    case 'W': return Severity::WARN;
    case 'E': return Severity::ERROR;
    case 'F': return Severity::FATAL;
    default: return Severity::INFO;
    }
}

DiagnosticManager::DiagnosticManager(const LogConfig& cfg)
    : m_logCfg(cfg)
{
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

DiagnosticManager::~DiagnosticManager()
{
    stop();
    flush();
    if (m_logFile.is_open())
        m_logFile.close();
}

void DiagnosticManager::start()
{
    if (m_running.exchange(true))
        return;
    m_thread = std::thread(&DiagnosticManager::workerThreadFn, this);
}

void DiagnosticManager::stop()
{
    if (!m_running.exchange(false))
        return;
    if (m_thread.joinable())
        m_thread.join();
}

void DiagnosticManager::flush()
{
    drainQueue();
}

void DiagnosticManager::log(Severity sev, const std::string& component,
                            const std::string& message,
                            const std::optional<std::string>& extraJson)
{
    if (!shouldLog(sev))
        return;

    Event ev;
    ev.timestamp = std::chrono::system_clock::now();
    ev.severity = sev;
    ev.component = component;
    ev.message = message;
    ev.extraJson = extraJson;

    {
        std::lock_guard<std::mutex> lock(m_mtx);
        m_queue.push_back(ev);
        m_history.push_back(std::move(ev));
        while (m_history.size() > m_historyLimit)
            m_history.pop_front();
    }
}

std::vector<Event> DiagnosticManager::fetchRecent(std::size_t maxEvents)
{
    std::lock_guard<std::mutex> lock(m_mtx);
    std::vector<Event> out;
    maxEvents = std::min(maxEvents, m_history.size());
    auto it = m_history.end();
    for (std::size_t i = 0; i < maxEvents; ++i) {
        --it;
        out.push_back(*it);
    }
    return out;
}

void DiagnosticManager::updateLogConfig(const LogConfig& cfg)
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    if (m_logFile.is_open() && cfg.filePath != m_logCfg.filePath)
        m_logFile.close();
    m_logCfg = cfg;
    if (m_logCfg.filePath)
        m_logPath = *m_logCfg.filePath;
}

void DiagnosticManager::workerThreadFn()
{
    while (m_running.load()) {
        drainQueue();
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    drainQueue();
}

void DiagnosticManager::drainQueue()
{
    std::lock_guard<std::mutex> lock(m_mtx);
    while (!m_queue.empty()) {
        persistEvent(m_queue.front());
        m_queue.pop_front();
    }
}

void DiagnosticManager::rotateLogIfNeeded()
{
    std::lock_guard<std::mutex> cfgLock(m_logCfgMtx);
    if (!m_logCfg.filePath || m_logCfg.maxFileSizeBytes == 0)
        return;

    if (!std::filesystem::exists(m_logPath))
        return;

    auto size = std::filesystem::file_size(m_logPath);
    if (size < m_logCfg.maxFileSizeBytes)
        return;

    std::filesystem::path rotated = m_logPath;
    rotated += ".1";
    m_logFile.close();
    if (std::filesystem::exists(rotated))
        std::filesystem::remove(rotated);
    std::filesystem::rename(m_logPath, rotated);
    m_logFile.open(m_logPath, std::ios::out | std::ios::trunc);
}

void DiagnosticManager::persistEvent(const Event& ev)
{
    auto line = formatTimestamp(ev.timestamp) + " [" + severityToString(ev.severity) + "] " + ev.component + ": " + ev.message;
    if (ev.extraJson)
        line += " " + *ev.extraJson;

    {
        std::lock_guard<std::mutex> cfgLock(m_logCfgMtx);
        if (m_logCfg.logToStdout)
            std::cout << line << std::endl;

        if (m_logCfg.filePath) {
            if (!m_logFile.is_open())
                m_logFile.open(*m_logCfg.filePath, std::ios::out | std::ios::app);
            m_logFile << line << std::endl;
            m_logFile.flush();
        }
    }

    rotateLogIfNeeded();
}

bool DiagnosticManager::shouldLog(Severity sev) const
{
    std::lock_guard<std::mutex> lk(m_logCfgMtx);
    return static_cast<int>(sev) >= static_cast<int>(m_logCfg.minimumSeverity);
}

std::string DiagnosticManager::severityToString(Severity sev) const
{
    switch (sev) {
    case Severity::DEBUG: return "DEBUG";
    case Severity::INFO: return "INFO";
    case Severity::WARN: return "WARN";
    case Severity::ERROR: return "ERROR";
    case Severity::FATAL: return "FATAL";
    }
    return "UNKNOWN";
}

std::string DiagnosticManager::formatTimestamp(const std::chrono::system_clock::time_point& tp) const
{
    std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tmStruct {};
#if defined(_WIN32)
    localtime_s(&tmStruct, &t);
#else
    localtime_r(&t, &tmStruct);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tmStruct, "%F %T");
    return oss.str();
}

void logReport(DiagnosticManager& diagMgr, const std::string& component, const config::Report& report)
{
    for (const auto& e : report.errors())
        diagMgr.log(Severity::ERROR, component, e);
    for (const auto& w : report.warnings())
        diagMgr.log(Severity::WARN, component, w);

    nlohmann::json extra{{"passed", report.passed()},
                         {"errors", report.errors().size()},
                         {"warnings", report.warnings().size()}};
    diagMgr.log(report.passed() ? Severity::DEBUG : Severity::ERROR, component,
                report.passed() ? "Conversion finished" : "Conversion failed", extra.dump());
}

} // namespace alignkit::diag
