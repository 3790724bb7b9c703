#pragma once

#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace alignkit::config
{
    class Report;
}

namespace alignkit::diag
{

    enum class Severity
    {
        DEBUG,
        INFO,
        WARN,
        ERROR,
        FATAL
    };

    Severity severityFromChar(char c);

    struct Event
    {
        std::chrono::system_clock::time_point timestamp;
        Severity                              severity;
        std::string                           component;
        std::string                           message;
        std::optional<std::string>            extraJson;
    };

    struct LogConfig
    {
        Severity                   minimumSeverity{Severity::INFO};
        bool                       logToStdout{true};
        std::optional<std::string> filePath{};
        std::size_t                maxFileSizeBytes{0};
    };

    class DiagnosticManager
    {
      public:
        explicit DiagnosticManager(const LogConfig& cfg = {});
        ~DiagnosticManager();

        void start();
        void stop();
        // Writes out every queued event on the calling thread.
        void flush();

        void log(Severity sev, const std::string& component, const std::string& message,
                 const std::optional<std::string>& extraJson = std::nullopt);

        // Newest first. Includes events already persisted.
        std::vector<Event> fetchRecent(std::size_t maxEvents);
        void               updateLogConfig(const LogConfig& cfg);

      private:
        void        workerThreadFn();
        void        drainQueue();
        void        rotateLogIfNeeded();
        void        persistEvent(const Event& ev);
        bool        shouldLog(Severity sev) const;
        std::string severityToString(Severity sev) const;
        std::string formatTimestamp(const std::chrono::system_clock::time_point& tp) const;

        LogConfig             m_logCfg{};
        mutable std::mutex    m_logCfgMtx;
        std::filesystem::path m_logPath;
        std::ofstream         m_logFile;

        std::mutex        m_mtx;
        std::deque<Event> m_queue;
        std::deque<Event> m_history;
        std::size_t       m_historyLimit{256};
        std::atomic<bool> m_running{false};
        std::thread       m_thread;
    };

    // Forwards the errors and warnings of report, in that order.
    void logReport(DiagnosticManager& diagMgr, const std::string& component, const config::Report& report);

} // namespace alignkit::diag
