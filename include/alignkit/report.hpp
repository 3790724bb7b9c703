#pragma once

#include <string>
#include <vector>

namespace alignkit::config
{

    /**
     * Accumulates the outcome of a conversion: warnings for recoverable
     * problems, errors for fatal ones, and an overall pass/fail flag.
     * Not thread-safe; give each concurrent conversion its own instance.
     */
    class Report
    {
      public:
        void markFailed() { m_passed = false; }
        void addError(const std::string& message);
        void addWarning(const std::string& message);

        // Appends the messages of other and fails this report if other failed.
        void merge(const Report& other);

        bool passed() const { return m_passed; }
        const std::vector<std::string>& warnings() const { return m_warnings; }
        const std::vector<std::string>& errors() const { return m_errors; }

        std::string summary() const;

      private:
        bool                     m_passed{true};
        std::vector<std::string> m_warnings;
        std::vector<std::string> m_errors;
    };

} // namespace alignkit::config
