#include "report.hpp"

#include <sstream>

namespace alignkit::config
{

    void Report::addError(const std::string& message)
    {
        m_errors.push_back(message);
    }

    void Report::addWarning(const std::string& message)
    {
        m_warnings.push_back(message);
    }

    void Report::merge(const Report& other)
    {
        if (!other.passed())
            markFailed();
        m_errors.insert(m_errors.end(), other.m_errors.begin(), other.m_errors.end());
        m_warnings.insert(m_warnings.end(), other.m_warnings.begin(), other.m_warnings.end());
    }

    std::string Report::summary() const
    {
        std::ostringstream oss;
        for (const auto& e : m_errors)
            oss << "ERROR: " << e << '\n';
        for (const auto& w : m_warnings)
            oss << "WARNING: " << w << '\n';
        return oss.str();
    }

} // namespace alignkit::config
