#include "config_codec.hpp"

#include <sstream>
#include <stdexcept>
#include <utility>

#include <tinyxml2.h>

namespace alignkit::config
{

    namespace
    {

        using tinyxml2::XMLElement;

        constexpr int kInvalidEncoding = -1;
        constexpr int kMissingTasks    = -2;
        constexpr int kExtraContent    = -3;

        std::vector<std::string> split(const std::string& text, const std::string& separator)
        {
            std::vector<std::string> out;
            std::size_t              start = 0;
            for (auto pos = text.find(separator); pos != std::string::npos; pos = text.find(separator, start))
            {
                out.push_back(text.substr(start, pos - start));
                start = pos + separator.size();
            }
            out.push_back(text.substr(start));
            return out;
        }

        std::string trim(const std::string& value)
        {
            const char* ws    = " \t\n\r\f\v";
            auto        first = value.find_first_not_of(ws);
            if (first == std::string::npos)
                return {};
            auto last = value.find_last_not_of(ws);
            return value.substr(first, last - first + 1);
        }

        // Returns the byte offset of the first invalid sequence, or npos.
        std::size_t findInvalidUtf8(const std::string& bytes)
        {
            std::size_t i = 0;
            while (i < bytes.size())
            {
                auto        c = static_cast<unsigned char>(bytes[i]);
                std::size_t len;
                if (c < 0x80)
                    len = 1;
                else if (c >= 0xC2 && c <= 0xDF)
                    len = 2;
                else if (c >= 0xE0 && c <= 0xEF)
                    len = 3;
                else if (c >= 0xF0 && c <= 0xF4)
                    len = 4;
                else
                    return i;

                if (i + len > bytes.size())
                    return i;
                for (std::size_t k = 1; k < len; ++k)
                {
                    auto cc = static_cast<unsigned char>(bytes[i + k]);
                    if ((cc & 0xC0) != 0x80)
                        return i;
                }
                // overlong 3/4 byte forms, surrogates, > U+10FFFF
                auto c1 = static_cast<unsigned char>(len > 1 ? bytes[i + 1] : 0);
                if ((c == 0xE0 && c1 < 0xA0) || (c == 0xED && c1 > 0x9F) || (c == 0xF0 && c1 < 0x90) ||
                    (c == 0xF4 && c1 > 0x8F))
                    return i;
                i += len;
            }
            return std::string::npos;
        }

    } // namespace

    std::optional<XmlParseError> loadXmlDocument(tinyxml2::XMLDocument& doc, const std::string& xmlBytes)
    {
        auto bad = findInvalidUtf8(xmlBytes);
        if (bad != std::string::npos)
            return XmlParseError{kInvalidEncoding, 0, "Invalid UTF-8 sequence at byte " + std::to_string(bad)};

        if (doc.Parse(xmlBytes.data(), xmlBytes.size()) != tinyxml2::XML_SUCCESS)
        {
            const char* detail = doc.ErrorStr();
            return XmlParseError{static_cast<int>(doc.ErrorID()), doc.ErrorLineNum(), detail ? detail : "unknown error"};
        }

        const auto* root = doc.RootElement();
        if (!root)
            return XmlParseError{static_cast<int>(tinyxml2::XML_ERROR_EMPTY_DOCUMENT), 0, "Missing root element"};

        // tinyxml2 accepts several top-level elements and stray top-level text
        if (const auto* extra = root->NextSiblingElement())
            return XmlParseError{kExtraContent, extra->GetLineNum(),
                                 std::string("Extra content after root element: <") + extra->Name() + ">"};
        for (const auto* node = doc.FirstChild(); node; node = node->NextSibling())
        {
            if (node->ToText())
                return XmlParseError{kExtraContent, node->GetLineNum(), "Text outside root element"};
        }

        return std::nullopt;
    }

    ConfigCodec::ConfigCodec(CodecSymbols symbols)
        : m_symbols(std::move(symbols))
    {
        if (m_symbols.pairSeparator.empty() || m_symbols.assignmentSeparator.empty())
            throw std::invalid_argument("Config separators must not be empty");
        if (m_symbols.tasksTag.empty() || m_symbols.taskTag.empty())
            throw std::invalid_argument("Config XML tag names must not be empty");
    }

    std::string ConfigCodec::stringFromTextBlock(const std::optional<std::string>& text) const
    {
        if (!text)
            return {};

        std::string out;
        std::string line;
        auto        flush = [&]()
        {
            if (line.empty())
                return;
            if (!out.empty())
                out += m_symbols.pairSeparator;
            out += line;
            line.clear();
        };

        for (std::size_t i = 0; i < text->size(); ++i)
        {
            char c = (*text)[i];
            if (c == '\r' || c == '\n')
            {
                if (c == '\r' && i + 1 < text->size() && (*text)[i + 1] == '\n')
                    ++i;
                flush();
                continue;
            }
            line += c;
        }
        flush();
        return out;
    }

    ConfigMapping ConfigCodec::mappingFromString(const std::optional<std::string>& configString,
                                                 Report*                           report) const
    {
        if (!configString)
            return {};
        return mappingFromPairs(split(*configString, m_symbols.pairSeparator), report);
    }

    ConfigMapping ConfigCodec::mappingFromPairs(const std::vector<std::string>& pairs, Report* report) const
    {
        ConfigMapping mapping;
        for (const auto& pair : pairs)
        {
            if (pair.empty())
                continue;

            auto tokens = split(pair, m_symbols.assignmentSeparator);
            if (tokens.size() == 2 && !tokens[0].empty() && !tokens[1].empty())
            {
                mapping[tokens[0]] = tokens[1];
            }
            else if (report)
            {
                report->addWarning("Invalid key=value string: '" + pair + "'");
            }
        }
        return mapping;
    }

    std::string ConfigCodec::stringFromMapping(const ConfigMapping& mapping) const
    {
        std::string out;
        for (const auto& [key, value] : mapping)
        {
            if (!out.empty())
                out += m_symbols.pairSeparator;
            out += key;
            out += m_symbols.assignmentSeparator;
            out += value;
        }
        return out;
    }

    std::vector<std::string> ConfigCodec::leafPairs(const XMLElement* parent, bool skipTasks) const
    {
        std::vector<std::string> pairs;
        for (auto* elem = parent->FirstChildElement(); elem; elem = elem->NextSiblingElement())
        {
            if (skipTasks && m_symbols.tasksTag == elem->Name())
                continue;
            const char* text = elem->GetText();
            if (!text)
                continue;
            pairs.push_back(elem->Name() + m_symbols.assignmentSeparator + trim(text));
        }
        return pairs;
    }

    void ConfigCodec::reportXmlFailure(const XmlParseError& err, Report& report) const
    {
        std::ostringstream oss;
        oss << "An error occurred while parsing XML file";
        if (err.line > 0)
            oss << " (line " << err.line << ")";
        if (!err.message.empty())
            oss << ": " << err.message;
        report.markFailed();
        report.addError(oss.str());
    }

    ConfigMapping ConfigCodec::mappingFromXmlJob(const std::string& xmlBytes, Report& report) const
    {
        tinyxml2::XMLDocument doc;
        if (auto err = loadXmlDocument(doc, xmlBytes))
        {
            reportXmlFailure(*err, report);
            return {};
        }
        return mappingFromPairs(leafPairs(doc.RootElement(), true), &report);
    }

    std::vector<ConfigMapping> ConfigCodec::mappingsFromXmlTasks(const std::string& xmlBytes, Report& report) const
    {
        tinyxml2::XMLDocument doc;
        if (auto err = loadXmlDocument(doc, xmlBytes))
        {
            reportXmlFailure(*err, report);
            return {};
        }

        auto* tasks = doc.RootElement()->FirstChildElement(m_symbols.tasksTag.c_str());
        if (!tasks)
        {
            reportXmlFailure({kMissingTasks, doc.RootElement()->GetLineNum(),
                              "Missing <" + m_symbols.tasksTag + "> element"},
                             report);
            return {};
        }

        std::vector<ConfigMapping> out;
        for (auto* task = tasks->FirstChildElement(m_symbols.taskTag.c_str()); task;
             task       = task->NextSiblingElement(m_symbols.taskTag.c_str()))
        {
            out.push_back(mappingFromPairs(leafPairs(task, false), &report));
        }
        return out;
    }

} // namespace alignkit::config
