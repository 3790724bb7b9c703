#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "report.hpp"

namespace tinyxml2
{
    class XMLDocument;
    class XMLElement;
}

namespace alignkit::config
{

    using ConfigMapping = std::map<std::string, std::string>;

    /**
     * Symbols shared by every representation handled by ConfigCodec.
     * Keys and values must not contain either separator; a value that does
     * cannot survive a string round trip.
     */
    struct CodecSymbols
    {
        std::string pairSeparator{"|"};
        std::string assignmentSeparator{"="};
        std::string tasksTag{"tasks"};
        std::string taskTag{"task"};
    };

    struct XmlParseError
    {
        int         code{0};
        int         line{0};
        std::string message;
    };

    /**
     * Parses xmlBytes into doc. Returns the failure when the bytes are not
     * well-formed UTF-8 XML with a root element, std::nullopt otherwise.
     */
    std::optional<XmlParseError> loadXmlDocument(tinyxml2::XMLDocument& doc, const std::string& xmlBytes);

    /**
     * Converts between the three representations of a flat configuration:
     *
     *   key_1=value_1|key_2=value_2|...|key_n=value_n   (config string)
     *   ConfigMapping                                    (key -> value)
     *   <job><key_1>value_1</key_1>...<tasks>...</tasks></job>
     *
     * Malformed pairs are skipped with a warning; malformed XML fails the
     * whole call. No operation throws for malformed input.
     */
    class ConfigCodec
    {
      public:
        ConfigCodec() = default;
        // Throws std::invalid_argument when a separator or tag is empty.
        explicit ConfigCodec(CodecSymbols symbols);

        const CodecSymbols& symbols() const { return m_symbols; }

        // Joins the non-empty lines of a text config file.
        std::string stringFromTextBlock(const std::optional<std::string>& text) const;

        ConfigMapping mappingFromString(const std::optional<std::string>& configString,
                                        Report*                           report = nullptr) const;

        // Later duplicate keys overwrite earlier ones.
        ConfigMapping mappingFromPairs(const std::vector<std::string>& pairs, Report* report = nullptr) const;

        std::string stringFromMapping(const ConfigMapping& mapping) const;

        ConfigMapping mappingFromXmlJob(const std::string& xmlBytes, Report& report) const;

        // One mapping per task element, in document order.
        std::vector<ConfigMapping> mappingsFromXmlTasks(const std::string& xmlBytes, Report& report) const;

      private:
        std::vector<std::string> leafPairs(const tinyxml2::XMLElement* parent, bool skipTasks) const;
        void                     reportXmlFailure(const XmlParseError& err, Report& report) const;

        CodecSymbols m_symbols{};
    };

} // namespace alignkit::config
