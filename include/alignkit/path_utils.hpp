#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace alignkit::util
{

    // "/foo/bar.baz" -> "bar"
    std::optional<std::string> fileNameWithoutExtension(const std::optional<std::string>& path);

    std::string normJoin(const std::string& prefix, const std::string& suffix);

    // Given a directory and its entry names, returns the names to skip.
    using CopyIgnore =
        std::function<std::set<std::string>(const std::filesystem::path&, const std::vector<std::string>&)>;

    /**
     * Copies the contents of source into destination, creating destination
     * when needed. The source directory itself is not copied. When source is
     * a regular file it is copied to destination. Filesystem failures throw
     * std::filesystem::filesystem_error.
     */
    void copyTree(const std::filesystem::path& source, const std::filesystem::path& destination,
                  const CopyIgnore& ignore = {});

    // Scratch directory on Linux and macOS; std::nullopt means "use the platform default".
    std::optional<std::string> customTmpDir();

} // namespace alignkit::util
