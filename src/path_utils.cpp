#include "path_utils.hpp"

namespace alignkit::util
{

    namespace fs = std::filesystem;

    namespace
    {

        constexpr const char* kTmpPath = "/tmp/";

    } // namespace

    std::optional<std::string> fileNameWithoutExtension(const std::optional<std::string>& path)
    {
        if (!path)
            return std::nullopt;
        return fs::path(*path).stem().string();
    }

    std::string normJoin(const std::string& prefix, const std::string& suffix)
    {
        auto joined = (fs::path(prefix) / suffix).lexically_normal();
        auto out    = joined.string();
        // lexically_normal keeps a trailing separator that the joined form does not need
        if (out.size() > 1 && out.back() == fs::path::preferred_separator)
            out.pop_back();
        return out.empty() ? "." : out;
    }

    void copyTree(const fs::path& source, const fs::path& destination, const CopyIgnore& ignore)
    {
        if (!fs::is_directory(source))
        {
            fs::copy_file(source, destination, fs::copy_options::overwrite_existing);
            return;
        }

        if (!fs::is_directory(destination))
            fs::create_directories(destination);

        std::vector<std::string> names;
        for (const auto& entry : fs::directory_iterator(source))
            names.push_back(entry.path().filename().string());

        std::set<std::string> ignored;
        if (ignore)
            ignored = ignore(source, names);

        for (const auto& name : names)
        {
            if (ignored.count(name))
                continue;
            copyTree(source / name, destination / name, ignore);
        }
    }

    std::optional<std::string> customTmpDir()
    {
#if defined(__linux__) || defined(__APPLE__)
        return std::string(kTmpPath);
#else
        return std::nullopt;
#endif
    }

} // namespace alignkit::util
