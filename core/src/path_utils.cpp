#include "ferry/path_utils.hpp"

#include <filesystem>

namespace ferry::paths
{

    std::string normalize(std::string path)
    {
        if (path.empty())
        {
            return ".";
        }
        auto normal = std::filesystem::path(std::move(path)).lexically_normal().generic_string();
        while (normal.size() > 1 && normal.back() == '/')
        {
            normal.pop_back();
        }
        return normal.empty() ? std::string(".") : normal;
    }

    std::string join(const std::string &base, const std::string &relative)
    {
        if (relative.empty() || relative == ".")
        {
            return normalize(base);
        }
        if (base.empty() || base == ".")
        {
            return normalize(relative);
        }
        return normalize(base + "/" + relative);
    }

    std::string relative(const std::string &base, const std::string &path)
    {
        const auto rel = std::filesystem::path(normalize(path)).lexically_relative(normalize(base)).generic_string();
        if (rel == ".")
        {
            return {};
        }
        return rel;
    }

    std::string dirname(const std::string &path)
    {
        const auto normal = normalize(path);
        const auto slash = normal.find_last_of('/');
        if (slash == std::string::npos)
        {
            return ".";
        }
        if (slash == 0)
        {
            return "/";
        }
        return normal.substr(0, slash);
    }

    std::string basename(const std::string &path)
    {
        const auto normal = normalize(path);
        const auto slash = normal.find_last_of('/');
        return slash == std::string::npos ? normal : normal.substr(slash + 1);
    }

    bool is_within(std::string_view base, std::string_view path)
    {
        while (base.size() > 1 && base.back() == '/')
        {
            base.remove_suffix(1);
        }
        if (!path.starts_with(base))
        {
            return false;
        }
        if (path.size() == base.size() || base == "/")
        {
            return true;
        }
        return path[base.size()] == '/';
    }

} // namespace ferry::paths
