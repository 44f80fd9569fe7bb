#pragma once

#include <string>
#include <string_view>

// Remote paths are always '/' separated, whatever the local platform uses.
namespace ferry::paths
{

    std::string normalize(std::string path);

    std::string join(const std::string &base, const std::string &relative);

    // "" when path equals base, "../x" style when path is outside of base.
    std::string relative(const std::string &base, const std::string &path);

    std::string dirname(const std::string &path);

    std::string basename(const std::string &path);

    // True when path is base itself or lies below it (segment-wise, "/a" does not contain "/ab").
    bool is_within(std::string_view base, std::string_view path);

} // namespace ferry::paths
