#include "ferry/ignore.hpp"

#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>

#include "ferry/errors.hpp"
#include "ferry/path_utils.hpp"

namespace ferry
{

    namespace
    {

        std::string_view trim_trailing_spaces(std::string_view line)
        {
            while (!line.empty() && (line.back() == ' ' || line.back() == '\t' || line.back() == '\r'))
            {
                if (line.size() >= 2 && line[line.size() - 2] == '\\')
                {
                    break;
                }
                line.remove_suffix(1);
            }
            return line;
        }

        // Consumes a "[...]" class from mask. Returns false when the class is unterminated.
        bool match_class(std::string_view &mask, char c, bool &matched)
        {
            auto end = mask.find(']', 2);
            if (end == std::string_view::npos)
            {
                return false;
            }
            auto body = mask.substr(1, end - 1);
            bool negate = false;
            if (!body.empty() && (body.front() == '!' || body.front() == '^'))
            {
                negate = true;
                body.remove_prefix(1);
            }
            bool hit = false;
            for (std::size_t i = 0; i < body.size(); ++i)
            {
                if (i + 2 < body.size() && body[i + 1] == '-')
                {
                    if (body[i] <= c && c <= body[i + 2])
                    {
                        hit = true;
                    }
                    i += 2;
                }
                else if (body[i] == c)
                {
                    hit = true;
                }
            }
            matched = hit != negate && c != '/';
            mask.remove_prefix(end + 1);
            return true;
        }

    } // namespace

    bool glob_match(std::string_view mask, std::string_view path)
    {
        while (!mask.empty())
        {
            const char m = mask.front();
            if (m == '*')
            {
                if (mask.starts_with("**"))
                {
                    mask.remove_prefix(2);
                    if (mask.empty())
                    {
                        return true;
                    }
                    if (mask.front() == '/')
                    {
                        // "**/" matches zero or more leading directories
                        mask.remove_prefix(1);
                        for (;;)
                        {
                            if (glob_match(mask, path))
                            {
                                return true;
                            }
                            const auto slash = path.find('/');
                            if (slash == std::string_view::npos)
                            {
                                return false;
                            }
                            path.remove_prefix(slash + 1);
                        }
                    }
                    for (std::size_t i = 0; i <= path.size(); ++i)
                    {
                        if (glob_match(mask, path.substr(i)))
                        {
                            return true;
                        }
                    }
                    return false;
                }

                mask.remove_prefix(1);
                for (std::size_t i = 0; i <= path.size(); ++i)
                {
                    if (glob_match(mask, path.substr(i)))
                    {
                        return true;
                    }
                    if (i < path.size() && path[i] == '/')
                    {
                        return false;
                    }
                }
                return false;
            }

            if (path.empty())
            {
                return false;
            }

            if (m == '?')
            {
                if (path.front() == '/')
                {
                    return false;
                }
                mask.remove_prefix(1);
            }
            else if (m == '[')
            {
                bool matched = false;
                if (match_class(mask, path.front(), matched))
                {
                    if (!matched)
                    {
                        return false;
                    }
                }
                else
                {
                    if (path.front() != '[')
                    {
                        return false;
                    }
                    mask.remove_prefix(1);
                }
            }
            else if (m == '\\' && mask.size() > 1)
            {
                if (mask[1] != path.front())
                {
                    return false;
                }
                mask.remove_prefix(2);
            }
            else
            {
                if (m != path.front())
                {
                    return false;
                }
                mask.remove_prefix(1);
            }
            path.remove_prefix(1);
        }
        return path.empty();
    }

    IgnoreRules::IgnoreRules(const std::vector<std::string> &patterns)
    {
        for (const auto &pattern : patterns)
        {
            add(pattern);
        }
    }

    void IgnoreRules::add(std::string_view pattern)
    {
        auto line = trim_trailing_spaces(pattern);
        if (line.empty() || line.front() == '#')
        {
            return;
        }

        Rule rule;
        if (line.front() == '!')
        {
            rule.negated = true;
            line.remove_prefix(1);
        }
        else if (line.starts_with("\\!") || line.starts_with("\\#"))
        {
            line.remove_prefix(1);
        }

        if (!line.empty() && line.back() == '/')
        {
            rule.directory_only = true;
            while (!line.empty() && line.back() == '/')
            {
                line.remove_suffix(1);
            }
        }
        if (line.find('/') != std::string_view::npos)
        {
            rule.anchored = true;
        }
        while (!line.empty() && line.front() == '/')
        {
            line.remove_prefix(1);
        }
        if (line.empty())
        {
            return;
        }
        rule.mask = std::string(line);
        rules_.push_back(std::move(rule));
    }

    bool IgnoreRules::ignores(std::string_view relative_path) const
    {
        while (relative_path.starts_with("./"))
        {
            relative_path.remove_prefix(2);
        }
        while (!relative_path.empty() && relative_path.front() == '/')
        {
            relative_path.remove_prefix(1);
        }
        bool is_directory = false;
        while (!relative_path.empty() && relative_path.back() == '/')
        {
            is_directory = true;
            relative_path.remove_suffix(1);
        }
        if (relative_path.empty() || rules_.empty())
        {
            return false;
        }

        // parents first: an excluded directory cannot have included children
        std::size_t begin = 0;
        for (;;)
        {
            const auto slash = relative_path.find('/', begin);
            const bool last = slash == std::string_view::npos;
            const auto prefix = last ? relative_path : relative_path.substr(0, slash);
            const auto name = prefix.substr(begin);
            if (test(prefix, name, !last || is_directory))
            {
                return true;
            }
            if (last)
            {
                return false;
            }
            begin = slash + 1;
        }
    }

    bool IgnoreRules::test(std::string_view path, std::string_view name, bool is_directory) const
    {
        bool ignored = false;
        for (const auto &rule : rules_)
        {
            if (rule.negated != ignored)
            {
                continue;
            }
            if (rule.directory_only && !is_directory)
            {
                continue;
            }
            const bool hit = rule.anchored ? glob_match(rule.mask, path) : glob_match(rule.mask, name);
            if (hit)
            {
                ignored = !rule.negated;
            }
        }
        return ignored;
    }

    std::vector<std::string> IgnoreFileCache::lines(const std::filesystem::path &path)
    {
        const auto key = path.lexically_normal().string();
        {
            std::lock_guard lock(mutex_);
            if (auto it = entries_.find(key); it != entries_.end())
            {
                return it->second;
            }
        }

        std::error_code ec;
        if (!std::filesystem::exists(path, ec))
        {
            throw ConfigError("File " + path.string() + " not found. Check your config of \"ignoreFile\"",
                              "ignoreFile");
        }
        std::ifstream in(path, std::ios::binary);
        if (!in.is_open())
        {
            throw ConfigError("File " + path.string() + " could not be read. Check your config of \"ignoreFile\"",
                              "ignoreFile");
        }
        std::ostringstream content;
        content << in.rdbuf();

        std::vector<std::string> result;
        std::istringstream stream(content.str());
        std::string line;
        while (std::getline(stream, line))
        {
            if (!line.empty() && line.back() == '\r')
            {
                line.pop_back();
            }
            result.push_back(std::move(line));
        }
        spdlog::debug("Loaded {} ignore lines from {}", result.size(), key);

        std::lock_guard lock(mutex_);
        ++disk_reads_;
        entries_[key] = result;
        return result;
    }

    bool IgnoreFileCache::contains(const std::filesystem::path &path) const
    {
        std::lock_guard lock(mutex_);
        return entries_.find(path.lexically_normal().string()) != entries_.end();
    }

    void IgnoreFileCache::evict(const std::filesystem::path &path)
    {
        std::lock_guard lock(mutex_);
        entries_.erase(path.lexically_normal().string());
    }

    void IgnoreFileCache::clear()
    {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

    std::size_t IgnoreFileCache::disk_reads() const
    {
        std::lock_guard lock(mutex_);
        return disk_reads_;
    }

    std::vector<std::string> collect_ignore_patterns(const std::vector<std::string> &patterns,
                                                     const std::optional<std::filesystem::path> &ignore_file,
                                                     IgnoreFileCache &cache)
    {
        std::vector<std::string> merged = patterns;
        if (!ignore_file || ignore_file->empty())
        {
            return merged;
        }
        auto from_file = cache.lines(*ignore_file);
        merged.insert(merged.end(), std::make_move_iterator(from_file.begin()), std::make_move_iterator(from_file.end()));
        return merged;
    }

    IgnorePredicate make_ignore_predicate(const std::vector<std::string> &patterns,
                                          const std::filesystem::path &local_base,
                                          const std::string &remote_root)
    {
        if (patterns.empty())
        {
            return {};
        }

        auto rules = std::make_shared<const IgnoreRules>(patterns);
        auto local = paths::normalize(local_base.generic_string());
        auto remote = paths::normalize(remote_root);
        return [rules, local = std::move(local), remote = std::move(remote)](const std::string &fs_path)
        {
            // a trailing '/' marks a directory
            const bool directory = fs_path.size() > 1 && fs_path.back() == '/';
            const auto normalized = paths::normalize(std::filesystem::path(fs_path).generic_string());
            const auto relative = paths::is_within(local, normalized) ? paths::relative(local, normalized)
                                                                       : paths::relative(remote, normalized);
            // the root itself is never ignored
            return !relative.empty() && rules->ignores(directory ? relative + "/" : relative);
        };
    }

    IgnorePredicate resolve_ignore(const std::vector<std::string> &patterns,
                                   const std::optional<std::filesystem::path> &ignore_file,
                                   const std::filesystem::path &local_base, const std::string &remote_root,
                                   IgnoreFileCache &cache)
    {
        return make_ignore_predicate(collect_ignore_patterns(patterns, ignore_file, cache), local_base, remote_root);
    }

} // namespace ferry
