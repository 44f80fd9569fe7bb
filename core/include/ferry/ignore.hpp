/**
 * Ferry - Ignore rules and the per-configuration ignore predicate.
 */
#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace ferry
{

    // Maps an absolute local or remote path to "excluded?"; a trailing '/' marks a directory.
    // An empty predicate excludes nothing.
    using IgnorePredicate = std::function<bool(const std::string &)>;

    /**
     * gitignore style rule set.
     *
     * Supported: comments (#), negation (!), trailing '/' for directories, a leading or
     * inner '/' anchoring the pattern to the root, '*', '?', '[...]' and '**'.
     * A path is excluded when it, or any of its parent directories, is excluded.
     */
    class IgnoreRules
    {
    public:
        IgnoreRules() = default;
        explicit IgnoreRules(const std::vector<std::string> &patterns);

        void add(std::string_view pattern);

        // relative_path is '/' separated and relative to the root; a trailing '/' marks a directory.
        bool ignores(std::string_view relative_path) const;

        bool empty() const noexcept { return rules_.empty(); }
        std::size_t size() const noexcept { return rules_.size(); }

    private:
        struct Rule
        {
            std::string mask;
            bool negated{};
            bool directory_only{};
            bool anchored{};
        };

        bool test(std::string_view path, std::string_view name, bool is_directory) const;

        std::vector<Rule> rules_;
    };

    bool glob_match(std::string_view mask, std::string_view path);

    // Contents of ignore files keyed by path. Entries are only dropped through evict() or clear().
    class IgnoreFileCache
    {
    public:
        // Throws ConfigError when the file does not exist.
        std::vector<std::string> lines(const std::filesystem::path &path);

        bool contains(const std::filesystem::path &path) const;
        void evict(const std::filesystem::path &path);
        void clear();

        std::size_t disk_reads() const;

    private:
        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::vector<std::string>> entries_;
        std::size_t disk_reads_{0};
    };

    // patterns ++ lines of ignore_file.
    std::vector<std::string> collect_ignore_patterns(const std::vector<std::string> &patterns,
                                                     const std::optional<std::filesystem::path> &ignore_file,
                                                     IgnoreFileCache &cache);

    IgnorePredicate make_ignore_predicate(const std::vector<std::string> &patterns,
                                          const std::filesystem::path &local_base,
                                          const std::string &remote_root);

    IgnorePredicate resolve_ignore(const std::vector<std::string> &patterns,
                                   const std::optional<std::filesystem::path> &ignore_file,
                                   const std::filesystem::path &local_base, const std::string &remote_root,
                                   IgnoreFileCache &cache);

} // namespace ferry
