#include <cassert>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "ferry/errors.hpp"
#include "ferry/ignore.hpp"
#include "test_support.hpp"

using namespace ferry;

namespace
{

    void test_glob_match()
    {
        assert(glob_match("*.log", "debug.log"));
        assert(!glob_match("*.log", "logs/debug.log"));
        assert(glob_match("**/debug.log", "debug.log"));
        assert(glob_match("**/debug.log", "a/b/debug.log"));
        assert(glob_match("logs/**", "logs/a/b"));
        assert(glob_match("file?.txt", "file1.txt"));
        assert(!glob_match("file?.txt", "file/.txt"));
        assert(glob_match("[a-c]x", "bx"));
        assert(!glob_match("[!a-c]x", "bx"));
        assert(glob_match("\\*star", "*star"));
        assert(!glob_match("\\*star", "xstar"));
    }

    void test_rules()
    {
        IgnoreRules rules({"# comment", "*.log", "!keep.log", "/dist", "node_modules/"});
        assert(rules.size() == 4);
        assert(rules.ignores("debug.log"));
        assert(rules.ignores("src/debug.log"));
        assert(!rules.ignores("keep.log"));
        assert(rules.ignores("dist"));
        assert(rules.ignores("dist/app.js"));
        assert(!rules.ignores("src/dist"));
        assert(rules.ignores("web/node_modules/pkg/index.js"));
        assert(rules.ignores("node_modules/"));
        // could be a file; only directories match "node_modules/"
        assert(!rules.ignores("node_modules"));
        assert(!rules.ignores("src/main.cpp"));
        assert(!rules.ignores(""));
    }

    void test_absent_predicate()
    {
        IgnoreFileCache cache;
        const auto predicate = resolve_ignore({}, std::nullopt, "/work", "/srv/app", cache);
        assert(!predicate);
        assert(cache.disk_reads() == 0);
    }

    void test_directory_pattern_on_both_sides()
    {
        const auto predicate = make_ignore_predicate({"build/"}, "/work", "/srv/app");
        assert(predicate);
        assert(predicate("/work/build/out.o"));
        assert(predicate("/work/build/"));
        assert(predicate("/srv/app/build/out.o"));
        assert(!predicate("/work/src/main.cpp"));
        assert(!predicate("/srv/app/src/main.cpp"));
        // a sibling that merely shares the prefix is not inside the local base
        assert(!predicate("/workshop/build"));
    }

    void test_root_never_ignored()
    {
        const auto predicate = make_ignore_predicate({"*"}, "/work", "/srv/app");
        assert(predicate("/work/anything"));
        assert(!predicate("/work"));
        assert(!predicate("/work/"));
        assert(!predicate("/srv/app"));
    }

    void test_missing_ignore_file()
    {
        test::TempDir dir("ignore_missing");
        IgnoreFileCache cache;
        const auto missing = dir.path() / ".ftpignore";
        bool thrown = false;
        try
        {
            resolve_ignore({"*.tmp"}, missing, dir.path(), "/srv", cache);
        }
        catch (const ConfigError &ex)
        {
            thrown = true;
            assert(ex.key() == "ignoreFile");
            assert(std::string(ex.what()).find("not found") != std::string::npos);
        }
        assert(thrown);
        assert(!cache.contains(missing));
    }

    void test_ignore_file_cache()
    {
        test::TempDir dir("ignore_cache");
        const auto file = dir.path() / ".ftpignore";
        test::write_file(file, "*.tmp\r\nsecret/\n");

        IgnoreFileCache cache;
        const auto first = resolve_ignore({}, file, dir.path(), "/srv", cache);
        assert(first);
        assert(first((dir.path() / "a.tmp").generic_string()));
        assert(first((dir.path() / "secret/key.pem").generic_string()));
        assert(cache.disk_reads() == 1);

        // edits on disk are not observed until the entry is evicted
        test::write_file(file, "*.bak\n");
        const auto second = resolve_ignore({}, dir.path() / "." / ".ftpignore", dir.path(), "/srv", cache);
        assert(cache.disk_reads() == 1);
        assert(second((dir.path() / "a.tmp").generic_string()));

        cache.evict(file);
        const auto third = resolve_ignore({}, file, dir.path(), "/srv", cache);
        assert(cache.disk_reads() == 2);
        assert(!third((dir.path() / "a.tmp").generic_string()));
        assert(third("/srv/old.bak"));
    }

    void test_collect_order()
    {
        test::TempDir dir("ignore_collect");
        const auto file = dir.path() / "ignore.txt";
        test::write_file(file, "from-file\n");
        IgnoreFileCache cache;
        const auto patterns = collect_ignore_patterns({"inline"}, file, cache);
        assert((patterns == std::vector<std::string>{"inline", "from-file"}));
    }

} // namespace

void run_ignore_tests()
{
    test_glob_match();
    test_rules();
    test_absent_predicate();
    test_directory_pattern_on_both_sides();
    test_root_never_ignored();
    test_missing_ignore_file();
    test_ignore_file_cache();
    test_collect_order();
}
