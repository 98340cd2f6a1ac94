#include "Retrace.h"
#include "RetraceMatcher.h"
#include "benchmark.h"
#include <regex>
#include <string>

benchmarks g_benchmarks;

namespace
{
    const std::string g_a_run(2000, 'a');
    const std::string g_a_run_c = g_a_run + "c";
    const std::string g_short_a_run(40, 'a');

    std::string make_words()
    {
        std::string str;
        for (int i = 0; i < 200; ++i)
            str += "abcd";
        return str + "!";
    }

    const std::string g_words = make_words();

    bool std_regex_match_prefix(const std::string &re, const std::string &str)
    {
        std::regex r(re);
        return std::regex_search(str, r, std::regex_constants::match_continuous);
    }

    // Compiled once, matched on every iteration
    retrace::Regex g_dot_star_c("a.*c");
    retrace::Regex g_group_star("(abcd)*!");
} // namespace

using namespace retrace;

BENCHMARK(greedy1, "a*c, match", 1000)
{
    return MatchPattern("a*c", g_a_run_c);
}

BENCHMARK(greedy2, "a.*c, backtrack from the end", 1000)
{
    RegexMatcher matcher(g_dot_star_c);
    return matcher.MatchPrefix(g_a_run_c, nullptr);
}

BENCHMARK(greedy3, "a*b, no match", 1000)
{
    return MatchPattern("a*b", g_a_run);
}

BENCHMARK(group1, "(abcd)*!", 1000)
{
    RegexMatcher matcher(g_group_star);
    return matcher.MatchPrefix(g_words, nullptr);
}

BENCHMARK(group2, "(a?)*a, group is atomic", 1000)
{
    return MatchPattern("(a?)*a", g_a_run);
}

BENCHMARK(pathological1, "a*a*a*a*b, polynomial backtracking", 1)
{
    return MatchPattern("a*a*a*a*b", g_short_a_run);
}

BENCHMARK(std_greedy1, "a*c, match", 1000)
{
    return std_regex_match_prefix("a*c", g_a_run_c);
}

BENCHMARK(std_group1, "(abcd)*!", 1000)
{
    return std_regex_match_prefix("(abcd)*!", g_words);
}

int main()
{
    g_benchmarks.run_benchmarks();
    return 0;
}
