#ifndef RETRACE_MATCHER_H
#define RETRACE_MATCHER_H

#include "Retrace.h"
#include <string>

namespace retrace
{
    // Result of evaluating a node sequence against a subject.
    struct MatchState
    {
        bool matched_;
        // Offset past the match when matched_ is true, otherwise
        // the offset where matching failed first.
        std::size_t end_;

        explicit MatchState(bool matched = false, std::size_t end = 0)
            : matched_(matched), end_(end)
        {
        }
    };

    // Evaluate 'nodes' against [begin, end) anchored at 'begin', with
    // greedy quantifiers and backtracking. A matched group is atomic, the
    // outer evaluation never retries a different length inside it.
    //
    // Worst case time is exponential in the number of repeating nodes,
    // e.g. "(a*)*" style nesting against long input which can't match.
    MatchState Evaluate(const parser::NodeList &nodes,
                        const int *begin, const int *end);

    class RegexMatcher
    {
    public:
        explicit RegexMatcher(const Regex &regex);
        explicit RegexMatcher(const parser::NodeList *nodes);

        RegexMatcher(const RegexMatcher &) = delete;
        void operator = (const RegexMatcher &) = delete;

        // Check [begin, end) characters is match regex or not
        bool IsMatch(const int *begin, const int *end) const;
        bool IsMatch(const std::string &str) const;

        // Match prefix of [begin, end), '*length' store element count of
        // the prefix when match success.
        bool MatchPrefix(const int *begin, const int *end,
                         std::size_t *length) const;
        bool MatchPrefix(const std::string &str, std::size_t *length) const;

    private:
        const parser::NodeList *nodes_;
    };
} // namespace retrace

#endif // RETRACE_MATCHER_H
