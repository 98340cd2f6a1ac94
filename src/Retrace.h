#ifndef RETRACE_H
#define RETRACE_H

#include "RetraceParser.h"
#include <string>

namespace retrace
{
    // Compiled regex, immutable after construction.
    class Regex
    {
    public:
        // Throw ParseException when re is invalid
        explicit Regex(const std::string &re);

        Regex(const Regex &) = delete;
        void operator = (const Regex &) = delete;

        const parser::NodeList & GetNodes() const
        {
            return nodes_;
        }

        const std::string & GetPattern() const
        {
            return re_;
        }

    private:
        std::string re_;
        parser::NodeList nodes_;
    };

    // Match regex 're' against prefix of 'str' which is anchored at the
    // first character. Return true and store element count of the prefix
    // in '*length' when matched, throw ParseException when re is invalid.
    bool MatchPattern(const std::string &re, const std::string &str,
                      std::size_t *length = nullptr);
} // namespace retrace

#endif // RETRACE_H
