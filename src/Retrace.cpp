#include "Retrace.h"
#include "RetraceMatcher.h"
#include "RetraceUtf8.h"

namespace retrace
{
    Regex::Regex(const std::string &re)
        : re_(re),
          nodes_(parser::Parse(re))
    {
    }

    bool MatchPattern(const std::string &re, const std::string &str,
                      std::size_t *length)
    {
        Regex regex(re);
        RegexMatcher matcher(regex);

        auto elements = utf8::Decode(str);
        return matcher.MatchPrefix(elements.data(),
                                   elements.data() + elements.size(),
                                   length);
    }
} // namespace retrace
