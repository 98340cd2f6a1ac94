#include "Retrace.h"
#include "RetraceMatcher.h"
#include "RetraceException.h"
#include "RetraceUtf8.h"
#include <iostream>

int main(int argc, const char **argv)
{
    if (argc < 3)
    {
        std::cout << "usage: " << argv[0] << " regex_str match_str" << std::endl;
        return 0;
    }

    try
    {
        retrace::Regex re(argv[1]);
        std::cout << "regex \"" << argv[1] << "\" is ok." << std::endl;
        std::cout << "compiled: " << retrace::parser::Dump(re.GetNodes()) << std::endl;

        retrace::RegexMatcher matcher(re);
        auto elements = retrace::utf8::Decode(argv[2]);
        auto begin = elements.data();

        std::size_t length = 0;
        if (matcher.MatchPrefix(begin, begin + elements.size(), &length))
        {
            std::cout << "match \"" << retrace::utf8::Encode(begin, begin + length)
                      << "\" length " << length << std::endl;
        }
        else
        {
            std::cout << "no match" << std::endl;
        }
    } catch (const retrace::ParseException &e)
    {
        std::cout << "Parse error at index " << e.Position() << " :" << e.What() << std::endl;
        return 1;
    }

    return 0;
}
