#ifndef RETRACE_UTF8_H
#define RETRACE_UTF8_H

#include <string>
#include <vector>

namespace retrace
{
    namespace utf8
    {
        // Decode UTF-8 string into elements (code points). A byte which
        // does not start a well-formed sequence becomes one element with
        // value -byte, so it never equals any code point.
        std::vector<int> Decode(const std::string &str);

        // Encode elements back to UTF-8, undecodable bytes are restored.
        std::string Encode(const int *begin, const int *end);
    } // namespace utf8
} // namespace retrace

#endif // RETRACE_UTF8_H
