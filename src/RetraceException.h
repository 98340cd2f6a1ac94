#ifndef RETRACE_EXCEPTION_H
#define RETRACE_EXCEPTION_H

#include <string>

namespace retrace
{
    enum class ParseError
    {
        BadEscape,              // '\' is the last character of pattern
        UnmatchedClose,         // ')' without open group
        UnmatchedOpen,          // '(' never closed
        DanglingQuantifier,     // '?' '*' '+' without quantifiable element
    };

    class ParseException
    {
    public:
        ParseException(ParseError kind, const std::string &desc, std::size_t pos)
            : kind_(kind), desc_(desc), pos_(pos)
        {
        }

        ParseError Kind() const
        {
            return kind_;
        }

        std::string What() const
        {
            return desc_;
        }

        // Element index in the pattern where the error is detected
        std::size_t Position() const
        {
            return pos_;
        }

    private:
        ParseError kind_;
        std::string desc_;
        std::size_t pos_;
    };
} // namespace retrace

#endif // RETRACE_EXCEPTION_H
