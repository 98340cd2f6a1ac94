#include "RetraceUtf8.h"

namespace retrace
{
    namespace utf8
    {
        namespace
        {
            bool IsContinuation(unsigned char c)
            {
                return (c & 0xC0) == 0x80;
            }

            // Decode one sequence from [p, end), return byte count of
            // the sequence, or 0 when it is malformed.
            std::size_t DecodeOne(const unsigned char *p,
                                  const unsigned char *end, int &code)
            {
                unsigned char u = p[0];
                if (u < 0x80)
                {
                    code = u;
                    return 1;
                }

                std::size_t count = 0;
                int min = 0;
                if ((u & 0xE0) == 0xC0)
                {
                    count = 2;
                    min = 0x80;
                    code = u & 0x1F;
                }
                else if ((u & 0xF0) == 0xE0)
                {
                    count = 3;
                    min = 0x800;
                    code = u & 0x0F;
                }
                else if ((u & 0xF8) == 0xF0)
                {
                    count = 4;
                    min = 0x10000;
                    code = u & 0x07;
                }
                else
                {
                    return 0;
                }

                if (static_cast<std::size_t>(end - p) < count)
                    return 0;

                for (std::size_t i = 1; i < count; ++i)
                {
                    if (!IsContinuation(p[i]))
                        return 0;
                    code = (code << 6) | (p[i] & 0x3F);
                }

                // Overlong form, surrogate or out of range
                if (code < min || code > 0x10FFFF ||
                    (code >= 0xD800 && code <= 0xDFFF))
                    return 0;

                return count;
            }
        } // namespace

        std::vector<int> Decode(const std::string &str)
        {
            std::vector<int> elements;
            elements.reserve(str.size());

            auto p = reinterpret_cast<const unsigned char *>(str.data());
            auto end = p + str.size();

            while (p != end)
            {
                int code = 0;
                auto count = DecodeOne(p, end, code);
                if (count == 0)
                {
                    elements.push_back(-static_cast<int>(*p));
                    ++p;
                }
                else
                {
                    elements.push_back(code);
                    p += count;
                }
            }

            return elements;
        }

        std::string Encode(const int *begin, const int *end)
        {
            std::string str;
            for (auto p = begin; p != end; ++p)
            {
                int c = *p;
                if (c < 0)
                {
                    str.push_back(static_cast<char>(-c));
                }
                else if (c < 0x80)
                {
                    str.push_back(static_cast<char>(c));
                }
                else if (c < 0x800)
                {
                    str.push_back(static_cast<char>(0xC0 | (c >> 6)));
                    str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
                else if (c < 0x10000)
                {
                    str.push_back(static_cast<char>(0xE0 | (c >> 12)));
                    str.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
                    str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
                else
                {
                    str.push_back(static_cast<char>(0xF0 | (c >> 18)));
                    str.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
                    str.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
                    str.push_back(static_cast<char>(0x80 | (c & 0x3F)));
                }
            }
            return str;
        }
    } // namespace utf8
} // namespace retrace
