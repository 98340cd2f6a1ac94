#include "RetraceParser.h"
#include "RetraceException.h"
#include "RetraceUtf8.h"
#include <stdio.h>

namespace retrace
{
    namespace parser
    {
#define ACCEPT_VISITOR_IMPL(class_name)                     \
    void class_name::Accept(Visitor *v, void *data) const   \
    {                                                       \
        v->Visit(this, data);                               \
    }

        ACCEPT_VISITOR_IMPL(CharNode)
        ACCEPT_VISITOR_IMPL(DotNode)
        ACCEPT_VISITOR_IMPL(GroupNode)

        std::unique_ptr<ASTNode> CharNode::Clone() const
        {
            return std::unique_ptr<ASTNode>(new CharNode(c_, quantifier_));
        }

        std::unique_ptr<ASTNode> DotNode::Clone() const
        {
            return std::unique_ptr<ASTNode>(new DotNode(quantifier_));
        }

        std::unique_ptr<ASTNode> GroupNode::Clone() const
        {
            return std::unique_ptr<ASTNode>(new GroupNode(CloneNodes(nodes_), quantifier_));
        }

        NodeList CloneNodes(const NodeList &nodes)
        {
            NodeList result;
            result.reserve(nodes.size());
            for (auto it = nodes.begin(); it != nodes.end(); ++it)
                result.push_back((*it)->Clone());
            return result;
        }

        class LexStream
        {
        public:
            LexStream(const int *begin, const int *end)
                : current_(begin), begin_(begin), end_(end)
            {
            }

            LexStream(const LexStream &) = delete;
            void operator = (const LexStream &) = delete;

            int Get() const
            {
                if (current_ != end_)
                    return *current_;
                else
                    return EOF;
            }

            bool IsEnd() const
            {
                return current_ == end_;
            }

            void Next()
            {
                ++current_;
            }

            std::size_t Index() const
            {
                return current_ - begin_;
            }

        private:
            const int *current_;
            const int *begin_;
            const int *end_;
        };

        // One nesting level of regex, root level or an open '('
        struct Level
        {
            NodeList nodes_;
            // Index of '(' which opened this level
            std::size_t open_pos_;

            explicit Level(std::size_t open_pos = 0) : open_pos_(open_pos) { }
        };

        std::string QuoteChar(int c)
        {
            std::string str("'");
            if (c >= 0)
                str += utf8::Encode(&c, &c + 1);
            str.push_back('\'');
            return str;
        }

        // Get last node of level which can be quantified, or throw
        // ParseException
        ASTNode * QuantifiableNode(Level &level, const LexStream &stream)
        {
            if (level.nodes_.empty())
                throw ParseException(ParseError::DanglingQuantifier,
                                     "nothing to repeat before " +
                                     QuoteChar(stream.Get()),
                                     stream.Index());

            auto node = level.nodes_.back().get();
            if (node->quantifier_ != Quantifier::ExactlyOne)
                throw ParseException(ParseError::DanglingQuantifier,
                                     "quantifier " + QuoteChar(stream.Get()) +
                                     " must follow an unquantified element or group",
                                     stream.Index());
            return node;
        }

        void ParseEscape(std::vector<Level> &levels, LexStream &stream)
        {
            auto pos = stream.Index();
            stream.Next();              // Skip '\'

            if (stream.IsEnd())
                throw ParseException(ParseError::BadEscape,
                                     "bad escape character at end of regex", pos);

            levels.back().nodes_.push_back(std::unique_ptr<ASTNode>(new CharNode(stream.Get())));
            stream.Next();
        }

        void ParseCloseGroup(std::vector<Level> &levels, LexStream &stream)
        {
            if (levels.size() <= 1)
                throw ParseException(ParseError::UnmatchedClose,
                                     "no group to close", stream.Index());
            stream.Next();

            std::unique_ptr<ASTNode> group(new GroupNode(std::move(levels.back().nodes_)));
            levels.pop_back();
            levels.back().nodes_.push_back(std::move(group));
        }

        void ParseQuantifier(std::vector<Level> &levels, LexStream &stream)
        {
            auto &level = levels.back();
            auto node = QuantifiableNode(level, stream);

            switch (stream.Get())
            {
            case '?':
                node->quantifier_ = Quantifier::ZeroOrOne;
                break;
            case '*':
                node->quantifier_ = Quantifier::ZeroOrMore;
                break;
            default:
                {
                    // 'x+' is 'x' followed by 'x*'
                    auto repeat = node->Clone();
                    repeat->quantifier_ = Quantifier::ZeroOrMore;
                    level.nodes_.push_back(std::move(repeat));
                }
                break;
            }

            stream.Next();
        }

        NodeList Parse(const int *begin, const int *end)
        {
            LexStream stream(begin, end);

            std::vector<Level> levels;
            levels.push_back(Level());

            while (!stream.IsEnd())
            {
                int c = stream.Get();
                switch (c)
                {
                case '.':
                    levels.back().nodes_.push_back(std::unique_ptr<ASTNode>(new DotNode));
                    stream.Next();
                    break;
                case '\\':
                    ParseEscape(levels, stream);
                    break;
                case '(':
                    levels.push_back(Level(stream.Index()));
                    stream.Next();
                    break;
                case ')':
                    ParseCloseGroup(levels, stream);
                    break;
                case '?':
                case '*':
                case '+':
                    ParseQuantifier(levels, stream);
                    break;
                default:
                    levels.back().nodes_.push_back(std::unique_ptr<ASTNode>(new CharNode(c)));
                    stream.Next();
                    break;
                }
            }

            if (levels.size() != 1)
                throw ParseException(ParseError::UnmatchedOpen,
                                     "incomplete \"()\"", levels.back().open_pos_);

            return std::move(levels.back().nodes_);
        }

        NodeList Parse(const std::string &re)
        {
            auto elements = utf8::Decode(re);
            return Parse(elements.data(), elements.data() + elements.size());
        }

        class EqualVisitor : public Visitor
        {
        public:
            // 'data' is the right hand node to compare with
            VISIT_NODE(CharNode)
            {
                auto other = dynamic_cast<const CharNode *>(static_cast<const ASTNode *>(data));
                equal_ = other && other->quantifier_ == n->quantifier_ && other->c_ == n->c_;
            }

            VISIT_NODE(DotNode)
            {
                auto other = dynamic_cast<const DotNode *>(static_cast<const ASTNode *>(data));
                equal_ = other && other->quantifier_ == n->quantifier_;
            }

            VISIT_NODE(GroupNode)
            {
                auto other = dynamic_cast<const GroupNode *>(static_cast<const ASTNode *>(data));
                equal_ = other && other->quantifier_ == n->quantifier_ &&
                    IsSameTree(n->nodes_, other->nodes_);
            }

            bool equal_ = false;
        };

        bool IsSameTree(const NodeList &left, const NodeList &right)
        {
            if (left.size() != right.size())
                return false;

            for (std::size_t i = 0; i < left.size(); ++i)
            {
                EqualVisitor visitor;
                const ASTNode *other = right[i].get();
                left[i]->Accept(&visitor, const_cast<ASTNode *>(other));
                if (!visitor.equal_)
                    return false;
            }

            return true;
        }

        class DumpVisitor : public Visitor
        {
        public:
            // 'data' is std::string for output
            VISIT_NODE(CharNode)
            {
                auto &out = *static_cast<std::string *>(data);
                char buf[16];

                if (n->c_ < 0)
                {
                    snprintf(buf, sizeof(buf), "\\x%02X", -n->c_);
                    out += "Char(";
                    out += buf;
                    out += ")";
                }
                else if (n->c_ >= 0x20 && n->c_ < 0x7F)
                {
                    out += "Char('";
                    out.push_back(static_cast<char>(n->c_));
                    out += "')";
                }
                else
                {
                    snprintf(buf, sizeof(buf), "U+%04X", n->c_);
                    out += "Char(";
                    out += buf;
                    out += ")";
                }

                AppendQuantifier(n, out);
            }

            VISIT_NODE(DotNode)
            {
                auto &out = *static_cast<std::string *>(data);
                out += "Dot";
                AppendQuantifier(n, out);
            }

            VISIT_NODE(GroupNode)
            {
                auto &out = *static_cast<std::string *>(data);
                out += "Group(";
                out += Dump(n->nodes_);
                out += ")";
                AppendQuantifier(n, out);
            }

        private:
            static void AppendQuantifier(const ASTNode *n, std::string &out)
            {
                switch (n->quantifier_)
                {
                case Quantifier::ExactlyOne: out += "{1}"; break;
                case Quantifier::ZeroOrOne: out += "{?}"; break;
                case Quantifier::ZeroOrMore: out += "{*}"; break;
                }
            }
        };

        std::string Dump(const NodeList &nodes)
        {
            std::string out;
            DumpVisitor visitor;

            for (auto it = nodes.begin(); it != nodes.end(); ++it)
            {
                if (it != nodes.begin())
                    out.push_back(' ');
                (*it)->Accept(&visitor, &out);
            }

            return out;
        }
    } // namespace parser
} // namespace retrace
