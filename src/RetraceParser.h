#ifndef RETRACE_PARSER_H
#define RETRACE_PARSER_H

#include <memory>
#include <vector>
#include <string>

namespace retrace
{
    namespace parser
    {
        class Visitor;

#define ACCEPT_VISITOR()                                \
    virtual void Accept(Visitor *v, void *data) const

#define VISIT_NODE(node)                                \
    virtual void Visit(const node *n, void *data)

        enum class Quantifier
        {
            ExactlyOne,
            ZeroOrOne,
            ZeroOrMore,
        };

        class ASTNode;
        typedef std::vector<std::unique_ptr<ASTNode>> NodeList;

        // Abstract syntax tree node for regex, every node has
        // exactly one quantifier.
        class ASTNode
        {
        public:
            explicit ASTNode(Quantifier quantifier)
                : quantifier_(quantifier)
            {
            }

            ACCEPT_VISITOR() = 0;

            // Deep copy of node with all children
            virtual std::unique_ptr<ASTNode> Clone() const = 0;

            virtual ~ASTNode() { }

            Quantifier quantifier_;
        };

        // Node for one character
        class CharNode : public ASTNode
        {
        public:
            explicit CharNode(int c, Quantifier quantifier = Quantifier::ExactlyOne)
                : ASTNode(quantifier), c_(c)
            {
            }

            ACCEPT_VISITOR();
            std::unique_ptr<ASTNode> Clone() const override;

            int c_;
        };

        // Node for dot. e.g. '.'
        class DotNode : public ASTNode
        {
        public:
            explicit DotNode(Quantifier quantifier = Quantifier::ExactlyOne)
                : ASTNode(quantifier)
            {
            }

            ACCEPT_VISITOR();
            std::unique_ptr<ASTNode> Clone() const override;
        };

        // Node for parenthese regex. e.g. (abc)
        class GroupNode : public ASTNode
        {
        public:
            explicit GroupNode(NodeList nodes,
                               Quantifier quantifier = Quantifier::ExactlyOne)
                : ASTNode(quantifier), nodes_(std::move(nodes))
            {
            }

            ACCEPT_VISITOR();
            std::unique_ptr<ASTNode> Clone() const override;

            NodeList nodes_;
        };

        class Visitor
        {
        public:
            VISIT_NODE(CharNode) = 0;
            VISIT_NODE(DotNode) = 0;
            VISIT_NODE(GroupNode) = 0;

            virtual ~Visitor() { }
        };

        // Parse regex to a sequence of nodes, throw ParseException
        // when regex is invalid.
        NodeList Parse(const std::string &re);
        NodeList Parse(const int *begin, const int *end);

        NodeList CloneNodes(const NodeList &nodes);

        // Structural equality of two node sequences
        bool IsSameTree(const NodeList &left, const NodeList &right);

        // Text form of nodes, e.g. "Char('a'){1} Group(Dot{*}){?}"
        std::string Dump(const NodeList &nodes);
    } // namespace parser
} // namespace retrace

#endif // RETRACE_PARSER_H
