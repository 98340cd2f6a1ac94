#include "RetraceMatcher.h"
#include "RetraceUtf8.h"
#include <vector>

namespace retrace
{
    using namespace parser;

    namespace
    {
        // Result of matching one node once at the current position
        struct Step
        {
            const int *current_;
            const int *end_;
            bool matched_;
            std::size_t consumed_;

            Step(const int *current, const int *end)
                : current_(current), end_(end),
                  matched_(false), consumed_(0)
            {
            }
        };

        class StepVisitor : public Visitor
        {
        public:
            // 'data' is Step
            VISIT_NODE(CharNode)
            {
                auto step = static_cast<Step *>(data);
                if (step->current_ != step->end_ && *step->current_ == n->c_)
                {
                    step->matched_ = true;
                    step->consumed_ = 1;
                }
            }

            VISIT_NODE(DotNode)
            {
                auto step = static_cast<Step *>(data);
                if (step->current_ != step->end_)
                {
                    step->matched_ = true;
                    step->consumed_ = 1;
                }
            }

            VISIT_NODE(GroupNode)
            {
                auto step = static_cast<Step *>(data);
                auto state = Evaluate(n->nodes_, step->current_, step->end_);
                if (state.matched_)
                {
                    step->matched_ = true;
                    step->consumed_ = state.end_;
                }
            }
        };

        enum class FrameKind
        {
            // Consumption can only be undone as a whole
            Fixed,
            // Matched zero-or-one node, retry with the empty match
            Optional,
            // Repetitions of zero-or-more node, retry with one less
            Repeat,
        };

        struct Frame
        {
            FrameKind kind_;
            const ASTNode *node_;
            std::vector<std::size_t> consumptions_;

            Frame(FrameKind kind, const ASTNode *node)
                : kind_(kind), node_(node)
            {
            }

            Frame(FrameKind kind, const ASTNode *node, std::size_t consumed)
                : kind_(kind), node_(node), consumptions_(1, consumed)
            {
            }
        };

        class Backtracker
        {
        public:
            Backtracker(const NodeList &nodes, const int *begin, const int *end)
                : begin_(begin), end_(end), pos_(0), current_node_(nullptr)
            {
                // Back of pending_ is the next node
                pending_.reserve(nodes.size());
                for (auto it = nodes.rbegin(); it != nodes.rend(); ++it)
                    pending_.push_back(it->get());
            }

            Backtracker(const Backtracker &) = delete;
            void operator = (const Backtracker &) = delete;

            MatchState Run();

        private:
            bool AtEnd() const
            {
                return begin_ + pos_ == end_;
            }

            const ASTNode * PopPending()
            {
                if (pending_.empty())
                    return nullptr;

                auto node = pending_.back();
                pending_.pop_back();
                return node;
            }

            Step MatchOnce(const ASTNode *node)
            {
                Step step(begin_ + pos_, end_);
                node->Accept(&step_visitor_, &step);
                return step;
            }

            void MatchExactlyOne();
            void MatchZeroOrOne();
            void MatchZeroOrMore();

            // Undo consumption until a frame can be retried, return false
            // when no frame can be retried.
            bool Backtrack();

            const int *begin_;
            const int *end_;
            std::size_t pos_;

            const ASTNode *current_node_;
            std::vector<const ASTNode *> pending_;
            std::vector<Frame> frames_;

            StepVisitor step_visitor_;
            bool failed_ = false;
            std::size_t failed_pos_ = 0;
        };

        MatchState Backtracker::Run()
        {
            current_node_ = PopPending();

            while (current_node_)
            {
                switch (current_node_->quantifier_)
                {
                case Quantifier::ExactlyOne:
                    MatchExactlyOne();
                    if (failed_)
                        return MatchState(false, failed_pos_);
                    break;
                case Quantifier::ZeroOrOne:
                    MatchZeroOrOne();
                    break;
                case Quantifier::ZeroOrMore:
                    MatchZeroOrMore();
                    break;
                }
            }

            return MatchState(true, pos_);
        }

        void Backtracker::MatchExactlyOne()
        {
            auto step = MatchOnce(current_node_);
            if (!step.matched_)
            {
                auto pos = pos_;
                if (!Backtrack())
                {
                    failed_ = true;
                    failed_pos_ = pos;
                }
                return;
            }

            frames_.push_back(Frame(FrameKind::Fixed, current_node_, step.consumed_));
            pos_ += step.consumed_;
            current_node_ = PopPending();
        }

        void Backtracker::MatchZeroOrOne()
        {
            std::size_t consumed = 0;
            if (!AtEnd())
            {
                auto step = MatchOnce(current_node_);
                if (step.matched_)
                    consumed = step.consumed_;
            }

            auto kind = consumed > 0 ? FrameKind::Optional : FrameKind::Fixed;
            frames_.push_back(Frame(kind, current_node_, consumed));
            pos_ += consumed;
            current_node_ = PopPending();
        }

        void Backtracker::MatchZeroOrMore()
        {
            Frame frame(FrameKind::Repeat, current_node_);

            while (!AtEnd())
            {
                auto step = MatchOnce(current_node_);
                if (!step.matched_ || step.consumed_ == 0)
                    break;

                frame.consumptions_.push_back(step.consumed_);
                pos_ += step.consumed_;
            }

            if (frame.consumptions_.empty())
            {
                frame.kind_ = FrameKind::Fixed;
                frame.consumptions_.push_back(0);
            }

            frames_.push_back(std::move(frame));
            current_node_ = PopPending();
        }

        bool Backtracker::Backtrack()
        {
            pending_.push_back(current_node_);

            while (!frames_.empty())
            {
                Frame frame = std::move(frames_.back());
                frames_.pop_back();

                if (frame.kind_ == FrameKind::Fixed)
                {
                    for (auto it = frame.consumptions_.begin();
                         it != frame.consumptions_.end(); ++it)
                        pos_ -= *it;
                    pending_.push_back(frame.node_);
                    continue;
                }

                if (frame.consumptions_.empty())
                {
                    // Nothing left to give back, match the node again
                    pending_.push_back(frame.node_);
                    continue;
                }

                // Give back the last consumption and resume after this frame
                pos_ -= frame.consumptions_.back();
                frame.consumptions_.pop_back();
                frames_.push_back(std::move(frame));

                current_node_ = PopPending();
                return true;
            }

            return false;
        }
    } // namespace

    MatchState Evaluate(const NodeList &nodes, const int *begin, const int *end)
    {
        Backtracker backtracker(nodes, begin, end);
        return backtracker.Run();
    }

    RegexMatcher::RegexMatcher(const Regex &regex)
        : nodes_(&regex.GetNodes())
    {
    }

    RegexMatcher::RegexMatcher(const NodeList *nodes)
        : nodes_(nodes)
    {
    }

    bool RegexMatcher::IsMatch(const int *begin, const int *end) const
    {
        std::size_t length = 0;
        auto match = MatchPrefix(begin, end, &length);
        return match && begin + length == end;
    }

    bool RegexMatcher::IsMatch(const std::string &str) const
    {
        auto elements = utf8::Decode(str);
        return IsMatch(elements.data(), elements.data() + elements.size());
    }

    bool RegexMatcher::MatchPrefix(const int *begin, const int *end,
                                   std::size_t *length) const
    {
        auto state = Evaluate(*nodes_, begin, end);
        if (state.matched_ && length)
            *length = state.end_;
        return state.matched_;
    }

    bool RegexMatcher::MatchPrefix(const std::string &str, std::size_t *length) const
    {
        auto elements = utf8::Decode(str);
        return MatchPrefix(elements.data(), elements.data() + elements.size(), length);
    }
} // namespace retrace
