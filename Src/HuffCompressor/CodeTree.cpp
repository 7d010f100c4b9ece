#include "CodeTree.hpp"
#include <algorithm>
#include <stdexcept>
#include <vector>

namespace huffcpp::algorithms
{
    std::unique_ptr<HuffNode> HuffNode::makeLeaf(int symbol, uint64_t weight)
    {
        auto node = std::make_unique<HuffNode>();
        node->data = HuffLeaf{symbol, weight};
        return node;
    }

    std::unique_ptr<HuffNode> HuffNode::makeInternal(
        std::unique_ptr<HuffNode> left,
        std::unique_ptr<HuffNode> right
    ) {
        if (!left || !right)
            throw std::invalid_argument("Internal node requires two children");

        const uint64_t weight = left->weight() + right->weight();
        auto node = std::make_unique<HuffNode>();
        node->data = HuffInternal{weight, std::move(left), std::move(right)};
        return node;
    }

    bool HuffNode::isLeaf() const
    {
        return std::holds_alternative<HuffLeaf>(data);
    }

    int HuffNode::symbol() const
    {
        if (!isLeaf())
            throw std::runtime_error("Internal node has no symbol");
        return std::get<HuffLeaf>(data).symbol;
    }

    uint64_t HuffNode::weight() const
    {
        return std::visit([](const auto& node) { return node.weight; }, data);
    }

    const HuffNode& HuffNode::left() const
    {
        if (isLeaf())
            throw std::runtime_error("Leaf node has no children");
        return *std::get<HuffInternal>(data).left;
    }

    const HuffNode& HuffNode::right() const
    {
        if (isLeaf())
            throw std::runtime_error("Leaf node has no children");
        return *std::get<HuffInternal>(data).right;
    }

    // ========== CodeTree ==========

    CodeTree::CodeTree(std::unique_ptr<HuffNode> root)
        : rootNode(std::move(root))
    {
        if (!rootNode)
            throw std::invalid_argument("CodeTree requires a root node");
    }

    namespace
    {
        struct MergeEntry
        {
            uint64_t weight;
            uint64_t order;
            std::unique_ptr<HuffNode> node;
        };

        struct MergeCompare
        {
            bool operator()(const MergeEntry& l, const MergeEntry& r) const
            {
                if (l.weight != r.weight) return l.weight > r.weight; // min-heap
                return l.order > r.order;
            }
        };

        class MergeQueue
        {
          private:
            std::vector<MergeEntry> heap;
            uint64_t nextOrder = 0;

          public:
            void push(std::unique_ptr<HuffNode> node)
            {
                const uint64_t weight = node->weight();
                heap.push_back(MergeEntry{weight, nextOrder++, std::move(node)});
                std::push_heap(heap.begin(), heap.end(), MergeCompare{});
            }

            std::unique_ptr<HuffNode> pop()
            {
                std::pop_heap(heap.begin(), heap.end(), MergeCompare{});
                std::unique_ptr<HuffNode> node = std::move(heap.back().node);
                heap.pop_back();
                return node;
            }

            size_t size() const { return heap.size(); }
        };

        size_t countLeaves(const HuffNode& node)
        {
            if (node.isLeaf()) return 1;
            return countLeaves(node.left()) + countLeaves(node.right());
        }

        size_t measureDepth(const HuffNode& node)
        {
            if (node.isLeaf()) return 0;
            return 1 + std::max(measureDepth(node.left()), measureDepth(node.right()));
        }

        bool findSymbol(const HuffNode& node, int symbol)
        {
            if (node.isLeaf()) return node.symbol() == symbol;
            return findSymbol(node.left(), symbol) || findSymbol(node.right(), symbol);
        }
    }

    CodeTree CodeTree::build(const FrequencyCounts& counts)
    {
        MergeQueue queue;

        for (int symbol = 0; symbol < ALPH_SIZE; ++symbol)
        {
            if (counts[symbol] > 0) {
                queue.push(HuffNode::makeLeaf(symbol, counts[symbol]));
            }
        }
        const uint64_t eofWeight = counts[PSEUDO_EOF] > 0 ? counts[PSEUDO_EOF] : 1;
        queue.push(HuffNode::makeLeaf(PSEUDO_EOF, eofWeight));

        while (queue.size() > 1)
        {
            std::unique_ptr<HuffNode> left = queue.pop();
            std::unique_ptr<HuffNode> right = queue.pop();
            queue.push(HuffNode::makeInternal(std::move(left), std::move(right)));
        }

        return CodeTree(queue.pop());
    }

    const HuffNode& CodeTree::root() const
    {
        return *rootNode;
    }

    size_t CodeTree::leafCount() const
    {
        return countLeaves(*rootNode);
    }

    size_t CodeTree::depth() const
    {
        return measureDepth(*rootNode);
    }

    bool CodeTree::containsSymbol(int symbol) const
    {
        return findSymbol(*rootNode, symbol);
    }
}
