#pragma once
#ifndef HUFFCPP_CODETREE_HPP
#define HUFFCPP_CODETREE_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <variant>
#include "FrequencyTable.hpp"

namespace huffcpp::algorithms
{
    struct HuffNode;

    struct HuffLeaf
    {
        int symbol;
        uint64_t weight;
    };

    struct HuffInternal
    {
        uint64_t weight;
        std::unique_ptr<HuffNode> left;
        std::unique_ptr<HuffNode> right;
    };

    /* A node owns its children exclusively; nodes never change once built. */
    struct HuffNode
    {
        std::variant<HuffLeaf, HuffInternal> data;

        static std::unique_ptr<HuffNode> makeLeaf(int symbol, uint64_t weight);
        static std::unique_ptr<HuffNode> makeInternal(
            std::unique_ptr<HuffNode> left,
            std::unique_ptr<HuffNode> right
        );

        bool isLeaf() const;
        int symbol() const;
        uint64_t weight() const;
        const HuffNode& left() const;
        const HuffNode& right() const;
    };

    class CodeTree
    {
      private:
        std::unique_ptr<HuffNode> rootNode;

      public:
        explicit CodeTree(std::unique_ptr<HuffNode> root);

        CodeTree(CodeTree&&) = default;
        CodeTree& operator=(CodeTree&&) = default;
        CodeTree(const CodeTree&) = delete;
        CodeTree& operator=(const CodeTree&) = delete;

        /* Greedy merge of the two lightest nodes. Equal weights are taken in
           insertion order: leaves by ascending symbol, the pseudo-EOF last,
           then merged nodes in the order they were created. The node taken
           first becomes the left child. */
        static CodeTree build(const FrequencyCounts& counts);

        const HuffNode& root() const;
        size_t leafCount() const;
        // longest root-to-leaf path, in edges
        size_t depth() const;
        bool containsSymbol(int symbol) const;
    };
}

#endif // HUFFCPP_CODETREE_HPP
