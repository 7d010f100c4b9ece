#pragma once
#ifndef HUFFCPP_CODETABLE_HPP
#define HUFFCPP_CODETABLE_HPP

#include <optional>
#include <string>
#include <vector>
#include <boost/dynamic_bitset.hpp>
#include "CodeTree.hpp"

namespace huffcpp::algorithms
{
    // Bit i is the i-th step from the root: 0 = left, 1 = right.
    using CodePath = boost::dynamic_bitset<>;

    class CodeTable
    {
      private:
        std::vector<std::optional<CodePath>> codes;

        CodeTable();

      public:
        static CodeTable derive(const CodeTree& tree);

        bool contains(int symbol) const;
        const CodePath& codeFor(int symbol) const;
        std::string codeString(int symbol) const;
        // number of symbols with a code
        size_t size() const;
    };

    void printCodeTable(const CodeTable& table);
}

#endif // HUFFCPP_CODETABLE_HPP
