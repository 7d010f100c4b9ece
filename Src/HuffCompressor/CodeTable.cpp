#include "CodeTable.hpp"
#include <iostream>
#include <stdexcept>

namespace
{
    using huffcpp::algorithms::CodePath;
    using huffcpp::algorithms::HuffNode;

    void collectCodes(
        const HuffNode& node,
        CodePath& path,
        std::vector<std::optional<CodePath>>& codes
    ) {
        if (node.isLeaf()) {
            codes[static_cast<size_t>(node.symbol())] = path;
            return;
        }

        path.push_back(false);
        collectCodes(node.left(), path, codes);
        path.pop_back();

        path.push_back(true);
        collectCodes(node.right(), path, codes);
        path.pop_back();
    }
}

huffcpp::algorithms::CodeTable::CodeTable()
    : codes(SYMBOL_SPACE_SIZE)
{}

huffcpp::algorithms::CodeTable huffcpp::algorithms::CodeTable::derive(const CodeTree& tree)
{
    CodeTable table;
    CodePath path;
    collectCodes(tree.root(), path, table.codes);
    return table;
}

bool huffcpp::algorithms::CodeTable::contains(int symbol) const
{
    if (symbol < 0 || static_cast<size_t>(symbol) >= codes.size()) return false;
    return codes[static_cast<size_t>(symbol)].has_value();
}

const huffcpp::algorithms::CodePath& huffcpp::algorithms::CodeTable::codeFor(int symbol) const
{
    if (!contains(symbol))
        throw std::out_of_range("No code for symbol " + std::to_string(symbol));
    return codes[static_cast<size_t>(symbol)].value();
}

std::string huffcpp::algorithms::CodeTable::codeString(int symbol) const
{
    const CodePath& path = codeFor(symbol);
    std::string bits;
    bits.reserve(path.size());
    for (size_t i = 0; i < path.size(); ++i) {
        bits.push_back(path[i] ? '1' : '0');
    }
    return bits;
}

size_t huffcpp::algorithms::CodeTable::size() const
{
    size_t count = 0;
    for (const auto& code : codes) {
        if (code.has_value()) ++count;
    }
    return count;
}

void huffcpp::algorithms::printCodeTable(const CodeTable& table)
{
    std::cout << "Code table:" << std::endl;
    for (int symbol = 0; symbol < static_cast<int>(SYMBOL_SPACE_SIZE); ++symbol) {
        if (!table.contains(symbol)) continue;
        std::cout << "Symbol " << symbol << (symbol == PSEUDO_EOF ? " <EOF>" : "")
                  << ": " << table.codeString(symbol) << std::endl;
    }
    std::cout << std::endl;
}
