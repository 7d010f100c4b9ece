#include "HeaderCodec.hpp"
#include <string>

namespace
{
    using huffcpp::algorithms::HuffNode;
    using huffcpp::bitstream::IBitInputStream;
    using huffcpp::bitstream::IBitOutputStream;

    void writeNode(const HuffNode& node, IBitOutputStream& output)
    {
        if (node.isLeaf()) {
            output.writeBits(1, 1);
            output.writeBits(huffcpp::LEAF_VALUE_BITS, static_cast<uint32_t>(node.symbol()));
            return;
        }
        output.writeBits(1, 0);
        writeNode(node.left(), output);
        writeNode(node.right(), output);
    }

    // Returns nullptr and fills errorMessage when the header is unusable.
    std::unique_ptr<HuffNode> readNode(
        IBitInputStream& input,
        size_t depth,
        std::string& errorMessage
    ) {
        const int64_t tag = input.readBits(1);
        if (tag == -1) {
            errorMessage = "Header ended after " + std::to_string(input.bitsRead()) + " bits";
            return nullptr;
        }

        if (tag == 1)
        {
            const int64_t value = input.readBits(huffcpp::LEAF_VALUE_BITS);
            if (value == -1) {
                errorMessage = "Header ended inside a leaf value";
                return nullptr;
            }
            if (value > huffcpp::PSEUDO_EOF) {
                errorMessage = "Illegal leaf value " + std::to_string(value) + " in header";
                return nullptr;
            }
            return HuffNode::makeLeaf(static_cast<int>(value), 0);
        }

        if (depth >= huffcpp::MAX_TREE_DEPTH) {
            errorMessage = "Header tree exceeds maximum depth of " + std::to_string(huffcpp::MAX_TREE_DEPTH);
            return nullptr;
        }

        std::unique_ptr<HuffNode> left = readNode(input, depth + 1, errorMessage);
        if (!left) return nullptr;
        std::unique_ptr<HuffNode> right = readNode(input, depth + 1, errorMessage);
        if (!right) return nullptr;

        return HuffNode::makeInternal(std::move(left), std::move(right));
    }
}

void huffcpp::algorithms::HeaderCodec::write(
    const CodeTree& tree,
    bitstream::IBitOutputStream& output
) {
    writeNode(tree.root(), output);
}

Result<huffcpp::algorithms::CodeTree> huffcpp::algorithms::HeaderCodec::read(
    bitstream::IBitInputStream& input
) {
    std::string errorMessage;
    std::unique_ptr<HuffNode> root = readNode(input, 0, errorMessage);
    if (!root) {
        return makeError<CodeTree>(ErrorCode::MalformedHeader, errorMessage);
    }

    CodeTree tree(std::move(root));
    if (!tree.containsSymbol(PSEUDO_EOF)) {
        return makeError<CodeTree>(ErrorCode::MalformedHeader, "Header tree has no end-of-stream leaf");
    }
    return makeResult<CodeTree>(std::move(tree));
}
