#include <gtest/gtest.h>
#include <string>
#include "../../Src/HuffCompressor/CodeTable.hpp"
#include "../../Src/HuffCompressor/HeaderCodec.hpp"
#include "helpers/MockBitStreams.hpp"

using namespace huffcpp;
using namespace huffcpp::algorithms;

class HeaderCodecTest : public ::testing::Test
{
protected:
    static FrequencyCounts scenarioCounts()
    {
        FrequencyCounts counts{};
        counts[0x41] = 3;
        counts[0x42] = 1;
        counts[PSEUDO_EOF] = 1;
        return counts;
    }

    static std::string leafBits(int symbol)
    {
        std::string bits = "1";
        for (int i = LEAF_VALUE_BITS - 1; i >= 0; --i) {
            bits.push_back(((symbol >> i) & 1) ? '1' : '0');
        }
        return bits;
    }

    static void expectSameCodes(const CodeTree& expected, const CodeTree& actual)
    {
        const CodeTable expectedTable = CodeTable::derive(expected);
        const CodeTable actualTable = CodeTable::derive(actual);
        ASSERT_EQ(expectedTable.size(), actualTable.size());
        for (int symbol = 0; symbol < static_cast<int>(SYMBOL_SPACE_SIZE); ++symbol) {
            ASSERT_EQ(expectedTable.contains(symbol), actualTable.contains(symbol)) << "symbol " << symbol;
            if (expectedTable.contains(symbol)) {
                EXPECT_EQ(expectedTable.codeFor(symbol), actualTable.codeFor(symbol)) << "symbol " << symbol;
            }
        }
    }
};

TEST_F(HeaderCodecTest, Write_PreorderLayout)
{
    CodeTree tree = CodeTree::build(scenarioCounts());
    MockBitOutputStream output;
    HeaderCodec::write(tree, output);

    const std::string expected = "0" "0" + leafBits(0x42) + leafBits(PSEUDO_EOF) + leafBits(0x41);
    EXPECT_EQ(output.bitString(), expected);
    EXPECT_EQ(output.bitsWritten(), 32u);
}

TEST_F(HeaderCodecTest, Read_RebuildsSameCodes)
{
    CodeTree tree = CodeTree::build(scenarioCounts());
    MockBitOutputStream output;
    HeaderCodec::write(tree, output);

    MockBitInputStream input(output.getBits());
    Result<CodeTree> result = HeaderCodec::read(input);
    ASSERT_TRUE(result.success()) << result.getError();

    expectSameCodes(tree, result.getValue());
    EXPECT_EQ(input.remaining(), 0u);
}

TEST_F(HeaderCodecTest, Read_RebuildsFullAlphabetTree)
{
    FrequencyCounts counts{};
    for (int symbol = 0; symbol < ALPH_SIZE; ++symbol) counts[symbol] = 1 + (symbol * 7) % 31;
    counts[PSEUDO_EOF] = 1;
    CodeTree tree = CodeTree::build(counts);

    MockBitOutputStream output;
    HeaderCodec::write(tree, output);
    // one tag bit per node, 9 value bits per leaf
    EXPECT_EQ(output.bitsWritten(), (2 * SYMBOL_SPACE_SIZE - 1) + LEAF_VALUE_BITS * SYMBOL_SPACE_SIZE);

    MockBitInputStream input(output.getBits());
    Result<CodeTree> result = HeaderCodec::read(input);
    ASSERT_TRUE(result.success()) << result.getError();
    expectSameCodes(tree, result.getValue());
}

TEST_F(HeaderCodecTest, Read_LonePseudoEofLeaf)
{
    MockBitInputStream input = MockBitInputStream::fromString(leafBits(PSEUDO_EOF));
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_TRUE(result.success()) << result.getError();
    EXPECT_TRUE(result.getValue().root().isLeaf());
    EXPECT_EQ(result.getValue().root().symbol(), PSEUDO_EOF);
}

TEST_F(HeaderCodecTest, Read_NoBitsIsMalformedHeader)
{
    MockBitInputStream input = MockBitInputStream::fromString("");
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
}

TEST_F(HeaderCodecTest, Read_TruncatedLeafValueIsMalformedHeader)
{
    MockBitInputStream input = MockBitInputStream::fromString("0 1 0010");
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
}

TEST_F(HeaderCodecTest, Read_MissingRightSubtreeIsMalformedHeader)
{
    MockBitInputStream input = MockBitInputStream::fromString("0" + leafBits(PSEUDO_EOF));
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
}

TEST_F(HeaderCodecTest, Read_LeafValueOutOfRangeIsMalformedHeader)
{
    MockBitInputStream input = MockBitInputStream::fromString("0" + leafBits(300) + leafBits(PSEUDO_EOF));
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
    EXPECT_NE(result.getError().find("300"), std::string::npos);
}

TEST_F(HeaderCodecTest, Read_TreeWithoutPseudoEofIsMalformedHeader)
{
    MockBitInputStream twoLeaves = MockBitInputStream::fromString("0" + leafBits(0x41) + leafBits(0x42));
    Result<CodeTree> result = HeaderCodec::read(twoLeaves);
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);

    MockBitInputStream loneLeaf = MockBitInputStream::fromString(leafBits(0x41));
    result = HeaderCodec::read(loneLeaf);
    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
}

TEST_F(HeaderCodecTest, Read_ExcessiveNestingIsMalformedHeader)
{
    MockBitInputStream input = MockBitInputStream::fromString(std::string(1000, '0'));
    Result<CodeTree> result = HeaderCodec::read(input);

    ASSERT_FALSE(result.success());
    EXPECT_EQ(result.getErrorCode(), ErrorCode::MalformedHeader);
    EXPECT_NE(result.getError().find("depth"), std::string::npos);
}
