#include "gtest/gtest.h"
#include <relgraph/graph/view/node_style.h>

using namespace relgraph::graph;

TEST(NodeStyleTest, PersonsAreCirclesOthersSquares) {
    NodeStyle person = StyleFor(NodeType::kPerson);
    EXPECT_EQ(person.shape, NodeShape::kCircle);
    EXPECT_FLOAT_EQ(person.extent, 20.0f);
    EXPECT_EQ(person.rgb, 0x60a5fau);

    for (NodeType type : {NodeType::kCompany, NodeType::kSocialMedia, NodeType::kWebsite,
                          NodeType::kOrganization, NodeType::kOther}) {
        NodeStyle style = StyleFor(type);
        EXPECT_EQ(style.shape, NodeShape::kRoundedSquare);
        EXPECT_FLOAT_EQ(style.extent, 35.0f);
    }
}

TEST(NodeStyleTest, TypeColors) {
    EXPECT_EQ(StyleFor(NodeType::kCompany).rgb, 0x34d399u);
    EXPECT_EQ(StyleFor(NodeType::kSocialMedia).rgb, 0xf87171u);
    EXPECT_EQ(StyleFor(NodeType::kWebsite).rgb, 0xa78bfau);
    EXPECT_EQ(StyleFor(NodeType::kOrganization).rgb, 0xfbbf24u);
    EXPECT_EQ(StyleFor(NodeType::kOther).rgb, 0x9ca3afu);
    EXPECT_EQ(StyleFor(ParseNodeType("vehicle")).rgb, 0x9ca3afu);
}

TEST(NodeStyleTest, HitTestFollowsShape) {
    ImVec2 center(100, 100);

    EXPECT_TRUE(HitTest(NodeType::kPerson, center, ImVec2(100, 119)));
    EXPECT_FALSE(HitTest(NodeType::kPerson, center, ImVec2(116, 116)));   // Outside the circle, inside its box

    EXPECT_TRUE(HitTest(NodeType::kCompany, center, ImVec2(117, 117)));
    EXPECT_FALSE(HitTest(NodeType::kCompany, center, ImVec2(118, 100)));
}

TEST(NodeStyleTest, LabelTruncation) {
    EXPECT_EQ(TruncateLabel("Short name"), "Short name");
    EXPECT_EQ(TruncateLabel("Exactly15Chars!"), "Exactly15Chars!");
    EXPECT_EQ(TruncateLabel("Sixteen chars!!!"), "Sixteen char...");
    EXPECT_EQ(TruncateLabel(""), "");
}
