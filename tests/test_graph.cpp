#include <gtest/gtest.h>
#include "graph/obligation_graph.hpp"

#include <limits>
#include <stdexcept>

using namespace netclear;

// ─── Parties ───────────────────────────────────────────────────

TEST(GraphTest, AddPartyIsIdempotent) {
    ObligationGraph g;
    PartyId a = g.addParty("alice");
    PartyId b = g.addParty("bob");
    EXPECT_NE(a, b);
    EXPECT_EQ(g.addParty("alice"), a);
    EXPECT_EQ(g.partyCount(), 2);
    EXPECT_EQ(g.partyName(b), "bob");
}

TEST(GraphTest, FindPartyMissing) {
    ObligationGraph g;
    g.addParty("alice");
    EXPECT_TRUE(g.findParty("alice").has_value());
    EXPECT_FALSE(g.findParty("carol").has_value());
    EXPECT_THROW(g.partyName(7), std::out_of_range);
}

TEST(GraphTest, DestinationOnlyPartyIsVertex) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 10);
    ASSERT_EQ(g.partyCount(), 2);
    PartyId b = *g.findParty("B");
    EXPECT_TRUE(g.outgoing(b).empty());
}

// ─── Edges ─────────────────────────────────────────────────────

TEST(GraphTest, DuplicateEdgeMerges) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 40);
    g.addEdge("A", "B", "ETH", 2);
    EXPECT_EQ(g.edgeCount(), 1);

    PartyId a = *g.findParty("A");
    PartyId b = *g.findParty("B");
    const Edge* e = g.findEdge(a, b, "ETH");
    ASSERT_NE(e, nullptr);
    EXPECT_EQ(e->amount, 42u);
}

TEST(GraphTest, DifferentTokensAreSeparateEdges) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 1);
    g.addEdge("A", "B", "USDC", 2);
    EXPECT_EQ(g.edgeCount(), 2);

    PartyId a = *g.findParty("A");
    ASSERT_EQ(g.outgoing(a).size(), 2);
    EXPECT_EQ(g.outgoing(a)[0].token, "ETH");
    EXPECT_EQ(g.outgoing(a)[1].token, "USDC");
}

TEST(GraphTest, ZeroAmountInsertKeepsRecord) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 0);
    EXPECT_EQ(g.edgeCount(), 1);
    EXPECT_EQ(g.liveEdgeCount(), 0);
    EXPECT_TRUE(g.toIntents().empty());
}

TEST(GraphTest, MergeOverflowThrows) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", std::numeric_limits<uint64_t>::max());
    EXPECT_THROW(g.addEdge("A", "B", "ETH", 1), std::overflow_error);

    PartyId a = *g.findParty("A");
    PartyId b = *g.findParty("B");
    EXPECT_EQ(g.findEdge(a, b, "ETH")->amount, std::numeric_limits<uint64_t>::max());
}

TEST(GraphTest, FindEdgeWrongToken) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 5);
    PartyId a = *g.findParty("A");
    PartyId b = *g.findParty("B");
    EXPECT_EQ(g.findEdge(a, b, "USDC"), nullptr);
    EXPECT_EQ(g.findEdge(b, a, "ETH"), nullptr);
}

TEST(GraphTest, GrossAmount) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 5);
    g.addEdge("B", "C", "USDC", 7);
    EXPECT_EQ(g.grossAmount(), 12u);
}

TEST(GraphTest, GrossAmountSaturates) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", std::numeric_limits<uint64_t>::max() - 1);
    g.addEdge("C", "D", "ETH", 2);
    EXPECT_EQ(g.grossAmount(), std::numeric_limits<uint64_t>::max());
}

// ─── Extraction ────────────────────────────────────────────────

TEST(GraphTest, ToIntentsDropsZeroEdgesInInsertionOrder) {
    std::vector<Intent> input = {
        {"A", "B", "ETH", 100},
        {"B", "C", "ETH", 0},
        {"A", "C", "USDC", 3},
        {"C", "A", "ETH", 9},
    };
    ObligationGraph g = ObligationGraph::fromIntents(input);
    std::vector<Intent> out = g.toIntents();

    ASSERT_EQ(out.size(), 3);
    EXPECT_EQ(out[0], Intent("A", "B", "ETH", 100));
    EXPECT_EQ(out[1], Intent("A", "C", "USDC", 3));
    EXPECT_EQ(out[2], Intent("C", "A", "ETH", 9));
}

TEST(GraphTest, ForEachEdgeVisitsZeroRecords) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 0);
    g.addEdge("B", "A", "ETH", 1);
    int count = 0;
    g.forEachEdge([&](PartyId, const Edge&) { count++; });
    EXPECT_EQ(count, 2);
}
