#include <gtest/gtest.h>
#include "graph/obligation_graph.hpp"
#include "scc/scc_detector.hpp"

#include <algorithm>
#include <set>
#include <string>

using namespace netclear;

namespace {

std::set<std::string> names(const ObligationGraph& g, const Scc& scc) {
    std::set<std::string> out;
    for (PartyId p : scc) out.insert(g.partyName(p));
    return out;
}

} // namespace

TEST(SccTest, AcyclicGraphHasNoComponents) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 1);
    g.addEdge("B", "C", "ETH", 1);
    g.addEdge("A", "C", "ETH", 1);

    SccDetector detector;
    EXPECT_TRUE(detector.detect(g).empty());
    EXPECT_EQ(detector.detectAll(g).size(), 3);
}

TEST(SccTest, TwoSeparateComponents) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 100);
    g.addEdge("B", "C", "ETH", 50);
    g.addEdge("C", "A", "ETH", 30);
    g.addEdge("D", "E", "USDC", 200);
    g.addEdge("E", "D", "USDC", 200);
    g.addEdge("C", "D", "ETH", 5);  // bridge, one way

    SccDetector detector;
    auto sccs = detector.detect(g);
    ASSERT_EQ(sccs.size(), 2);

    std::set<std::set<std::string>> found;
    for (const auto& scc : sccs) found.insert(names(g, scc));
    EXPECT_TRUE(found.count({"A", "B", "C"}));
    EXPECT_TRUE(found.count({"D", "E"}));
}

TEST(SccTest, SelfLoopIsNotReturned) {
    ObligationGraph g;
    g.addEdge("A", "A", "ETH", 5);
    g.addEdge("A", "B", "ETH", 5);

    SccDetector detector;
    EXPECT_TRUE(detector.detect(g).empty());
}

TEST(SccTest, TokensDoNotMatterForConnectivity) {
    ObligationGraph g;
    g.addEdge("A", "B", "ETH", 5);
    g.addEdge("B", "A", "USDC", 5);

    SccDetector detector;
    auto sccs = detector.detect(g);
    ASSERT_EQ(sccs.size(), 1);
    EXPECT_EQ(names(g, sccs[0]), (std::set<std::string>{"A", "B"}));
}

TEST(SccTest, EveryPartyInExactlyOneComponent) {
    ObligationGraph g;
    g.addEdge("A", "B", "T", 1);
    g.addEdge("B", "C", "T", 1);
    g.addEdge("C", "B", "T", 1);
    g.addEdge("C", "D", "T", 1);
    g.addEdge("D", "E", "T", 1);
    g.addEdge("E", "D", "T", 1);
    g.addEdge("E", "F", "T", 1);

    SccDetector detector;
    auto all = detector.detectAll(g);
    size_t total = 0;
    std::set<PartyId> seen;
    for (const auto& scc : all) {
        total += scc.size();
        seen.insert(scc.begin(), scc.end());
    }
    EXPECT_EQ(total, g.partyCount());
    EXPECT_EQ(seen.size(), g.partyCount());
    EXPECT_EQ(detector.detect(g).size(), 2);
}

TEST(SccTest, DeepRingDoesNotRecurse) {
    // A single 200k-party ring would overflow a recursive traversal.
    const int n = 200000;
    ObligationGraph g;
    for (int i = 0; i < n; i++) {
        g.addEdge("p" + std::to_string(i), "p" + std::to_string((i + 1) % n), "ETH", 1);
    }

    SccDetector detector;
    auto sccs = detector.detect(g);
    ASSERT_EQ(sccs.size(), 1);
    EXPECT_EQ(sccs[0].size(), static_cast<size_t>(n));
}

TEST(SccTest, DeepChainYieldsOnlySingletons) {
    const int n = 200000;
    ObligationGraph g;
    for (int i = 0; i + 1 < n; i++) {
        g.addEdge("p" + std::to_string(i), "p" + std::to_string(i + 1), "ETH", 1);
    }

    SccDetector detector;
    EXPECT_TRUE(detector.detect(g).empty());
    EXPECT_EQ(detector.detectAll(g).size(), static_cast<size_t>(n));
}
