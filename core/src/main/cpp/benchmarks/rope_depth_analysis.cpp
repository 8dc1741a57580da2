/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 * 
 * Analyze rope depth and structure under different insert patterns
 */

#include <gtest/gtest.h>
#include <cmath>
#include <iomanip>
#include <random>
#include "../src/rope.h"
#include "../src/rope.hpp"
#include "../src/util.h"

using namespace ropelist;

typedef Rope<int64_t> IntRope;

class RopeDepthAnalysis : public ::testing::Test {
protected:
    enum Pattern { SEQUENTIAL, FRONT, RANDOM };

    static const char* patternName(Pattern p) {
        switch (p) {
            case SEQUENTIAL: return "sequential";
            case FRONT: return "front";
            default: return "random";
        }
    }

    static IntRope build(Pattern pattern, size_t n, bool autoRebalance, const RopeConfig& cfg) {
        IntRope r(cfg);
        r.setAutoRebalance(autoRebalance);
        std::mt19937 gen(42);
        for (size_t i = 0; i < n; i++) {
            size_t off;
            switch (pattern) {
                case SEQUENTIAL: off = r.length(); break;
                case FRONT: off = 0; break;
                default: off = std::uniform_int_distribution<size_t>(0, r.length())(gen); break;
            }
            r = r.insert(off, (int64_t)i);
        }
        return r;
    }

    // deepest tree the heuristic lets through at this length
    static size_t heuristicCeiling(const IntRope& r) {
        const RopeConfig& cfg = r.config();
        size_t nBlocks = r.length() / r.blockCapacity();
        double bound = nBlocks > 1 ? std::log2((double)nBlocks) * cfg.rebalance_depth_factor : 0.0;
        return std::max<size_t>(cfg.rebalance_min_depth, (size_t)bound) + 1;
    }
};

TEST_F(RopeDepthAnalysis, AnalyzeRopeDepth) {
    std::cout << "\n=== Rope Depth and Block Count Analysis ===\n";

    struct TestCase {
        Pattern pattern;
        size_t numItems;
        size_t leafBytes;
    };

    std::vector<TestCase> testCases = {
        {SEQUENTIAL, 10000, 1024},
        {FRONT, 10000, 1024},
        {RANDOM, 10000, 1024},
        {SEQUENTIAL, 2000, 8},
        {RANDOM, 2000, 8},
        {RANDOM, 100000, 1024},
    };

    for (const auto& test : testCases) {
        RopeConfig cfg = RopeConfig::defaults();
        cfg.leaf_cap_bytes = test.leafBytes;

        std::cout << "\n--- " << patternName(test.pattern) << " " << test.numItems
                  << " items, leaf " << test.leafBytes << " bytes ---\n";

        for (bool autoRebalance : {true, false}) {
            unsigned long start = GetTimeMicro64();
            IntRope r = build(test.pattern, test.numItems, autoRebalance, cfg);
            unsigned long elapsed = GetTimeMicro64() - start;

            RopeStats s = r.stats();
            std::cout << (autoRebalance ? "  auto:   " : "  manual: ") << s
                      << " footprint=" << r.footprint()
                      << " insert_us=" << std::fixed << std::setprecision(3)
                      << (double)elapsed / test.numItems << "\n";

            EXPECT_TRUE(s.consistent);
            EXPECT_EQ(s.items, test.numItems);
            if (autoRebalance)
                EXPECT_LE(s.max_depth, heuristicCeiling(r));

            unsigned long rstart = GetTimeMicro64();
            IntRope balanced = r.rebalance();
            unsigned long relapsed = GetTimeMicro64() - rstart;
            std::cout << "          rebalance -> depth " << balanced.depth()
                      << " in " << relapsed << " us\n";
            EXPECT_EQ(balanced.length(), r.length());
        }
    }
}

TEST_F(RopeDepthAnalysis, DepthAfterEditsAndRemoves) {
    std::cout << "\n=== Depth under Mixed Edits ===\n";

    RopeConfig cfg = RopeConfig::defaults();
    cfg.leaf_cap_bytes = 64;
    IntRope r = build(RANDOM, 20000, true, cfg);

    std::mt19937 gen(7);
    for (int round = 0; round < 5; round++) {
        for (int i = 0; i < 4000 && !r.empty(); i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length() - 1)(gen);
            r = (i % 2) ? r.remove(off) : r.set(off, -1);
        }
        RopeStats s = r.stats();
        std::cout << "  round " << round << ": len=" << r.length() << " " << s << "\n";
        EXPECT_TRUE(s.consistent);
    }

    RopeStats before = r.stats();
    IntRope balanced = r.rebalance();
    RopeStats after = balanced.stats();
    std::cout << "  rebalanced: " << after << "\n";
    EXPECT_EQ(after.blocks - after.empty_blocks, before.blocks - before.empty_blocks);
    EXPECT_EQ(after.items, before.items);
}
