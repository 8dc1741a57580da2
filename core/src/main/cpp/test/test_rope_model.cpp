/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */

#include <gtest/gtest.h>
#include <cmath>
#include <cstring>
#include <random>
#include <vector>
#include "../src/rope.h"
#include "../src/rope.hpp"

using namespace ropelist;
using namespace std;

namespace {

    // large enough that a block fills after a handful of items
    struct Payload {
        int64_t id;
        char pad[248];

        Payload(int64_t i = 0) : id(i) { memset(pad, static_cast<int>(i & 0x7f), sizeof(pad)); }

        bool operator==(const Payload& o) const {
            return id == o.id && memcmp(pad, o.pad, sizeof(pad)) == 0;
        }
    };

    ostream& operator<<(ostream& os, const Payload& p) {
        return os << "Payload(" << p.id << ")";
    }

}

class RopeModelTest : public ::testing::Test {
protected:
    template< class T >
    static void expectMatches(const Rope<T>& rope, const vector<T>& model) {
        ASSERT_EQ(rope.length(), model.size());
        for (size_t i = 0; i < model.size(); i++)
            ASSERT_EQ(rope.get(i), model[i]) << "at index " << i;
    }

    std::mt19937 gen{12345};

    size_t pick(size_t lo, size_t hi) {
        std::uniform_int_distribution<size_t> d(lo, hi);
        return d(gen);
    }
};

TEST_F(RopeModelTest, RandomEditsMatchVector) {
    Rope<int64_t> rope;
    vector<int64_t> model;

    for (int64_t step = 0; step < 20000; step++) {
        size_t op = pick(0, 9);
        if (model.empty() || op < 5) {
            size_t off = pick(0, model.size());
            rope = rope.insert(off, step);
            model.insert(model.begin() + off, step);
        } else if (op < 8) {
            size_t off = pick(0, model.size() - 1);
            rope = rope.set(off, -step);
            model[off] = -step;
        } else {
            size_t off = pick(0, model.size() - 1);
            rope = rope.remove(off);
            model.erase(model.begin() + off);
        }

        if (step % 2500 == 0) {
            expectMatches(rope, model);
            ASSERT_TRUE(rope.stats().consistent) << "step " << step;
        }
    }

    expectMatches(rope, model);
    EXPECT_TRUE(rope.stats().consistent);
}

TEST_F(RopeModelTest, RandomEditsWithSmallBlocks) {
    RopeConfig cfg;
    cfg.leaf_cap_bytes = 16;   // 3 int64 per block
    Rope<int64_t> rope(cfg);
    vector<int64_t> model;

    for (int64_t step = 0; step < 6000; step++) {
        size_t op = pick(0, 9);
        if (model.empty() || op < 6) {
            size_t off = pick(0, model.size());
            rope = rope.insert(off, step);
            model.insert(model.begin() + off, step);
        } else if (op < 7) {
            size_t off = pick(0, model.size() - 1);
            rope = rope.set(off, step * 3);
            model[off] = step * 3;
        } else {
            size_t off = pick(0, model.size() - 1);
            rope = rope.remove(off);
            model.erase(model.begin() + off);
        }
    }

    expectMatches(rope, model);
    RopeStats s = rope.stats();
    EXPECT_TRUE(s.consistent);
    EXPECT_GE(s.blocks, model.size() / rope.blockCapacity());
}

TEST_F(RopeModelTest, EveryVersionKeepsItsContents) {
    vector<Rope<int64_t>> versions;
    vector<vector<int64_t>> models;

    Rope<int64_t> rope;
    vector<int64_t> model;
    versions.push_back(rope);
    models.push_back(model);

    for (int64_t step = 0; step < 600; step++) {
        if (model.empty() || pick(0, 3) != 0) {
            size_t off = pick(0, model.size());
            rope = rope.insert(off, step);
            model.insert(model.begin() + off, step);
        } else {
            size_t off = pick(0, model.size() - 1);
            rope = rope.remove(off);
            model.erase(model.begin() + off);
        }
        versions.push_back(rope);
        models.push_back(model);
    }

    for (size_t v = 0; v < versions.size(); v++)
        expectMatches(versions[v], models[v]);
}

TEST_F(RopeModelTest, TenThousandRandomInsertsWithLargeItems) {
    Rope<Payload> rope;
    ASSERT_LE(rope.blockCapacity(), 5u);

    vector<Payload> model;
    model.reserve(10000);

    for (int64_t i = 0; i < 10000; i++) {
        size_t off = pick(0, model.size());
        rope = rope.insert(off, Payload(i));
        model.insert(model.begin() + off, Payload(i));
    }

    EXPECT_EQ(rope.length(), 10000u);
    expectMatches(rope, model);

    const size_t before = rope.depth();
    Rope<Payload> balanced = rope.rebalance();

    expectMatches(balanced, model);
    expectMatches(rope, model);

    const size_t after = balanced.depth();
    EXPECT_LE(after, before);

    // ceil(log2(10000)) levels of branches over the blocks
    EXPECT_LE(after, 16u);
    const double blocks = 10000.0 / rope.blockCapacity();
    EXPECT_LE(static_cast<double>(after), 3.0 * std::log2(blocks));
    EXPECT_TRUE(balanced.stats().consistent);
}
