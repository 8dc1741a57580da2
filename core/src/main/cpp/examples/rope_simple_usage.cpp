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

#include <iostream>
#include <string>
#include <chrono>
#include "../src/rope.h"
#include "../src/rope.hpp"

using namespace ropelist;
using namespace std;

int main() {
    cout << "=== Persistent Rope Example ===\n\n";

    // Step 1: Build a version by appending
    cout << "Appending 10,000 items...\n";
    auto start = chrono::high_resolution_clock::now();

    Rope<int64_t> v1;
    for (int64_t i = 0; i < 10000; i++) {
        v1 = v1.insert(v1.length(), i);

        if ((i + 1) % 2500 == 0) {
            cout << "  length " << v1.length() << ", depth " << v1.depth()
                 << ", footprint " << v1.footprint() / 1024 << " KB\n";
        }
    }

    auto ms = chrono::duration_cast<chrono::milliseconds>(
        chrono::high_resolution_clock::now() - start).count();
    cout << "Appends completed in " << ms << " ms\n";
    cout << "Block capacity: " << v1.blockCapacity() << " items\n\n";

    // Step 2: Edit without disturbing the old version
    cout << "Deriving versions...\n";
    Rope<int64_t> v2 = v1.set(5000, -5000);
    Rope<int64_t> v3 = v2.insert(0, -1).remove(v2.length());

    cout << "  v1[5000] = " << v1.get(5000) << "\n";
    cout << "  v2[5000] = " << v2.get(5000) << "\n";
    cout << "  v3[0] = " << v3.get(0) << ", v3[5001] = " << v3.get(5001)
         << ", length " << v3.length() << "\n";

    // Untouched subtrees are shared, so v2 costs little on top of v1
    cout << "  v1 footprint " << v1.footprint() << " bytes, v2 footprint "
         << v2.footprint() << " bytes\n";
    if (!v1.root()->isBlock() && !v2.root()->isBlock()) {
        const auto& b1 = static_cast<const RopeBranch<int64_t>&>(*v1.root());
        const auto& b2 = static_cast<const RopeBranch<int64_t>&>(*v2.root());
        cout << "  root subtrees shared: left " << boolalpha
             << (b1.left() == b2.left()) << ", right " << (b1.right() == b2.right()) << "\n";
    }
    cout << "\n";

    // Step 3: Rebalance on demand
    cout << "Front inserts with auto-rebalance off...\n";
    Rope<string> words;
    words.setAutoRebalance(false);
    for (int i = 0; i < 2000; i++)
        words = words.insert(0, "w" + to_string(i));
    cout << "  " << words.stats() << "\n";

    Rope<string> balanced = words.rebalance();
    cout << "  after rebalance: " << balanced.stats() << "\n";
    cout << "  first word: " << balanced.get(0) << ", last word: "
         << balanced.get(balanced.length() - 1) << "\n\n";

    // Step 4: Out-of-range access reports IndexFail
    try {
        balanced.get(balanced.length());
    } catch (const IndexFailure& e) {
        cout << "Caught: " << e.what() << "\n";
    }

    cout << "\n=== Example completed successfully ===\n";
    return 0;
}
