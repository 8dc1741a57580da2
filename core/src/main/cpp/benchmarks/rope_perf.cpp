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

/*
 * Load/ops driver for Rope<int64_t>.
 *
 *   rope_perf --loads 100000 --ops 10000 [--seed N] [--no-auto-rebalance]
 *
 * Builds a rope with `loads` random inserts, then times `ops` rounds of
 * each operation against it and reports tree shape and memory.
 */

#include <boost/program_options.hpp>
#include <iomanip>
#include <iostream>
#include <random>
#include "../src/rope.h"
#include "../src/rope.hpp"
#include "../src/util.h"
#include "../src/util/log_runtime.h"

using namespace ropelist;

namespace bpo = boost::program_options;

namespace {

    typedef Rope<int64_t> IntRope;

    struct PerfOptions {
        size_t loads;
        size_t ops;
        uint32_t seed;
        bool autoRebalance;
    };

    void report(const char* name, size_t n, unsigned long elapsedMicros) {
        std::cout << std::left << std::setw(12) << name
                  << std::right << std::setw(10) << n << " ops  "
                  << std::setw(12) << elapsedMicros << " us  "
                  << std::fixed << std::setprecision(1)
                  << (n ? (elapsedMicros * 1000.0) / n : 0.0) << " ns/op\n";
    }

    void reportShape(const char* label, const IntRope& r) {
        RopeStats s = r.stats();
        std::cout << label << ": len=" << r.length() << " " << s
                  << " footprint=" << r.footprint() << "\n";
    }

    IntRope load(const PerfOptions& opts, std::mt19937& gen) {
        IntRope r;
        r.setAutoRebalance(opts.autoRebalance);

        unsigned long start = GetTimeMicro64();
        for (size_t i = 0; i < opts.loads; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length())(gen);
            r = r.insert(off, (int64_t)i);
        }
        report("load", opts.loads, GetTimeMicro64() - start);
        return r;
    }

    int run(const PerfOptions& opts) {
        std::mt19937 gen(opts.seed);

        std::cout << "rope_perf loads=" << opts.loads << " ops=" << opts.ops
                  << " seed=" << opts.seed
                  << " auto_rebalance=" << (opts.autoRebalance ? "on" : "off")
                  << " block_capacity=" << IntRope().blockCapacity() << "\n";

        IntRope r = load(opts, gen);
        reportShape("loaded", r);

        if (r.empty()) {
            std::cout << "nothing loaded, skipping ops\n";
            return 0;
        }

        int64_t sum = 0;
        unsigned long start = GetTimeMicro64();
        for (size_t i = 0; i < opts.ops; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length() - 1)(gen);
            sum += r.get(off);
        }
        report("get", opts.ops, GetTimeMicro64() - start);

        // each round edits the same base version, so every result is discarded
        start = GetTimeMicro64();
        for (size_t i = 0; i < opts.ops; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length() - 1)(gen);
            sum += r.set(off, -1).length();
        }
        report("set", opts.ops, GetTimeMicro64() - start);

        start = GetTimeMicro64();
        for (size_t i = 0; i < opts.ops; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length())(gen);
            sum += r.insert(off, -1).length();
        }
        report("insert", opts.ops, GetTimeMicro64() - start);

        start = GetTimeMicro64();
        for (size_t i = 0; i < opts.ops; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, r.length() - 1)(gen);
            sum += r.remove(off).length();
        }
        report("remove", opts.ops, GetTimeMicro64() - start);

        start = GetTimeMicro64();
        IntRope balanced = r.rebalance();
        report("rebalance", 1, GetTimeMicro64() - start);
        reportShape("balanced", balanced);

        // chained edits: every version builds on the previous one
        IntRope chained = r;
        start = GetTimeMicro64();
        for (size_t i = 0; i < opts.ops; i++) {
            size_t off = std::uniform_int_distribution<size_t>(0, chained.length())(gen);
            chained = chained.insert(off, (int64_t)i);
            off = std::uniform_int_distribution<size_t>(0, chained.length() - 1)(gen);
            chained = chained.remove(off);
        }
        report("ins+rem", opts.ops, GetTimeMicro64() - start);
        reportShape("chained", chained);

        std::cout << "resident=" << getResidentMemory() << " bytes checksum=" << sum << "\n";
        return 0;
    }
}

int main(int argc, char** argv) {
    PerfOptions opts;
    bpo::options_description desc("rope_perf options");
    desc.add_options()
        ("help,h", "print this message")
        ("loads", bpo::value<size_t>(&opts.loads)->default_value(100000), "items inserted before timing")
        ("ops", bpo::value<size_t>(&opts.ops)->default_value(10000), "operations timed per kind")
        ("seed", bpo::value<uint32_t>(&opts.seed)->default_value(5489u), "random seed")
        ("no-auto-rebalance", bpo::bool_switch(), "never rebuild the tree during inserts");

    bpo::variables_map vm;
    try {
        bpo::store(bpo::parse_command_line(argc, argv, desc), vm);
        bpo::notify(vm);
    } catch (const bpo::error& e) {
        std::cerr << "rope_perf: " << e.what() << "\n" << desc << "\n";
        return 2;
    }

    if (vm.count("help")) {
        std::cout << desc << "\n";
        return 0;
    }
    opts.autoRebalance = !vm["no-auto-rebalance"].as<bool>();

    try {
        // LOG_LEVEL, ROPELIST_LOG_ENABLE_FILE and ROPELIST_LOG_DIR apply here
        LogRuntime::getInstance();
        return run(opts);
    } catch (const std::exception& e) {
        ropelist::error() << "rope_perf: " << e.what();
        return 1;
    }
}
