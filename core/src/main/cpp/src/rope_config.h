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

#pragma once
#include <cstdint>
#include <cmath>
#include <cstdlib>
#include <algorithm>
#include <stdexcept>
#include <memory>
#include <mutex>
#include <string>
#include "config.h"  // For defaults
#include "util/log.h"

namespace ropelist {

/**
 * Runtime configuration for rope handles
 * Can be customized per-sequence instead of compile-time constants
 */
struct RopeConfig {
    // Block sizing
    size_t leaf_cap_bytes          = ROPELIST_LEAF_CAP_BYTES;          // Default 1KB

    // Rebalance heuristic. A rebuilt tree is ceil(log2(len)) + 2 deep, so a
    // min depth below that (with a small factor) rebuilds the whole tree
    // on every insert; 0 is accepted for callers that want that.
    size_t rebalance_min_depth     = ROPELIST_REBALANCE_MIN_DEPTH;     // Default 30
    double rebalance_depth_factor  = ROPELIST_REBALANCE_DEPTH_FACTOR;  // Default 3

    // Policy flag handed to new handles
    bool   auto_rebalance          = ROPELIST_AUTO_REBALANCE != 0;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static RopeConfig defaults() {
        RopeConfig cfg;

        if (const char* env = std::getenv("ROPELIST_LEAF_CAP_BYTES")) {
            cfg.leaf_cap_bytes = parseCount("ROPELIST_LEAF_CAP_BYTES", env);
        }

        if (const char* env = std::getenv("ROPELIST_REBALANCE_MIN_DEPTH")) {
            cfg.rebalance_min_depth = parseCount("ROPELIST_REBALANCE_MIN_DEPTH", env);
        }

        if (const char* env = std::getenv("ROPELIST_REBALANCE_DEPTH_FACTOR")) {
            cfg.rebalance_depth_factor = std::stod(env);
        }

        if (const char* env = std::getenv("ROPELIST_AUTO_REBALANCE")) {
            cfg.auto_rebalance = (std::string(env) != "0");
        }

        return cfg;
    }

    /**
     * Config for callers that rebalance explicitly at controlled points
     */
    static RopeConfig manual_rebalance() {
        RopeConfig cfg;
        cfg.auto_rebalance = false;
        return cfg;
    }

    /**
     * defaults() for the process-wide config: an override that does not
     * parse or validate is logged and the compiled defaults are used.
     */
    static RopeConfig fromEnvironment() {
        RopeConfig cfg;
        try {
            cfg = defaults();
        } catch (const std::exception& e) {
            warning() << "ignoring ROPELIST_* environment overrides: " << e.what();
            return RopeConfig();
        }

        if (!cfg.validate()) {
            warning() << "ignoring invalid ROPELIST_* environment overrides";
            return RopeConfig();
        }

        if (cfg != RopeConfig()) {
            info() << "rope config: leaf_cap_bytes=" << cfg.leaf_cap_bytes
                   << " rebalance_min_depth=" << cfg.rebalance_min_depth
                   << " rebalance_depth_factor=" << cfg.rebalance_depth_factor
                   << " auto_rebalance=" << cfg.auto_rebalance;
        }
        return cfg;
    }

    /**
     * Process-wide default, resolved from the environment once
     */
    static std::shared_ptr<const RopeConfig> shared() {
        static std::shared_ptr<const RopeConfig> instance;
        static std::once_flag init_flag;

        std::call_once(init_flag, []() {
            instance = std::make_shared<const RopeConfig>(fromEnvironment());
        });

        return instance;
    }

    /**
     * Block capacity for elements of the given size, never 0
     */
    size_t block_capacity(size_t element_size) const {
        const size_t bytes = std::min<size_t>(leaf_cap_bytes, ROPELIST_MAX_LEAF_CAP_BYTES);
        return bytes / std::max<size_t>(element_size, 1) + 1;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (leaf_cap_bytes < 1 || leaf_cap_bytes > ROPELIST_MAX_LEAF_CAP_BYTES) {
            return false;
        }
        if (!(rebalance_depth_factor > 0.0) || !std::isfinite(rebalance_depth_factor)) {
            return false;
        }
        return true;
    }

    bool operator==(const RopeConfig& o) const {
        return leaf_cap_bytes == o.leaf_cap_bytes
            && rebalance_min_depth == o.rebalance_min_depth
            && rebalance_depth_factor == o.rebalance_depth_factor
            && auto_rebalance == o.auto_rebalance;
    }

    bool operator!=(const RopeConfig& o) const { return !(*this == o); }

private:
    // unsigned decimal; stoull alone would wrap "-1" to SIZE_MAX
    static size_t parseCount(const char* name, const char* text) {
        const std::string s(text);
        const size_t first = s.find_first_not_of(" \t");
        if (first != std::string::npos && s[first] == '-')
            throw std::invalid_argument(std::string(name) + " must not be negative: '" + s + "'");

        size_t used = 0;
        const unsigned long long v = std::stoull(s, &used);
        if (s.find_first_not_of(" \t", used) != std::string::npos)
            throw std::invalid_argument(std::string(name) + " is not a number: '" + s + "'");
        return static_cast<size_t>(v);
    }
};

} // namespace ropelist
