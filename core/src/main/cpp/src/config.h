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

namespace ropelist {

// bytes a single block may hold before an insert splits it
#ifndef ROPELIST_LEAF_CAP_BYTES
#define ROPELIST_LEAF_CAP_BYTES 1024
#endif

// upper bound on a configured leaf_cap_bytes, keeps the block capacity
// computation clear of overflow
#ifndef ROPELIST_MAX_LEAF_CAP_BYTES
#define ROPELIST_MAX_LEAF_CAP_BYTES (size_t(1) << 30)
#endif

// trees shallower than this are never rebuilt by an insert
#ifndef ROPELIST_REBALANCE_MIN_DEPTH
#define ROPELIST_REBALANCE_MIN_DEPTH 30
#endif

// rebuild once depth exceeds log2(blocks) * factor
#ifndef ROPELIST_REBALANCE_DEPTH_FACTOR
#define ROPELIST_REBALANCE_DEPTH_FACTOR 3   /**@todo thresholds are empirical, tune against rope_depth_analysis*/
#endif

#ifndef ROPELIST_AUTO_REBALANCE
#define ROPELIST_AUTO_REBALANCE 1
#endif

}
