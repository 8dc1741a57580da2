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

#include "./util/log.h"
#include "config.h"
#include "rope_config.h"
#include "rope_error.h"
#include "rope_node.h"

namespace ropelist {

    /**
     * Shape of a rope's tree, gathered by a single walk.
     */
    struct RopeStats {
        size_t blocks;          // leaf nodes, empty ones included
        size_t empty_blocks;
        size_t branches;
        size_t max_depth;       // root counts as depth 1
        size_t items;           // items reachable from the root
        size_t node_bytes;      // sum of memoryUsage() over all nodes
        bool consistent;        // every branch weight equals its left count

        RopeStats() : blocks(0), empty_blocks(0), branches(0), max_depth(0),
                      items(0), node_bytes(0), consistent(true) {}

        friend ostream& operator<<(ostream& os, const RopeStats& s) {
            os << "blocks=" << s.blocks << " empty_blocks=" << s.empty_blocks
               << " branches=" << s.branches << " max_depth=" << s.max_depth
               << " items=" << s.items << " node_bytes=" << s.node_bytes;
            return os;
        }
    };

    /**
     * Persistent indexable sequence.
     *
     * A binary tree of blocks: leaves hold contiguous runs of items,
     * branches hold the item count of their left subtree. Every edit
     * returns a new handle that shares all untouched subtrees with the
     * handle it was made from; no existing node is ever modified, so
     * handles may be read from any number of threads without locking.
     *
     * Edits against the same handle from different threads each yield
     * an independent version. Serializing versions is the caller's job.
     */
    template< class T >
    class Rope {
    public:
        typedef T value_type;
        typedef IRopeNode<T> Node;
        typedef typename Node::Ref NodeRef;
        typedef RopeBlock<T> Block;
        typedef RopeBranch<T> Branch;

        /** empty rope using the process-wide configuration */
        Rope();
        explicit Rope(const RopeConfig& config);
        explicit Rope(std::shared_ptr<const RopeConfig> config);

        size_t length() const { return _len; }
        bool empty() const { return _len == 0; }

        /**
         * Estimated bytes held by this version: the handle plus every
         * node reachable from its root. Nodes shared with other versions
         * are counted in full.
         */
        size_t footprint() const;

        /**
         * Item at index, throws IndexFailure when index >= length()
         */
        const T& get(size_t index) const;

        /**
         * New rope with value placed at off, 0 <= off <= length().
         * May rebuild the tree when the insert path ran deep.
         */
        Rope<T> insert(size_t off, const T& value) const;

        /** New rope with the item at off replaced, 0 <= off < length() */
        Rope<T> set(size_t off, const T& value) const;

        /** New rope without the item at off, 0 <= off < length() */
        Rope<T> remove(size_t off) const;

        /**
         * New rope with identical contents over a freshly built,
         * balanced tree. Runs regardless of the auto-rebalance flag.
         */
        Rope<T> rebalance() const;

        /**
         * When disabled, inserts never rebuild the tree; rebalance()
         * must be called explicitly.
         */
        Rope<T>& setAutoRebalance(bool rebalance) {
            _autoRebalance = rebalance;
            return *this;
        }

        bool autoRebalance() const { return _autoRebalance; }
        size_t blockCapacity() const { return _config->block_capacity(sizeof(T)); }
        const RopeConfig& config() const { return *_config; }

        RopeStats stats() const;
        size_t depth() const { return stats().max_depth; }

        const NodeRef& root() const { return _root; }

    protected:
        // one branch on the way down, and the side taken
        struct PathStep {
            const Branch* branch;
            bool wentLeft;
        };
        typedef vector<PathStep> Path;

        Rope(size_t len, NodeRef root, bool autoRebalance, std::shared_ptr<const RopeConfig> config);

        const Block* descend(size_t& off, Path* path) const;

        static NodeRef rewritePath(const Path& path, NodeRef node, int weightDelta);

        bool canRebalance(size_t maxDepth, size_t len) const;
        NodeRef maybeRebalance(NodeRef root, size_t maxDepth, size_t len) const;
        NodeRef rebuild(const NodeRef& root, size_t len, size_t maxDepth) const;

        static vector<NodeRef> collectBlocks(const NodeRef& root);
        static NodeRef buildBottomsUp(size_t depth, vector<NodeRef>& blocks, size_t& n);
        static size_t targetDepth(size_t len);

    private:
        size_t _len;
        NodeRef _root;
        bool _autoRebalance;
        std::shared_ptr<const RopeConfig> _config;
    };

}
