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

#include "rope.h"

namespace ropelist {

    template< class T >
    Rope<T>::Rope() : Rope(RopeConfig::shared()) {}

    template< class T >
    Rope<T>::Rope(const RopeConfig& config)
        : Rope(std::make_shared<const RopeConfig>(config)) {}

    template< class T >
    Rope<T>::Rope(std::shared_ptr<const RopeConfig> config)
        : _len(0), _root(Block::empty()), _autoRebalance(true), _config(std::move(config)) {
        if (!_config || !_config->validate())
            throw std::invalid_argument("Rope: invalid RopeConfig");
        _autoRebalance = _config->auto_rebalance;
    }

    template< class T >
    Rope<T>::Rope(size_t len, NodeRef root, bool autoRebalance, std::shared_ptr<const RopeConfig> config)
        : _len(len), _root(std::move(root)), _autoRebalance(autoRebalance), _config(std::move(config)) {}

    /**
     * walks from the root to the block holding off. On return off is
     * local to that block and path, when given, lists the branches
     * passed on the way down.
     */
    template< class T >
    const typename Rope<T>::Block* Rope<T>::descend(size_t& off, Path* path) const {
        const Node* node = _root.get();

        // traverse to a leaf level
        while(!node->isBlock()) {
            const Branch* branch = static_cast<const Branch*>(node);
            const bool goLeft = off < branch->weight();
            if (path)
                path->push_back(PathStep{branch, goLeft});
            if (goLeft) {
                node = branch->left().get();
            } else {
                off -= branch->weight();
                node = branch->right().get();
            }
        }

        return static_cast<const Block*>(node);
    }

    /**
     * rebuilds the branches on path bottom-up around the new node. Only
     * a branch whose left side was rewritten has its weight adjusted;
     * the untouched sibling of every step is shared, not copied.
     */
    template< class T >
    typename Rope<T>::NodeRef Rope<T>::rewritePath(const Path& path, NodeRef node, int weightDelta) {
        for (typename Path::const_reverse_iterator it = path.rbegin(); it != path.rend(); ++it) {
            const Branch* b = it->branch;
            if (it->wentLeft) {
                size_t weight = (weightDelta < 0) ? b->weight() - static_cast<size_t>(-weightDelta)
                                                  : b->weight() + static_cast<size_t>(weightDelta);
                node = std::make_shared<const Branch>(weight, std::move(node), b->right());
            } else {
                node = std::make_shared<const Branch>(b->weight(), b->left(), std::move(node));
            }
        }
        return node;
    }

    template< class T >
    const T& Rope<T>::get(size_t index) const {
        if (index >= _len) {
            std::ostringstream oss;
            oss << "get: index " << index << " out of bounds for length " << _len;
            ROPELIST_THROW_INDEX(oss.str());
        }

        const Block* block = descend(index, nullptr);
        return block->at(index);
    }

    template< class T >
    Rope<T> Rope<T>::insert(size_t off, const T& value) const {
        if (off > _len) {
            std::ostringstream oss;
            oss << "insert: offset " << off << " out of bounds for length " << _len;
            ROPELIST_THROW_INDEX(oss.str());
        }

        Path path;
        size_t local = off;
        const Block* block = descend(local, &path);

        // depth of the addressed block, root = 1
        const size_t maxDepth = path.size() + 1;

        NodeRef node = block->insertAt(local, value, blockCapacity());
        NodeRef root = rewritePath(path, std::move(node), +1);

        root = maybeRebalance(std::move(root), maxDepth, _len + 1);
        return Rope<T>(_len + 1, std::move(root), _autoRebalance, _config);
    }

    template< class T >
    Rope<T> Rope<T>::set(size_t off, const T& value) const {
        if (off >= _len) {
            std::ostringstream oss;
            oss << "set: offset " << off << " out of bounds for length " << _len;
            ROPELIST_THROW_INDEX(oss.str());
        }

        Path path;
        size_t local = off;
        const Block* block = descend(local, &path);

        NodeRef root = rewritePath(path, block->setAt(local, value), 0);
        return Rope<T>(_len, std::move(root), _autoRebalance, _config);
    }

    template< class T >
    Rope<T> Rope<T>::remove(size_t off) const {
        if (off >= _len) {
            std::ostringstream oss;
            oss << "remove: offset " << off << " out of bounds for length " << _len;
            ROPELIST_THROW_INDEX(oss.str());
        }

        Path path;
        size_t local = off;
        const Block* block = descend(local, &path);

        NodeRef root = rewritePath(path, block->eraseAt(local), -1);
        return Rope<T>(_len - 1, std::move(root), _autoRebalance, _config);
    }

    template< class T >
    Rope<T> Rope<T>::rebalance() const {
        NodeRef root = rebuild(_root, _len, 0);
        return Rope<T>(_len, std::move(root), _autoRebalance, _config);
    }

    /**
     * shallow trees are never rebuilt; deeper ones only when they run
     * well past what a balanced tree over the same blocks would need
     */
    template< class T >
    bool Rope<T>::canRebalance(size_t maxDepth, size_t len) const {
        if (maxDepth < _config->rebalance_min_depth)
            return false;

        const size_t nBlocks = len / blockCapacity();
        const double bound = (nBlocks > 1)
            ? std::log2(static_cast<double>(nBlocks)) * _config->rebalance_depth_factor
            : 0.0;
        return static_cast<double>(maxDepth) > bound;
    }

    template< class T >
    typename Rope<T>::NodeRef Rope<T>::maybeRebalance(NodeRef root, size_t maxDepth, size_t len) const {
        if (!_autoRebalance)
            return root;

        if (!canRebalance(maxDepth, len)) {
            trace() << "rope: skip rebalance, max_depth:" << maxDepth << " len:" << len;
            return root;
        }

        return rebuild(root, len, maxDepth);
    }

    /**
     * smallest d with 2^(d-1) >= len, i.e. ceil(log2(len)) + 1
     */
    template< class T >
    size_t Rope<T>::targetDepth(size_t len) {
        size_t d = 0;
        while (d < 63 && (size_t(1) << d) < len)
            ++d;
        return d + 1;
    }

    template< class T >
    typename Rope<T>::NodeRef Rope<T>::rebuild(const NodeRef& root, size_t len, size_t maxDepth) const {
        vector<NodeRef> blocks = collectBlocks(root);
        // consumed from the back, in original left-to-right order
        std::reverse(blocks.begin(), blocks.end());

        const size_t nBlocks = blocks.size();
        const size_t depth = targetDepth(len);

        size_t n = 0;
        NodeRef nroot = blocks.empty() ? Block::empty() : buildBottomsUp(depth, blocks, n);

        debug() << "rope: rebalanced " << nBlocks << " blocks, max_depth:" << maxDepth
                << " target_depth:" << depth << " len:" << len;

        if (n != len || !blocks.empty()) {
            std::ostringstream oss;
            oss << "rebalance len fail " << n << " != " << len
                << " (" << blocks.size() << " blocks left over)";
            severe() << "rope: " << oss.str();
            ROPELIST_THROW_FATAL(oss.str());
        }

        return nroot;
    }

    /**
     * gathers the non-empty blocks left-to-right with an explicit stack,
     * so a degenerate tree cannot exhaust the call stack
     */
    template< class T >
    vector<typename Rope<T>::NodeRef> Rope<T>::collectBlocks(const NodeRef& root) {
        vector<NodeRef> acc;
        vector<const NodeRef*> stack;
        const NodeRef* node = &root;

        for (;;) {
            if ((*node)->isBlock()) {
                if ((*node)->count() > 0)
                    acc.push_back(*node);
                if (stack.empty())
                    break;
                node = stack.back();
                stack.pop_back();
            } else {
                const Branch* branch = static_cast<const Branch*>(node->get());
                stack.push_back(&branch->right());
                node = &branch->left();
            }
        }

        return acc;
    }

    template< class T >
    typename Rope<T>::NodeRef Rope<T>::buildBottomsUp(size_t depth, vector<NodeRef>& blocks, size_t& n) {
        if (blocks.empty()) {
            n = 0;
            return Block::empty();
        }

        if (depth == 1) {
            NodeRef left = blocks.back();
            blocks.pop_back();
            const size_t weight = left->count();

            NodeRef right;
            if (blocks.empty()) {
                right = Block::empty();
            } else {
                right = blocks.back();
                blocks.pop_back();
            }

            n = weight + right->count();
            return std::make_shared<const Branch>(weight, std::move(left), std::move(right));
        }

        size_t weight = 0, m = 0;
        NodeRef left = buildBottomsUp(depth - 1, blocks, weight);
        NodeRef right = buildBottomsUp(depth - 1, blocks, m);
        n = weight + m;
        return std::make_shared<const Branch>(weight, std::move(left), std::move(right));
    }

    template< class T >
    RopeStats Rope<T>::stats() const {
        RopeStats s;

        struct Visit {
            const Node* node;
            size_t depth;
        };
        vector<Visit> stack;
        stack.push_back(Visit{_root.get(), 1});

        while (!stack.empty()) {
            Visit v = stack.back();
            stack.pop_back();

            s.max_depth = std::max(s.max_depth, v.depth);
            s.node_bytes += v.node->memoryUsage();

            if (v.node->isBlock()) {
                s.blocks++;
                if (v.node->count() == 0)
                    s.empty_blocks++;
                s.items += v.node->count();
            } else {
                const Branch* b = static_cast<const Branch*>(v.node);
                s.branches++;
                if (b->weight() != b->left()->count())
                    s.consistent = false;
                stack.push_back(Visit{b->right().get(), v.depth + 1});
                stack.push_back(Visit{b->left().get(), v.depth + 1});
            }
        }

        if (s.items != _len)
            s.consistent = false;

        return s;
    }

    template< class T >
    size_t Rope<T>::footprint() const {
        return sizeof(*this) + stats().node_bytes;
    }

}
