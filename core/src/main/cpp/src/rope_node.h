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

#include "pch.h"

namespace ropelist {

    /**
     * Interface for RopeBlock and RopeBranch
     *
     * Nodes are immutable once constructed and are shared between
     * every rope version that reaches them.
     */
    template< class T >
    class IRopeNode {
    public:
        typedef std::shared_ptr<const IRopeNode<T>> Ref;

        virtual ~IRopeNode() {}
        virtual bool isBlock() const=0;
        // number of items stored under this node
        virtual size_t count() const=0;
        // bytes held by this node alone, children excluded
        virtual size_t memoryUsage() const=0;
    };

    /**
     * Leaf node: a contiguous run of items.
     *
     * A block grows one item per insert until it reaches the block
     * capacity, at which point the next insert splits it in two.
     */
    template< class T >
    class RopeBlock : public IRopeNode<T> {
    public:
        typedef typename IRopeNode<T>::Ref Ref;
        typedef vector<T> ItemVector;
        typedef typename ItemVector::const_iterator ItemIterator;

        RopeBlock() {}
        explicit RopeBlock(ItemVector&& items) : _items(std::move(items)) {}

        bool isBlock() const { return true; }
        size_t count() const { return _items.size(); }
        size_t memoryUsage() const { return sizeof(*this) + _items.capacity() * sizeof(T); }

        const ItemVector& items() const { return _items; }
        const T& at(size_t off) const { return _items[off]; }

        /**
         * new block with value spliced in at off, or a branch over two
         * halves when this block is already at capacity
         */
        Ref insertAt(size_t off, const T& value, size_t capacity) const;

        /** copy of this block with the item at off replaced */
        Ref setAt(size_t off, const T& value) const;

        /** copy of this block without the item at off */
        Ref eraseAt(size_t off) const;

        static Ref empty() { return std::make_shared<const RopeBlock<T>>(); }

    private:
        Ref splitInsert(size_t off, const T& value) const;

        static ItemVector spliced(ItemIterator first, ItemIterator last, size_t off, const T& value);

        ItemVector _items;
    };

    /**
     * Internal node: weight is the item count of the left subtree.
     */
    template< class T >
    class RopeBranch : public IRopeNode<T> {
    public:
        typedef typename IRopeNode<T>::Ref Ref;

        RopeBranch(size_t weight, Ref left, Ref right)
            : _weight(weight), _count(weight + right->count()),
              _left(std::move(left)), _right(std::move(right)) {
            assert(_weight == _left->count());
        }

        bool isBlock() const { return false; }
        size_t count() const { return _count; }
        size_t memoryUsage() const { return sizeof(*this); }

        size_t weight() const { return _weight; }
        const Ref& left() const { return _left; }
        const Ref& right() const { return _right; }

    private:
        size_t _weight;
        size_t _count;      // weight + right->count(), fixed at construction
        Ref _left;
        Ref _right;
    };

    template< class T >
    typename RopeBlock<T>::ItemVector
    RopeBlock<T>::spliced(ItemIterator first, ItemIterator last, size_t off, const T& value) {
        ItemVector out;
        out.reserve(static_cast<size_t>(last - first) + 1);
        out.insert(out.end(), first, first + off);
        out.push_back(value);
        out.insert(out.end(), first + off, last);
        return out;
    }

    template< class T >
    typename RopeBlock<T>::Ref RopeBlock<T>::insertAt(size_t off, const T& value, size_t capacity) const {
        if (_items.size() < capacity)
            return std::make_shared<const RopeBlock<T>>(spliced(_items.begin(), _items.end(), off, value));
        return splitInsert(off, value);
    }

    template< class T >
    typename RopeBlock<T>::Ref RopeBlock<T>::splitInsert(size_t off, const T& value) const {
        const size_t n = _items.size();
        // left half takes ceil(n/2); a block of 0 or 1 items stays whole on the left
        const size_t m = (n <= 1) ? n : (n + 1) / 2;
        const ItemIterator mid = _items.begin() + m;

        ItemVector ld, rd;
        size_t weight;
        if (off < m) {
            ld = spliced(_items.begin(), mid, off, value);
            rd.assign(mid, _items.end());
            weight = ld.size();
        } else {
            ld.assign(_items.begin(), mid);
            rd = spliced(mid, _items.end(), off - m, value);
            weight = m;
        }

        Ref left = std::make_shared<const RopeBlock<T>>(std::move(ld));
        Ref right = std::make_shared<const RopeBlock<T>>(std::move(rd));
        return std::make_shared<const RopeBranch<T>>(weight, std::move(left), std::move(right));
    }

    template< class T >
    typename RopeBlock<T>::Ref RopeBlock<T>::setAt(size_t off, const T& value) const {
        ItemVector data(_items);
        data[off] = value;
        return std::make_shared<const RopeBlock<T>>(std::move(data));
    }

    template< class T >
    typename RopeBlock<T>::Ref RopeBlock<T>::eraseAt(size_t off) const {
        ItemVector data;
        data.reserve(_items.size() - 1);
        data.insert(data.end(), _items.begin(), _items.begin() + off);
        data.insert(data.end(), _items.begin() + off + 1, _items.end());
        return std::make_shared<const RopeBlock<T>>(std::move(data));
    }

}
