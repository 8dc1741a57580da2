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

#include "rope.h"
#include "rope.hpp"

namespace ropelist {

// Explicit template instantiations for the element types the data model stores
// This ensures the template methods are compiled and available for linking
template class RopeBlock<int64_t>;
template class RopeBranch<int64_t>;
template class Rope<int64_t>;

template class RopeBlock<double>;
template class RopeBranch<double>;
template class Rope<double>;

template class RopeBlock<std::string>;
template class RopeBranch<std::string>;
template class Rope<std::string>;

} // namespace ropelist
