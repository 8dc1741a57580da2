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

#include <sstream>
#include <stdexcept>
#include <string>

namespace ropelist {

    /**
     * Raised when an index or offset falls outside the range an
     * operation accepts. Recoverable; the source handle is untouched.
     */
    class IndexFailure : public std::out_of_range {
    public:
        IndexFailure(const std::string& msg, const char* file, int line)
            : std::out_of_range(where(file, line) + msg), _file(file), _line(line) {}

        const char* file() const { return _file; }
        int line() const { return _line; }

    private:
        static std::string where(const char* file, int line) {
            std::ostringstream oss;
            oss << file << ":" << line << " IndexFail: ";
            return oss.str();
        }

        const char* _file;
        int _line;
    };

    /**
     * Raised when a rebuilt tree does not hold the item count it was
     * built from. Indicates a broken rebuild, not bad input.
     */
    class RopeFatalError : public std::runtime_error {
    public:
        RopeFatalError(const std::string& msg, const char* file, int line)
            : std::runtime_error(where(file, line) + msg), _file(file), _line(line) {}

        const char* file() const { return _file; }
        int line() const { return _line; }

    private:
        static std::string where(const char* file, int line) {
            std::ostringstream oss;
            oss << file << ":" << line << " Fatal: ";
            return oss.str();
        }

        const char* _file;
        int _line;
    };

} // namespace ropelist

// Convenience macros that stamp the raise site onto the exception
#define ROPELIST_THROW_INDEX(msg) \
    throw ::ropelist::IndexFailure((msg), __FILE__, __LINE__)

#define ROPELIST_THROW_FATAL(msg) \
    throw ::ropelist::RopeFatalError((msg), __FILE__, __LINE__)
