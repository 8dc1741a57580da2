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

#include "util.h"

#include <unistd.h>

namespace ropelist {

    /* Returns the amount of microseconds elapsed since the UNIX epoch. */
    unsigned long GetTimeMicro64() {
        struct timeval tv;

        gettimeofday(&tv, NULL);

        unsigned long ret = tv.tv_usec;

        /* Adds the seconds (10^0) after converting them to microseconds (10^-6) */
        ret += (tv.tv_sec * 1000000);

        return ret;
    }

    size_t getResidentMemory() {
        // second field of statm is resident pages
        FILE* f = fopen("/proc/self/statm", "r");
        if (!f)
            return 0;
        unsigned long size = 0, resident = 0;
        int n = fscanf(f, "%lu %lu", &size, &resident);
        fclose(f);
        if (n != 2)
            return 0;
        long page_size = sysconf(_SC_PAGE_SIZE);
        return page_size > 0 ? resident * static_cast<size_t>(page_size) : 0;
    }

}
