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

#include "log.h"
#include "logmanager.h"

namespace ropelist {

    boost::mutex Logger::sm;
    FILE* Logger::logfile = nullptr;
    boost::thread_specific_ptr<Logger> Logger::tsp;

    std::atomic<int> logLevel(LOG_WARNING);

    const char* logLevelToString( LogLevel l ) {
        switch(l) {
        case LOG_TRACE:
            return "TRACE";
        case LOG_DEBUG:
            return "DEBUG";
        case LOG_INFO:
            return "INFO";
        case LOG_WARNING:
            return "WARNING";
        case LOG_ERROR:
            return "ERROR";
        case LOG_SEVERE:
            return "SEVERE";
        default:
            return "UNKNOWN";
        }
    }

    // "<ctime> [thread] [LEVEL] message\n"
    void Logger::flush() {
        string msg = ss.str();
        ss.str("");

        char when[26];
        time_t now = time(0);
        ctime_r(&now, when);
        when[24] = 0; // drop the trailing newline

        ostringstream oss;
        oss << when << " [" << _threadName << "] [" << logLevelToString(_level) << "] " << msg;
        if ( msg.empty() || msg[msg.size()-1] != '\n' )
            oss << '\n';
        const string out = oss.str();

        boost::mutex::scoped_lock lk(sm);
        FILE* target = logfile ? logfile : stderr;
        if(fprintf(target, "%s", out.c_str())>=0) {
            fflush(target);
        }
        else {
            int x = errno;
            cerr << "Failed to write to logfile: " << errnoWithDescription(x) << ": " << out << endl;
        }
    }

    void Logger::setLogFile( FILE* f ) {
        boost::mutex::scoped_lock lk(sm);
        logfile = f;
    }
}
