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

#include "log.h"

#include <boost/filesystem.hpp>

namespace ropelist {

    class LogManager {
    public:

        /**
         * Directs all rope logging to <logdir>/ropelist.log. An empty logdir
         * falls back to ROPELIST_LOG_DIR, then to /tmp.
         */
        explicit LogManager(string logdir="", bool append=true) : _enabled(false), _append(append), _file(0) {
            string dir = logdir;
            if(dir.empty()) {
                const char* env = getenv("ROPELIST_LOG_DIR");
                dir = env ? env : "/tmp";
            }
            boost::filesystem::path lp = boost::filesystem::path(dir) / "ropelist.log";
            start(lp.string(), append);
        }

        ~LogManager() {
            if ( _file ) {
                Logger::setLogFile(nullptr);
                fclose( _file );
                _file = 0;
            }
        }

        LogManager(const LogManager&) = delete;
        LogManager& operator=(const LogManager&) = delete;

        const string& path() const { return _path; }

        void time_t_to_Struct(time_t t, struct tm *buf, bool local=false) {
            if ( local )
                localtime_r(&t, buf);
            else
                gmtime_r(&t, buf);
        }

        string terseCurrentTime(bool colonsOk=true) {
            struct tm t;
            time_t_to_Struct( time(0), &t );

            const char* fmt = (colonsOk ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%dT%H-%M-%S");
            char buf[32];
            if ( strftime(buf, sizeof(buf), fmt, &t) == 0 )
                return "unknown-time";
            return buf;
        }

        void start( const string& lp, bool append) {
            _append = append;

            boost::filesystem::path parent = boost::filesystem::path(lp).parent_path();
            if ( !parent.empty() && !boost::filesystem::exists(parent) )
                boost::filesystem::create_directories(parent);

            if ( boost::filesystem::is_directory(lp) )
                throw std::runtime_error("logpath [" + lp + "] should be a file name not a directory");

            bool exists = boost::filesystem::exists(lp);

            FILE * test = fopen( lp.c_str() , _append ? "a" : "w" );
            if ( ! test )
                throw std::runtime_error("can't open [" + lp + "] for log file: " + errnoWithDescription());

            if (append && exists){
                // two blank lines before and after
                const string msg = "\n\n***** LOG REOPENED *****\n\n\n";
                if (fwrite(msg.data(), 1, msg.size(), test) != msg.size())
                    cerr << "LogManager: failed to write restart banner to " << lp << endl;
            }

            fclose( test );

            _path = lp;
            _enabled = true;
            rotate();
        }

        /**
         * Renames the current log file to a timestamped name and reopens
         * a fresh file under the original name.
         */
        void rotate() {
            if( !_enabled ) {
                cerr << "LogManager not enabled" << endl;
                return;
            }

            if ( _file ) {
                stringstream ss;
                ss << _path << "." << terseCurrentTime( false );
                string s = ss.str();
                if ( rename( _path.c_str() , s.c_str() ) != 0 )
                    cerr << "LogManager: rename to " << s << " failed: " << errnoWithDescription() << endl;
            }

            FILE* tmp = fopen(_path.c_str(), _append ? "a" : "w");
            if ( !tmp )
                throw std::runtime_error("can't open: " + _path + " for log file");

            Logger::setLogFile(tmp); // after this point no thread will be using old file

            if ( _file )
                fclose( _file );

            _file = tmp;    // Save new file for next rotation
        }

    private:
        bool _enabled;
        string _path;
        bool _append;
        FILE *_file;
    };
}
