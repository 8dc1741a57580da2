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

#include "../pch.h"
#include <cctype>
#include <cerrno>
#include <atomic>

namespace ropelist {

    class LogManager;

    enum LogLevel {
        LOG_TRACE,    // rebalance decisions, per-operation detail
        LOG_DEBUG,    // rebuilds
        LOG_INFO,     // configuration resolved at startup
        LOG_WARNING,  // rejected configuration
        LOG_ERROR,
        LOG_SEVERE    // consistency failures
    };

    /** messages below this level are dropped before formatting */
    extern std::atomic<int> logLevel;

    const char* logLevelToString( LogLevel l );

    /**
     * Per-thread message buffer. A message is collected in ss and
     * written as one line by flush(), under a process-wide mutex.
     */
    class Logger {
        static boost::mutex sm;
        static FILE* logfile;
        static boost::thread_specific_ptr<Logger> tsp;

        stringstream ss;
        LogLevel _level;
        string _threadName;

        Logger() : _level(LOG_INFO), _threadName("ROPELIST") {}

    public:
        friend class LogManager;

        static Logger& get() {
            Logger *p = tsp.get();
            if( p == 0 )
                tsp.reset( p = new Logger() );
            return *p;
        }

        /**
         * set the log file, nullptr routes output to stderr
         */
        static void setLogFile(FILE* f);

        void flush();

        const string& getThreadName() const { return _threadName; }
        void setThreadName(const string& name) { _threadName = name; }

        Logger& begin(LogLevel l) {
            ss.str("");
            ss.flags(ios_base::dec | ios_base::skipws);  // undo manipulators from the last message
            ss.precision(6);
            _level = l;
            return *this;
        }

        template< class T >
        Logger& operator<<(const T& x) { ss << x; return *this; }

        Logger& operator<< (ostream& ( *_endl )(ostream&)) {
            flush();
            return *this;
        }
        Logger& operator<< (ios_base& (*_hex)(ios_base&)) {
            ss << _hex;
            return *this;
        }
    };

    // Auto-flushing wrapper for log messages
    class LoggerWrapper {
        Logger* logger_;
    public:
        // filtered messages carry a nullptr logger
        __attribute__((always_inline))
        explicit LoggerWrapper(Logger* logger) : logger_(logger) {}

        LoggerWrapper(LoggerWrapper&& o) : logger_(o.logger_) { o.logger_ = nullptr; }
        LoggerWrapper(const LoggerWrapper&) = delete;
        LoggerWrapper& operator=(const LoggerWrapper&) = delete;

        ~LoggerWrapper() {
            if (logger_)
                logger_->flush();
        }

        template<typename T>
        __attribute__((always_inline))
        LoggerWrapper& operator<<(const T& value) {
            if (logger_)
                (*logger_) << value;
            return *this;
        }

        LoggerWrapper& operator<<(ostream& (*endl)(ostream&)) {
            if (logger_) {
                (*logger_) << endl;
                logger_ = nullptr;  // endl already wrote the line
            }
            return *this;
        }
    };

    __attribute__((always_inline))
    inline LoggerWrapper logAt( LogLevel l ) {
        if ( l < logLevel.load(std::memory_order_relaxed) )
            return LoggerWrapper(nullptr);
        return LoggerWrapper(&Logger::get().begin(l));
    }

    inline LoggerWrapper trace()   { return logAt(LOG_TRACE); }
    inline LoggerWrapper debug()   { return logAt(LOG_DEBUG); }
    inline LoggerWrapper info()    { return logAt(LOG_INFO); }
    inline LoggerWrapper warning() { return logAt(LOG_WARNING); }
    inline LoggerWrapper error()   { return logAt(LOG_ERROR); }
    inline LoggerWrapper severe()  { return logAt(LOG_SEVERE); }

    inline string errnoWithDescription(int x = errno) {
        stringstream s;
        s << "errno:" << x << ' ' << strerror(x);
        return s.str();
    }

    /**
     * Case-insensitive level name, WARN and FATAL accepted as aliases.
     * Returns false and leaves out untouched for an unknown name.
     */
    inline bool parseLogLevel(const std::string& name, LogLevel& out) {
        std::string upper = name;
        for (auto& c : upper) c = std::toupper(static_cast<unsigned char>(c));

        if (upper == "TRACE")                          out = LOG_TRACE;
        else if (upper == "DEBUG")                     out = LOG_DEBUG;
        else if (upper == "INFO")                      out = LOG_INFO;
        else if (upper == "WARNING" || upper == "WARN") out = LOG_WARNING;
        else if (upper == "ERROR")                     out = LOG_ERROR;
        else if (upper == "SEVERE" || upper == "FATAL") out = LOG_SEVERE;
        else return false;
        return true;
    }

    inline bool setLogLevelFromString(const std::string& level) {
        LogLevel l;
        if (!parseLogLevel(level, l))
            return false;
        logLevel.store(l, std::memory_order_relaxed);
        return true;
    }

    // Initialize logging from the LOG_LEVEL environment variable
    inline void initLoggingFromEnv() {
        const char* env_level = std::getenv("LOG_LEVEL");
        if (env_level && !setLogLevelFromString(env_level)) {
            std::cerr << "Warning: Invalid LOG_LEVEL '" << env_level
                      << "'. Valid levels: TRACE, DEBUG, INFO, WARNING, ERROR, SEVERE\n";
        }
    }

}
