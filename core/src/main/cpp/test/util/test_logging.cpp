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

#include <gtest/gtest.h>
#include "../../src/util/log.h"
#include "../../src/util/logmanager.h"
#include "../../src/util/log_runtime.h"
#include "../../src/rope.h"
#include "../../src/rope.hpp"
#include <filesystem>
#include <fstream>
#include <regex>
#include <thread>
#include <unistd.h>

using namespace ropelist;

class LoggingTest : public ::testing::Test {
protected:
    int saved_level;
    std::string log_dir;

    void SetUp() override {
        saved_level = logLevel;
        log_dir = "/tmp/ropelist_logging_test_" + std::to_string(getpid());
        std::filesystem::create_directories(log_dir);
    }

    void TearDown() override {
        logLevel = saved_level;
        Logger::setLogFile(nullptr);
        std::filesystem::remove_all(log_dir);
        unsetenv("LOG_LEVEL");
        unsetenv("ROPELIST_LOG_ENABLE_FILE");
        unsetenv("ROPELIST_LOG_DIR");
    }

    // true when some line carries [level] followed by a match for pattern
    static bool hasLine(const std::string& text, const std::string& level, const std::string& pattern) {
        return std::regex_search(text, std::regex("\\[" + level + "\\] .*" + pattern));
    }

    static std::string readFile(const std::string& path) {
        std::ifstream in(path);
        return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    }

    static size_t countLines(const std::string& text) {
        return static_cast<size_t>(std::count(text.begin(), text.end(), '\n'));
    }

    // runs body with fd 2 pointed at a scratch file; the logger writes
    // to stderr whenever no log file is set
    std::string captureStderr(const std::function<void()>& body) {
        const std::string path = log_dir + "/stderr.txt";
        FILE* sink = fopen(path.c_str(), "w");
        if (!sink)
            return "";

        fflush(stderr);
        int saved = dup(STDERR_FILENO);
        dup2(fileno(sink), STDERR_FILENO);

        body();

        fflush(stderr);
        dup2(saved, STDERR_FILENO);
        close(saved);
        fclose(sink);

        std::string text = readFile(path);
        std::filesystem::remove(path);
        return text;
    }

    LogRuntime::Config fileConfig(LogLevel level) const {
        LogRuntime::Config config;
        config.enable_file_logging = true;
        config.log_dir = log_dir;
        config.initial_level = level;
        return config;
    }
};

TEST_F(LoggingTest, LevelsBelowThresholdAreDropped) {
    logLevel = LOG_WARNING;

    auto out = captureStderr([]() {
        trace() << "t-line";
        debug() << "d-line";
        info() << "i-line";
        warning() << "w-line";
        error() << "e-line";
        severe() << "s-line";
    });

    EXPECT_EQ(out.find("t-line"), std::string::npos);
    EXPECT_EQ(out.find("d-line"), std::string::npos);
    EXPECT_EQ(out.find("i-line"), std::string::npos);
    EXPECT_TRUE(hasLine(out, "WARNING", "w-line"));
    EXPECT_TRUE(hasLine(out, "ERROR", "e-line"));
    EXPECT_TRUE(hasLine(out, "SEVERE", "s-line"));
    EXPECT_EQ(countLines(out), 3u);
}

TEST_F(LoggingTest, LevelChangesApplyToNextMessage) {
    logLevel = LOG_SEVERE;
    auto quiet = captureStderr([]() { debug() << "rope: skip"; });
    EXPECT_TRUE(quiet.empty());

    ASSERT_TRUE(setLogLevelFromString("trace"));
    auto loud = captureStderr([]() { trace() << "rope: skip"; });
    EXPECT_TRUE(hasLine(loud, "TRACE", "rope: skip"));
}

TEST_F(LoggingTest, ParseLevelNames) {
    LogLevel l = LOG_INFO;
    EXPECT_TRUE(parseLogLevel("TRACE", l));    EXPECT_EQ(l, LOG_TRACE);
    EXPECT_TRUE(parseLogLevel("debug", l));    EXPECT_EQ(l, LOG_DEBUG);
    EXPECT_TRUE(parseLogLevel("Info", l));     EXPECT_EQ(l, LOG_INFO);
    EXPECT_TRUE(parseLogLevel("warn", l));     EXPECT_EQ(l, LOG_WARNING);
    EXPECT_TRUE(parseLogLevel("ERROR", l));    EXPECT_EQ(l, LOG_ERROR);
    EXPECT_TRUE(parseLogLevel("fatal", l));    EXPECT_EQ(l, LOG_SEVERE);

    l = LOG_DEBUG;
    EXPECT_FALSE(parseLogLevel("loud", l));
    EXPECT_EQ(l, LOG_DEBUG);

    logLevel = LOG_ERROR;
    EXPECT_FALSE(setLogLevelFromString(""));
    EXPECT_EQ(logLevel, LOG_ERROR);
}

TEST_F(LoggingTest, LevelFromEnvironment) {
    setenv("LOG_LEVEL", "DEBUG", 1);
    initLoggingFromEnv();
    EXPECT_EQ(logLevel, LOG_DEBUG);

    setenv("LOG_LEVEL", "chatty", 1);
    auto out = captureStderr([]() { initLoggingFromEnv(); });
    EXPECT_EQ(logLevel, LOG_DEBUG);
    EXPECT_NE(out.find("Invalid LOG_LEVEL 'chatty'"), std::string::npos);
}

TEST_F(LoggingTest, MessageFormatting) {
    logLevel = LOG_INFO;

    auto out = captureStderr([]() {
        info() << "len:" << size_t(300) << " factor:" << 2.5 << " hex:" << std::hex << 255;
        info() << "ended" << std::endl;
    });

    EXPECT_TRUE(hasLine(out, "INFO", "len:300 factor:2.5 hex:ff\n"));
    // endl writes the line itself, the wrapper must not write a second one
    EXPECT_EQ(countLines(out), 2u);
    EXPECT_TRUE(std::regex_search(out, std::regex("\\[ROPELIST\\] \\[INFO\\] ended")));
}

TEST_F(LoggingTest, ThreadNameTagsMessages) {
    logLevel = LOG_INFO;

    auto out = captureStderr([]() {
        std::thread t([]() {
            Logger::get().setThreadName("rope-worker");
            info() << "named thread message";
        });
        t.join();
    });

    EXPECT_NE(out.find("[rope-worker] [INFO] named thread message"), std::string::npos);
}

TEST_F(LoggingTest, ConcurrentWritersKeepLinesWhole) {
    logLevel = LOG_INFO;
    const int threads = 8;
    const int perThread = 200;

    auto out = captureStderr([&]() {
        std::vector<std::thread> workers;
        for (int i = 0; i < threads; ++i) {
            workers.emplace_back([i, perThread]() {
                for (int j = 0; j < perThread; ++j)
                    info() << "writer " << i << " message " << j;
            });
        }
        for (auto& t : workers)
            t.join();
    });

    EXPECT_EQ(countLines(out), static_cast<size_t>(threads * perThread));
    std::istringstream lines(out);
    std::string line;
    const std::regex whole("\\[INFO\\] writer [0-9]+ message [0-9]+$");
    while (std::getline(lines, line))
        ASSERT_TRUE(std::regex_search(line, whole)) << line;
}

TEST_F(LoggingTest, LogManagerWritesToFile) {
    const std::string path = log_dir + "/ropelist.log";
    {
        LogManager manager(log_dir);
        EXPECT_EQ(manager.path(), path);

        logLevel = LOG_INFO;
        info() << "to the file";
    }

    EXPECT_TRUE(hasLine(readFile(path), "INFO", "to the file"));

    // after the manager is gone output goes back to stderr
    auto out = captureStderr([]() { info() << "back on stderr"; });
    EXPECT_TRUE(hasLine(out, "INFO", "back on stderr"));
    EXPECT_EQ(readFile(path).find("back on stderr"), std::string::npos);
}

TEST_F(LoggingTest, LogManagerRejectsDirectoryAsFile) {
    std::filesystem::create_directories(log_dir + "/ropelist.log");
    EXPECT_THROW(LogManager manager(log_dir), std::runtime_error);
}

TEST_F(LoggingTest, RotateMovesOldLinesAside) {
    {
        LogManager manager(log_dir);
        logLevel = LOG_INFO;
        info() << "first file";
        manager.rotate();
        info() << "second file";
    }

    EXPECT_NE(readFile(log_dir + "/ropelist.log").find("second file"), std::string::npos);

    size_t rotated = 0;
    for (const auto& entry : std::filesystem::directory_iterator(log_dir)) {
        const std::string name = entry.path().filename().string();
        if (name.rfind("ropelist.log.", 0) == 0) {
            rotated++;
            std::string text = readFile(entry.path().string());
            EXPECT_NE(text.find("first file"), std::string::npos);
            EXPECT_EQ(text.find("second file"), std::string::npos);
        }
    }
    EXPECT_EQ(rotated, 1u);
}

TEST_F(LoggingTest, RuntimeGuardRestoresLevel) {
    logLevel = LOG_ERROR;
    {
        LogRuntimeGuard guard(fileConfig(LOG_DEBUG));
        EXPECT_EQ(logLevel, LOG_DEBUG);
        EXPECT_EQ(guard->logPath(), log_dir + "/ropelist.log");
    }
    EXPECT_EQ(logLevel, LOG_ERROR);
}

TEST_F(LoggingTest, RuntimeConfigFromEnvironment) {
    setenv("ROPELIST_LOG_ENABLE_FILE", "1", 1);
    setenv("ROPELIST_LOG_DIR", log_dir.c_str(), 1);
    setenv("LOG_LEVEL", "trace", 1);

    LogRuntime::Config config = LogRuntime::Config::fromEnv();
    EXPECT_TRUE(config.enable_file_logging);
    EXPECT_EQ(config.log_dir, log_dir);
    EXPECT_EQ(config.initial_level, LOG_TRACE);

    setenv("LOG_LEVEL", "nonsense", 1);
    LogRuntime::Config fallback;
    captureStderr([&]() { fallback = LogRuntime::Config::fromEnv(); });
    EXPECT_EQ(fallback.initial_level, LOG_WARNING);
}

TEST_F(LoggingTest, RebalanceIsLoggedAtDebug) {
    {
        LogRuntimeGuard guard(fileConfig(LOG_DEBUG));

        Rope<int64_t> r;
        for (int64_t i = 0; i < 300; i++)
            r = r.insert(r.length(), i);
        r = r.rebalance();
        EXPECT_EQ(r.length(), 300u);
    }

    EXPECT_TRUE(hasLine(readFile(log_dir + "/ropelist.log"), "DEBUG",
                        "rope: rebalanced [0-9]+ blocks.*len:300"));
}

TEST_F(LoggingTest, SkippedRebalanceIsLoggedAtTrace) {
    {
        LogRuntimeGuard guard(fileConfig(LOG_TRACE));

        // a one-block tree sits far below the minimum rebuild depth
        Rope<int64_t> r{RopeConfig()};
        r = r.insert(0, 7);
        EXPECT_EQ(r.get(0), 7);
    }

    EXPECT_TRUE(hasLine(readFile(log_dir + "/ropelist.log"), "TRACE",
                        "rope: skip rebalance, max_depth:1 len:1"));
}

TEST_F(LoggingTest, FatalRebuildIsLoggedAtSevere) {
    class Exposed : public Rope<int64_t> {
    public:
        explicit Exposed(const Rope<int64_t>& r) : Rope<int64_t>(r) {}
        using Rope<int64_t>::rebuild;
    };

    logLevel = LOG_WARNING;
    Exposed e(Rope<int64_t>().insert(0, 1));
    auto out = captureStderr([&]() {
        EXPECT_THROW(e.rebuild(e.root(), 2, 0), RopeFatalError);
    });
    EXPECT_TRUE(hasLine(out, "SEVERE", "rebalance len fail 1 != 2"));
}
