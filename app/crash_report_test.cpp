/*---------------------------------------------------------*/
/*   crash_report_test.cpp - ctest for crash dumps         */
/*---------------------------------------------------------*/

#include "crash_report.h"
#include "placement.h"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

#include <unistd.h>

static int failures = 0;

static void check(const char* name, bool cond) {
    if (cond) {
        std::cout << "  PASS: " << name << "\n";
    } else {
        std::cerr << "  FAIL: " << name << "\n";
        failures++;
    }
}

static bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

static std::string readFile(const std::string& path) {
    std::ifstream in(path.c_str());
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

int main() {
    std::cout << "=== Crash Report Tests ===\n\n";

    std::cout << "[describe]\n";
    {
        CrashInfo info;
        try {
            throw GameSetupError("board too small");
        } catch (const std::exception& e) {
            info = CrashReporter::describe(e);
        }
        check("type demangled", info.errorType == "GameSetupError");
        check("message kept", info.message == "board too small");
        check("timestamp shape", info.timestamp.size() == 19 && info.timestamp[4] == '-' &&
                                 info.timestamp[10] == ' ' && info.timestamp[13] == ':');
        check("stack captured", !info.stack.empty());
    }

    std::cout << "\n[formatReport: no game]\n";
    {
        CrashReporter reporter("unused");
        CrashInfo info;
        info.timestamp = "2026-01-02 03:04:05";
        info.errorType = "std::runtime_error";
        info.message = "boom";
        info.stack.push_back("frame0");
        const std::string r = reporter.formatReport(info);
        check("no game noted", contains(r, "no game in progress"));
        check("error type", contains(r, "type: std::runtime_error"));
        check("error message", contains(r, "message: boom"));
        check("stack frame", contains(r, "  frame0"));
        check("stack labelled as the handler's", contains(r, "[handler stack]\n  frame0"));
        check("time line", contains(r, "time: 2026-01-02 03:04:05"));
    }

    std::cout << "\n[formatReport: with game]\n";
    {
        GameController ctl(1);
        ctl.start(Difficulty::Medium, 20, 30, 0.0);
        CrashReporter reporter("unused");
        reporter.track(ctl.snapshot());
        check("snapshot tracked", reporter.snapshot().valid);

        CrashInfo info;
        info.timestamp = "2026-01-02 03:04:05";
        info.errorType = "std::logic_error";
        info.message = "bad";
        const std::string r = reporter.formatReport(info);
        check("score field", contains(r, "score: 0"));
        check("difficulty field", contains(r, "difficulty: medium"));
        check("snake length", contains(r, "snake length: 3"));
        check("snake head", contains(r, "snake head: (10,15)"));
        check("direction", contains(r, "direction: right"));
        check("move interval", contains(r, "move interval: 0.3s"));
        check("obstacle count", contains(r, "obstacles: 5"));
        check("no 'no game' line", !contains(r, "no game in progress"));
    }

    std::cout << "\n[capture]\n";
    {
        CrashReporter reporter("unused");
        check("nothing captured yet", !reporter.hasCapture());
        try {
            throw std::out_of_range("index 99");
        } catch (const std::exception& e) {
            reporter.capture(e);
        }
        check("captured", reporter.hasCapture());
        check("captured type", reporter.captured().errorType == "std::out_of_range");
    }

    std::cout << "\n[write]\n";
    {
        char tmpl[] = "/tmp/tvsnake_crash_XXXXXX";
        const char* base = mkdtemp(tmpl);
        check("temp dir", base != nullptr);
        const std::string dir = std::string(base ? base : "/tmp") + "/logs/crashes";

        CrashReporter reporter(dir);
        CrashInfo info;
        info.timestamp = "2026-01-02 03:04:05";
        info.errorType = "std::runtime_error";
        info.message = "disk full";
        const std::string path = reporter.write(info);
        check("file name from timestamp", path == dir + "/crash_20260102_030405.txt");
        check("file contents", contains(readFile(path), "message: disk full"));

        std::remove(path.c_str());
        rmdir(dir.c_str());
        rmdir((std::string(base ? base : "/tmp") + "/logs").c_str());
        if (base) rmdir(base);

        CrashReporter blocked("/proc/tvsnake_no_such_dir");
        check("unwritable dir gives empty path", blocked.write(info).empty());
    }

    std::cout << "\n=== Results: " << (failures == 0 ? "ALL PASSED" : "FAILURES") << " ===\n";
    return failures;
}
