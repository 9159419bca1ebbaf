/*---------------------------------------------------------*/
/*                                                         */
/*   crash_report.cpp - Timestamped crash dumps            */
/*                                                         */
/*---------------------------------------------------------*/

#include "crash_report.h"

#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <typeinfo>

#include <cxxabi.h>
#include <execinfo.h>
#include <sys/stat.h>

static const int kMaxStackFrames = 48;

static std::string demangle(const char* name) {
    int status = 0;
    char* plain = abi::__cxa_demangle(name, nullptr, nullptr, &status);
    if (status != 0 || !plain)
        return name;
    std::string out(plain);
    std::free(plain);
    return out;
}

static std::string formatPos(const Position& p) {
    return "(" + std::to_string(p.row) + "," + std::to_string(p.col) + ")";
}

static std::string formatList(const std::vector<Position>& list) {
    std::string out = "[";
    for (size_t i = 0; i < list.size(); ++i) {
        if (i > 0) out += ", ";
        out += formatPos(list[i]);
    }
    return out + "]";
}

// Creates each component of `dir` in turn (mkdir -p).
static bool makeDirs(const std::string& dir) {
    if (dir.empty())
        return true;
    std::string partial;
    std::stringstream parts(dir);
    std::string piece;
    if (dir[0] == '/')
        partial = "/";
    while (std::getline(parts, piece, '/')) {
        if (piece.empty())
            continue;
        partial += piece;
        mkdir(partial.c_str(), 0755);
        partial += "/";
    }
    struct stat st;
    return stat(dir.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

CrashReporter::CrashReporter(const std::string& dir) : crashDir(dir) {}

CrashInfo CrashReporter::describe(const std::exception& e) {
    CrashInfo info;

    std::time_t t = std::time(nullptr);
    std::tm tmv;
    localtime_r(&t, &tmv);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tmv);
    info.timestamp = buf;

    info.errorType = demangle(typeid(e).name());
    info.message = e.what();

    void* frames[kMaxStackFrames];
    int n = backtrace(frames, kMaxStackFrames);
    char** symbols = backtrace_symbols(frames, n);
    if (symbols) {
        for (int i = 0; i < n; ++i)
            info.stack.push_back(symbols[i]);
        std::free(symbols);
    }
    return info;
}

void CrashReporter::capture(const std::exception& e) {
    capturedInfo = describe(e);
    captureValid = true;
}

std::string CrashReporter::formatReport(const CrashInfo& info) const {
    std::ostringstream r;
    r << "tvsnake crash report\n";
    r << "time: " << info.timestamp << "\n\n";

    r << "[game]\n";
    if (!lastSnapshot.valid) {
        r << "no game in progress\n";
    } else {
        const GameSnapshot& s = lastSnapshot;
        r << "score: " << s.score << "\n";
        r << "difficulty: " << s.difficulty << "\n";
        r << "snake length: " << s.snakeLength << "\n";
        r << "snake head: " << formatPos(s.head) << "\n";
        r << "snake body (first " << s.bodyPrefix.size() << "): " << formatList(s.bodyPrefix) << "\n";
        r << "direction: " << s.direction << "\n";
        r << "move interval: " << s.moveInterval << "s\n";
        r << "food: " << formatPos(s.food) << "\n";
        r << "obstacles: " << s.obstacleCount << "\n";
        r << "obstacles (first " << s.obstaclePrefix.size() << "): " << formatList(s.obstaclePrefix) << "\n";
    }

    r << "\n[error]\n";
    r << "type: " << info.errorType << "\n";
    r << "message: " << info.message << "\n";

    r << "\n[handler stack]\n";
    for (const auto& line : info.stack)
        r << "  " << line << "\n";
    return r.str();
}

std::string CrashReporter::write(const CrashInfo& info) const {
    if (!makeDirs(crashDir)) {
        fprintf(stderr, "[crash] cannot create directory %s\n", crashDir.c_str());
        return "";
    }

    // "YYYY-MM-DD HH:MM:SS" -> "YYYYMMDD_HHMMSS"
    std::string stamp;
    for (char c : info.timestamp) {
        if (c == ' ') stamp.push_back('_');
        else if (c != '-' && c != ':') stamp.push_back(c);
    }

    std::string path = crashDir.empty() ? "" : crashDir + "/";
    path += "crash_" + stamp + ".txt";

    std::ofstream out(path.c_str(), std::ios::out | std::ios::trunc);
    if (!out) {
        fprintf(stderr, "[crash] cannot open %s\n", path.c_str());
        return "";
    }
    out << formatReport(info);
    out.close();
    if (!out.good()) {
        fprintf(stderr, "[crash] write to %s failed\n", path.c_str());
        return "";
    }
    return path;
}
