/*---------------------------------------------------------*/
/*                                                         */
/*   crash_report.h - Timestamped crash dumps              */
/*                                                         */
/*---------------------------------------------------------*/

#ifndef CRASH_REPORT_H
#define CRASH_REPORT_H

#include "game_controller.h"

#include <exception>
#include <string>
#include <vector>

struct CrashInfo {
    std::string timestamp;    // "YYYY-MM-DD HH:MM:SS"
    std::string errorType;    // demangled exception type
    std::string message;
    std::vector<std::string> stack;
};

// Keeps the most recent game snapshot so that a failure escaping the
// event loop can still be reported after the UI is gone.
class CrashReporter {
public:
    explicit CrashReporter(const std::string& dir);

    void track(const GameSnapshot& snapshot) { lastSnapshot = snapshot; }
    const GameSnapshot& snapshot() const { return lastSnapshot; }

    // Collects type, message and the current call stack for `e`.
    static CrashInfo describe(const std::exception& e);

    // Called from the handler that first sees a failure. The stack is
    // taken there, so it ends at the handler, not at the throw.
    void capture(const std::exception& e);
    bool hasCapture() const { return captureValid; }
    const CrashInfo& captured() const { return capturedInfo; }

    std::string formatReport(const CrashInfo& info) const;

    // Writes crash_YYYYMMDD_HHMMSS.txt into the crash directory.
    // Returns the path, or an empty string if nothing could be written.
    std::string write(const CrashInfo& info) const;

private:
    std::string crashDir;
    GameSnapshot lastSnapshot;
    CrashInfo capturedInfo;
    bool captureValid {false};
};

#endif // CRASH_REPORT_H
