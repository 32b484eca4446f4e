#pragma once

#include <atomic>
#include <string>
#include "util/path.hpp"
#include "fmt/format.h"

extern bool Verbose;
extern bool Debug;
extern TFile LogFile;

void OpenLog();
void OpenLog(const TPath &path);
void WriteLog(const char *prefix, const std::string &log_msg);

struct TStatistics {
    std::atomic<uint64_t> Errors;
    std::atomic<uint64_t> Warns;
    std::atomic<uint64_t> LogLines;
    std::atomic<uint64_t> LayersApplied;
    std::atomic<uint64_t> LayersFailed;
    std::atomic<uint64_t> EntriesApplied;
    std::atomic<uint64_t> EntriesSkipped;
    std::atomic<uint64_t> Whiteouts;
    std::atomic<uint64_t> OpaqueDirs;
    std::atomic<uint64_t> AufsLinks;
    std::atomic<uint64_t> BytesApplied;
};

extern TStatistics *Statistics;

void InitStatistics();
void DumpStatistics();

template <typename... Args> inline void L_DBG(const char* fmt, const Args&... args) {
    if (Debug)
        WriteLog("DBG", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_VERBOSE(const char* fmt, const Args&... args) {
    if (Verbose)
        WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L(const char* fmt, const Args&... args) {
    WriteLog("   ", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_WRN(const char* fmt, const Args&... args) {
    if (Statistics)
        Statistics->Warns++;
    WriteLog("WRN", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_ERR(const char* fmt, const Args&... args) {
    if (Statistics)
        Statistics->Errors++;
    WriteLog("ERR", fmt::format(fmt, args...));
}

template <typename... Args> inline void L_ACT(const char* fmt, const Args&... args) {
    WriteLog("ACT", fmt::format(fmt, args...));
}
