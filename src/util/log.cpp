#include "log.hpp"
#include "util/unix.hpp"
#include "common.hpp"

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <fcntl.h>
}

bool Verbose = false;
bool Debug = false;

TStatistics *Statistics = nullptr;

void InitStatistics() {
    if (!Statistics)
        Statistics = new TStatistics();
}

void DumpStatistics() {
    if (!Statistics)
        return;
    L("layers applied {} failed {}", Statistics->LayersApplied.load(),
      Statistics->LayersFailed.load());
    L("entries applied {} skipped {} whiteouts {} opaque {} aufs links {}",
      Statistics->EntriesApplied.load(), Statistics->EntriesSkipped.load(),
      Statistics->Whiteouts.load(), Statistics->OpaqueDirs.load(),
      Statistics->AufsLinks.load());
    L("bytes applied {}", StringFormatSize(Statistics->BytesApplied));
    L("errors {} warnings {} log lines {}",
      Statistics->Errors.load(), Statistics->Warns.load(),
      Statistics->LogLines.load());
}

TFile LogFile;

void OpenLog() {
    LogFile.SetFd = STDERR_FILENO;
}

void OpenLog(const TPath &path) {
    int fd;

    if (!path) {
        fd = STDERR_FILENO;
    } else {
        struct stat st;
        fd = open(path.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC |
                                O_NOFOLLOW | O_NOCTTY, 0644);
        if (fd >= 0 && !fstat(fd, &st) && (st.st_mode & 0777) != 0644)
            fchmod(fd, 0644);
    }

    if (fd >= 0) {
        if (LogFile.Fd != STDERR_FILENO)
            LogFile.Close();
        LogFile.SetFd = fd;
    } else {
        TError error = TError::System("Cannot open log {}", path);
        LogFile.SetFd = STDERR_FILENO;
        L_WRN("{}", error);
    }
}

void WriteLog(const char *prefix, const std::string &log_msg) {
    struct timespec ts;
    clock_gettime(CLOCK_REALTIME, &ts);
    std::string currentTimeMs = fmt::format("{}.{:03}", FormatTime(ts.tv_sec), ts.tv_nsec / 1000000);

    std::string msg = fmt::format("{} {}[{}]: {} {}\n",
            currentTimeMs, GetTaskName(), GetTid(), prefix, log_msg);

    if (Statistics)
        Statistics->LogLines++;

    if (!LogFile)
        return;

    TError error = LogFile.WriteAll(msg);
    if (error && LogFile.Fd != STDERR_FILENO) {
        LogFile.Close();
        LogFile.SetFd = STDERR_FILENO;
        error = LogFile.WriteAll(msg);
        if (!error)
            L_WRN("Log file write failed, switched to stderr");
    }
}
