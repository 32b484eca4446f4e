#pragma once

#include "common.hpp"

#include <string>

extern "C" {
#include <sys/types.h>
#include <sys/stat.h>
}

std::string FormatTime(time_t t, const char *fmt = "%F %T");
void LocalTime(const time_t *time, struct tm &tm);

pid_t GetTid();
std::string GetTaskName(pid_t pid = 0);

/* True if running inside non-initial user namespace */
bool InUserNamespace();

/* Sets process umask and restores previous one in destructor */
class TUmask : public TNonCopyable {
    mode_t Saved;
public:
    TUmask(mode_t mask) {
        Saved = umask(mask);
    }
    ~TUmask() {
        umask(Saved);
    }
};
