#include "util/unix.hpp"
#include "util/path.hpp"
#include "util/string.hpp"

#include <cstring>

extern "C" {
#include <unistd.h>
#include <time.h>
#include <errno.h>
#include <sys/prctl.h>
#include <sys/syscall.h>
}

static std::string *processName;

pid_t GetTid() {
    return syscall(SYS_gettid);
}

std::string GetTaskName(pid_t pid) {
    if (pid) {
        std::string name;
        if (TPath("/proc/" + std::to_string(pid) + "/comm").ReadAll(name, 32))
            return "???";
        return name.substr(0, name.length() - 1);
    }

    if (!processName) {
        char name[17];

        memset(name, 0, sizeof(name));

        /* prctl returns 16 bytes string */

        if (prctl(PR_GET_NAME, (void *)name) < 0)
            strncpy(name, program_invocation_short_name, sizeof(name) - 1);

        processName = new std::string(name);
    }

    return *processName;
}

/*
 * Initial namespace maps whole range:
 *          0          0 4294967295
 */
bool InUserNamespace() {
    std::string text;

    if (TPath("/proc/self/uid_map").ReadAll(text, 4096))
        return false;

    auto fields = SplitString(StringTrim(text), ' ');
    std::vector<std::string> values;
    for (auto &f: fields)
        if (!f.empty())
            values.push_back(f);

    return !(values.size() == 3 && values[0] == "0" &&
             values[1] == "0" && values[2] == "4294967295");
}

void LocalTime(const time_t *time, struct tm &tm) {
    localtime_r(time, &tm);
}

std::string FormatTime(time_t t, const char *fmt) {
    struct tm tm;
    char buf[256];

    LocalTime(&t, tm);
    strftime(buf, sizeof(buf), fmt, &tm);
    return std::string(buf);
}
