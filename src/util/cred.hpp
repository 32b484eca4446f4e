#pragma once

#include <string>

#include "util/error.hpp"

extern "C" {
#include <sys/types.h>
}

constexpr uid_t NoUser = (uid_t)-1;
constexpr gid_t NoGroup = (gid_t)-1;

class TCred {
    uid_t Uid;
    gid_t Gid;

public:
    TCred(uid_t uid, gid_t gid) : Uid(uid), Gid(gid) {}

    TCred() : Uid(NoUser), Gid(NoGroup) {}

    static TCred Current();

    /* "user", "user:group" or numeric "uid:gid" */
    TError Init(const std::string &spec);

    uid_t GetUid() const {
        return Uid;
    }

    gid_t GetGid() const {
        return Gid;
    }

    std::string ToString() const {
        return std::to_string(Uid) + ":" + std::to_string(Gid);
    }

    friend std::ostream& operator<<(std::ostream& os, const TCred &cred) {
        return os << cred.ToString();
    }
};

template <> struct fmt::formatter<TCred> : fmt::ostream_formatter {};
