#include "util/cred.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

#include <vector>
#include <cctype>
#include <cerrno>

extern "C" {
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
}

static size_t PwdBufSize = sysconf(_SC_GETPW_R_SIZE_MAX) > 0 ?
                           sysconf(_SC_GETPW_R_SIZE_MAX) : 16384;

static size_t GrpBufSize = sysconf(_SC_GETGR_R_SIZE_MAX) > 0 ?
                           sysconf(_SC_GETGR_R_SIZE_MAX) : 16384;

/* ids of layer owners need not exist in host databases */
static bool NumericId(const std::string &name, unsigned &id) {
    uint64_t val;

    if (name.empty() || !isdigit(name[0]) || StringToUint64(name, val))
        return false;
    if (val >= NoUser)
        return false;
    id = val;
    return true;
}

static TError LookupUser(const std::string &user, uid_t &uid, gid_t &gid, bool &known) {
    struct passwd pwd, *ptr;
    std::vector<char> buf(PwdBufSize, '\0');
    unsigned id;
    bool numeric = NumericId(user, id);
    int err;

    while (1) {
        if (numeric)
            err = getpwuid_r(id, &pwd, buf.data(), buf.size(), &ptr);
        else
            err = getpwnam_r(user.c_str(), &pwd, buf.data(), buf.size(), &ptr);
        if (err != ERANGE)
            break;
        PwdBufSize *= 2;
        buf.resize(PwdBufSize);
        L_DBG("Increase user buffer to {}", PwdBufSize);
    }

    known = !err && ptr;
    if (known) {
        uid = pwd.pw_uid;
        gid = pwd.pw_gid;
        return OK;
    }

    if (numeric) {
        uid = id;
        return OK;
    }

    return TError(EError::InvalidValue, err, "Cannot find user: " + user);
}

static TError LookupGroup(const std::string &group, gid_t &gid) {
    struct group grp, *ptr;
    std::vector<char> buf(GrpBufSize, '\0');
    unsigned id;
    int err;

    if (NumericId(group, id)) {
        gid = id;
        return OK;
    }

    while ((err = getgrnam_r(group.c_str(), &grp, buf.data(), buf.size(), &ptr))) {
        if (err != ERANGE)
            return TError(EError::InvalidValue, err, "Cannot find group: " + group);
        GrpBufSize *= 2;
        buf.resize(GrpBufSize);
        L_DBG("Increase group buffer to {}", GrpBufSize);
    }

    if (!ptr)
        return TError(EError::InvalidValue, "Cannot find group: " + group);

    gid = grp.gr_gid;
    return OK;
}

TCred TCred::Current() {
    return TCred(geteuid(), getegid());
}

TError TCred::Init(const std::string &spec) {
    TError error;
    bool known;

    if (spec.empty())
        return TError(EError::InvalidValue, "Empty user");

    auto sep = spec.find(':');
    std::string user = spec.substr(0, sep);

    error = LookupUser(user, Uid, Gid, known);
    if (error)
        return error;

    if (sep != std::string::npos)
        return LookupGroup(spec.substr(sep + 1), Gid);

    /* unknown numeric user has no primary group */
    if (!known)
        return TError(EError::InvalidValue, "Cannot find user: " + user);

    return OK;
}
