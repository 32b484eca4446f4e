#include <sstream>
#include <algorithm>
#include <cstring>
#include <cstdlib>

#include "path.hpp"
#include "util/string.hpp"

extern "C" {
#include <unistd.h>
#include <sys/types.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/ioctl.h>
#include <fcntl.h>
#include <linux/limits.h>
#include <linux/fs.h>
#include <sys/syscall.h>
#include <dirent.h>
}

TPath TPath::DirNameNormal() const {
    auto sep = Path.rfind('/');
    if (sep == std::string::npos)
        return Path.empty() ? "" : ".";
    if (sep == 0)
        return "/";
    return Path.substr(0, sep);
}

std::string TPath::BaseNameNormal() const {
    auto sep = Path.rfind('/');
    if (sep == std::string::npos || Path.size() == 1)
        return Path;
    return Path.substr(sep + 1);
}

TPath TPath::DirName() const {
    return NormalPath().DirNameNormal();
}

std::string TPath::BaseName() const {
    return NormalPath().BaseNameNormal();
}

TError TPath::StatStrict(struct stat &st) const {
    if (lstat(Path.c_str(), &st))
        return TError::System("lstat " + Path);
    return OK;
}

bool TPath::IsRegularStrict() const {
    struct stat st;
    return !lstat(c_str(), &st) && S_ISREG(st.st_mode);
}

bool TPath::IsDirectoryStrict() const {
    struct stat st;
    return !lstat(c_str(), &st) && S_ISDIR(st.st_mode);
}

bool TPath::IsDirectoryFollow() const {
    struct stat st;
    return !stat(c_str(), &st) && S_ISDIR(st.st_mode);
}

bool TPath::Exists() const {
    return access(Path.c_str(), F_OK) == 0;
}

bool TPath::PathExists() const {
    struct stat st;
    return lstat(Path.c_str(), &st) == 0;
}

std::string TPath::ToString() const {
    return Path;
}

TPath TPath::AddComponent(const TPath &component) const {
    if (component.IsAbsolute()) {
        if (IsRoot())
            return TPath(component.Path);
        if (component.IsRoot())
            return TPath(Path);
        return TPath(Path + component.Path);
    }
    if (IsRoot())
        return TPath("/" + component.Path);
    if (component.IsEmpty())
        return TPath(Path);
    return TPath(Path + "/" + component.Path);
}

TError TPath::Lchown(uid_t uid, gid_t gid) const {
    if (lchown(Path.c_str(), uid, gid))
        return TError::System("lchown(" + Path + ", " +
                        std::to_string(uid) + ", " + std::to_string(gid) + ")");
    return OK;
}

TError TPath::Chmod(const int mode) const {
    int ret = chmod(Path.c_str(), mode);
    if (ret)
        return TError::System("chmod({}, {:#o})", Path, mode);

    return OK;
}

TError TPath::ReadLink(TPath &value) const {
    char buf[PATH_MAX];
    ssize_t len;

    len = readlink(Path.c_str(), buf, sizeof(buf) - 1);
    if (len < 0)
        return TError::System("readlink(" + Path + ")");

    buf[len] = '\0';

    value = TPath(buf);
    return OK;
}

TError TPath::Hardlink(const TPath &target) const {
    int ret = link(target.c_str(), Path.c_str());
    if (ret)
        return TError::System("link(" + target.ToString() + ", " + Path + ")");
    return OK;
}

TError TPath::Symlink(const TPath &target) const {
    int ret = symlink(target.c_str(), Path.c_str());
    if (ret)
        return TError::System("symlink(" + target.ToString() + ", " + Path + ")");
    return OK;
}

TError TPath::Mknod(unsigned int mode, unsigned int dev) const {
    int ret = mknod(Path.c_str(), mode, dev);
    if (ret)
        return TError::System("mknod({}, {:#o}, {:#x})", Path, mode, dev);
    return OK;
}

TPath TPath::NormalPath() const {
    std::stringstream ss(Path);
    std::string component, path;

    if (IsEmpty())
        return TPath();

    if (IsAbsolute())
        path = "/";

    while (std::getline(ss, component, '/')) {

        if (component == "" || component == ".")
            continue;

        if (component == "..") {
            auto last = path.rfind('/');

            if (last == std::string::npos) {
                /* a/.. */
                if (!path.empty() && path != "..") {
                    path = "";
                    continue;
                }
            } else if (path.compare(last + 1, std::string::npos, "..") != 0) {
                if (last == 0)
                    path.erase(last + 1);   /* /.. or /a/.. */
                else
                    path.erase(last);       /* a/b/.. */
                continue;
            }
        }

        if (!path.empty() && path != "/")
            path += "/";
        path += component;
    }

    if (path.empty())
        path = ".";

    return TPath(path);
}

TPath TPath::AbsolutePath(const TPath &base) const {
    if (IsAbsolute() || IsEmpty())
        return TPath(Path);

    if (base)
        return base / Path;

    char cwd[PATH_MAX];
    if (!getcwd(cwd, sizeof(cwd)))
        return TPath();

    return TPath(cwd) / Path;
}

TPath TPath::RealPath() const {
    char *p = realpath(Path.c_str(), NULL);
    if (!p)
        return Path;

    TPath path(p);

    free(p);
    return path;
}

/*
 * Lexical path of this relative to base, both must be absolute:
 *
 * "/a/b/c".RelativePath("/a") -> "b/c"
 * "/a/x".RelativePath("/a/b") -> "../x"
 */
TPath TPath::RelativePath(const TPath &base) const {
    if (!IsAbsolute() || !base.IsAbsolute())
        return TPath();

    std::string rel = NormalPath().Path;
    std::string pre = base.NormalPath().Path;

    while (pre.size()) {
        auto a = pre.find('/');
        auto b = rel.find('/');
        if (pre.substr(0, a) != rel.substr(0, b))
            break;
        pre = a != std::string::npos ? pre.substr(a + 1) : "";
        rel = b != std::string::npos ? rel.substr(b + 1) : "";
    }

    while (pre.size()) {
        auto a = pre.find('/');
        pre = a != std::string::npos ? pre.substr(a + 1) : "";
        rel = rel.size() ? "../" + rel : "..";
    }

    return rel.size() ? rel : ".";
}

/*
 * Returns relative or absolute path inside this or
 * empty path if argument path is not inside:
 *
 * "/root".InnerPath("/root/foo", true) -> "/foo"
 * "/root".InnerPath("/foo", true) -> ""
 */
TPath TPath::InnerPath(const TPath &path, bool absolute) const {

    unsigned len = Path.length();

    /* check prefix */
    if (!len || path.Path.compare(0, len, Path) != 0)
        return TPath();

    /* exact match */
    if (path.Path.length() == len) {
        if (absolute)
            return TPath("/");
        else
            return TPath(".");
    }

    /* prefix "/" act as "" */
    if (len == 1 && Path[0] == '/')
        len = 0;

    /* '/' must follow prefix */
    if (path.Path[len] != '/')
        return TPath();

    /* cut prefix */
    if (absolute)
        return TPath(path.Path.substr(len));
    else
        return TPath(path.Path.substr(len + 1));
}

bool TPath::IsInside(const TPath &base) const {
    return !base.InnerPath(*this).IsEmpty();
}

TError TPath::Unlink() const {
    if (unlink(c_str()))
        return TError::System("unlink(" + Path + ")");
    return OK;
}

TError TPath::Mkdir(unsigned int mode) const {
    if (mkdir(Path.c_str(), mode) < 0)
        return TError(errno == ENOSPC ? EError::NoSpace :
                                        EError::Unknown,
                      errno, "mkdir({}, {:#o})", Path, mode);
    return OK;
}

TError TPath::MkdirAll(unsigned int mode) const {
    std::vector<TPath> paths;
    TPath path(Path);
    TError error;

    while (!path.PathExists()) {
        paths.push_back(path);
        path = path.DirName();
    }

    if (!path.IsDirectoryFollow())
        return TError(EError::Unknown, ENOTDIR, "Not a directory: {}", path);

    for (auto path = paths.rbegin(); path != paths.rend(); path++) {
        error = path->Mkdir(mode);
        if (error && error.Errno != EEXIST)
            return error;
    }

    return OK;
}

TError TPath::MkdirTmp(const TPath &parent, const std::string &prefix, unsigned int mode) {
    Path = (parent / (prefix + "XXXXXX")).Path;
    if (!mkdtemp(&Path[0]))
        return TError::System("mkdtemp(" + Path + ")");
    if (mode != 0700)
        return Chmod(mode);
    return OK;
}

TError TPath::Rmdir() const {
    if (rmdir(Path.c_str()) < 0)
        return TError::System("rmdir(" + Path + ")");
    return OK;
}

/*
 * Removes everything in the directory but not directory itself.
 * Works only on one filesystem and aborts if sees mountpint.
 */
TError TPath::ClearDirectory() const {
    TPathWalk walk;
    TError error;

    error = walk.OpenNoStat(*this);
    while (!error) {
        error = walk.Next();
        if (error || !walk.Path)
            break;
        if (walk.Directory) {
            if (!walk.Postorder || !walk.Level())
                continue;
            error = walk.Path.Rmdir();
        } else
            error = walk.Path.Unlink();
        if (error && error.Errno == ENOENT)
            error = OK;
    }

    return error;
}

TError TPath::RemoveAll() const {
    if (IsDirectoryStrict()) {
        TError error = ClearDirectory();
        if (error)
            return error;
        return Rmdir();
    }
    return Unlink();
}

TError TPath::ReadDirectory(std::vector<std::string> &result) const {
    struct dirent *de;
    DIR *dir;

    result.clear();
    dir = opendir(c_str());
    if (!dir)
        return TError::System("Cannot open directory " + Path);

    while ((de = readdir(dir))) {
        if (strcmp(de->d_name, ".") && strcmp(de->d_name, ".."))
            result.push_back(std::string(de->d_name));
    }
    closedir(dir);
    return OK;
}

TError TPath::GetXAttr(const std::string &name, std::string &value) const {
    ssize_t size = syscall(SYS_lgetxattr, Path.c_str(), name.c_str(), nullptr, 0);
    if (size >= 0) {
        value.resize(size);
        if (syscall(SYS_lgetxattr, Path.c_str(), name.c_str(), &value[0], size) >= 0)
            return OK;
    }
    return TError::System("getxattr(" + Path + ", " + name + ")");
}

TError TPath::SetXAttr(const std::string &name, const std::string &value) const {
    if (syscall(SYS_lsetxattr, Path.c_str(), name.c_str(),
                value.c_str(), value.length(), 0))
        return TError::System("setxattr {} {}", Path, name);
    return OK;
}

TError TPath::GetAttr(unsigned &flags) const {
    TError error;
    TFile file;

    error = file.Open(*this, O_RDONLY | O_CLOEXEC | O_NOFOLLOW |
                             O_NOCTTY | O_NONBLOCK);
    if (error)
        return error;
    return TFile::GetAttr(file.Fd, flags);
}

TError TPath::Chattr(unsigned add_flags, unsigned del_flags) const {
    TError error;
    TFile file;

    error = file.Open(*this, O_RDONLY | O_CLOEXEC | O_NOFOLLOW |
                             O_NOCTTY | O_NONBLOCK);
    if (error)
        return error;
    error = TFile::Chattr(file.Fd, add_flags, del_flags);
    if (error)
        return TError(error, "Cannot chattr {}", Path);
    return OK;
}

TError TPath::Utimes(const struct timespec &atime, const struct timespec &mtime) const {
    struct timespec ts[2] = { atime, mtime };
    if (utimensat(AT_FDCWD, c_str(), ts, AT_SYMLINK_NOFOLLOW))
        return TError::System("utimensat " + Path);
    return OK;
}

TError TPath::ReadAll(std::string &text, size_t max) const {
    TError error;
    TFile file;

    error = file.OpenRead(*this);
    if (error)
        return error;

    error = file.ReadAll(text, max);
    if (error)
        return TError(error, "Cannot read {}", Path);

    return OK;
}

TError TPath::WriteAll(const std::string &text) const {
    TError error;
    TFile file;

    error = file.CreateTrunc(*this, 0644);
    if (error)
        return error;

    error = file.WriteAll(text);
    if (error)
        return TError(error, "Cannot write {}", Path);

    return OK;
}

TError TFile::Open(const TPath &path, int flags) {
    if (Fd >= 0)
        close(Fd);
    SetFd = open(path.c_str(), flags);
    if (Fd < 0)
        return TError::System("Cannot open " + path.ToString());
    return OK;
}

TError TFile::OpenRead(const TPath &path) {
    return Open(path, O_RDONLY | O_CLOEXEC | O_NOCTTY);
}

TError TFile::Create(const TPath &path, int flags, int mode) {
    if (Fd >= 0)
        close(Fd);
    SetFd = open(path.c_str(), flags, mode);
    if (Fd < 0)
        return TError(errno == ENOSPC ? EError::NoSpace : EError::Unknown,
                      errno, "Cannot create " + path.ToString());
    return OK;
}

TError TFile::CreateTrunc(const TPath &path, int mode) {
    return Create(path, O_RDWR | O_CREAT | O_TRUNC | O_CLOEXEC, mode);
}

void TFile::Close(void) {
    if (Fd >= 0)
        close(Fd);
    SetFd = -1;
}

TError TFile::ReadAll(std::string &text, size_t max) const {
    struct stat st;
    if (fstat(Fd, &st) < 0)
        return TError::System("fstat");

    if (st.st_size > (off_t)max)
        return TError("File too large: {}", st.st_size);

    size_t size = st.st_size;
    if (st.st_size < 4096)
        size = 4096;
    text.resize(size);

    size_t off = 0;
    ssize_t ret;
    do {
        if (size - off < 1024) {
            size += 16384;
            if (size > max)
                return TError("File too large: {}", size);
            text.resize(size);
        }
        ret = read(Fd, &text[off], size - off);
        if (ret < 0)
            return TError::System("read");
        off += ret;
    } while (ret > 0);

    text.resize(off);

    return OK;
}

TError TFile::WriteAll(const char *data, size_t len) const {
    size_t off = 0;
    while (off < len) {
        ssize_t ret = write(Fd, data + off, len - off);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            return TError(errno == ENOSPC ? EError::NoSpace : EError::Unknown,
                          errno, "write");
        }
        off += ret;
    }
    return OK;
}

TError TFile::WriteAll(const std::string &text) const {
    return WriteAll(text.data(), text.size());
}

TError TFile::GetAttr(int fd, unsigned &flags) {
    if (ioctl(fd, FS_IOC_GETFLAGS, &flags))
        return TError::System("ioctl(FS_IOC_GETFLAGS)");
    return OK;
}

TError TFile::Chattr(int fd, unsigned add_flags, unsigned del_flags) {
    unsigned old_flags, new_flags;

    if (ioctl(fd, FS_IOC_GETFLAGS, &old_flags))
        return TError::System("ioctl(FS_IOC_GETFLAGS)");

    new_flags = (old_flags & ~del_flags) | add_flags;
    if ((new_flags != old_flags) && ioctl(fd, FS_IOC_SETFLAGS, &new_flags))
        return TError::System("ioctl(FS_IOC_SETFLAGS)");

    return OK;
}

int TPathWalk::CompareNames(const FTSENT **a, const FTSENT **b) {
    return strcmp((**a).fts_name, (**b).fts_name);
}

TError TPathWalk::Open(const TPath &path, int fts_flags,
                       int (*compar)(const FTSENT **, const FTSENT **)) {
    Close();
    char* paths[] = { (char *)path.c_str(), nullptr };
    Fts = fts_open(paths, fts_flags, compar);
    if (!Fts)
        return TError::System("fts_open");
    return OK;
}

TError TPathWalk::OpenList(const TPath &path)
{
    return Open(path, FTS_COMFOLLOW | FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, TPathWalk::CompareNames);
}

TError TPathWalk::OpenNoStat(const TPath &path)
{
    return Open(path, FTS_COMFOLLOW | FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV | FTS_NOSTAT, nullptr);
}

TError TPathWalk::Next() {
next:
    errno = 0;
    Ent = fts_read(Fts);
    if (!Ent) {
        if (errno)
            return TError(EError::Unknown, errno, "fts_read");
        Path = "";
        return OK;
    }
    switch (Ent->fts_info) {
    case FTS_DNR:
        if (Ent->fts_errno == ENOTDIR)
            goto next;
        // fall through
    case FTS_ERR:
    case FTS_NS:
        if (Ent->fts_errno == ENOENT)
            goto next;
        return TError(EError::Unknown, Ent->fts_errno, "fts_read {}", Ent->fts_path);
    case FTS_D:
    case FTS_DC:
        Directory = true;
        Postorder = false;
        break;
    case FTS_DP:
        Directory = true;
        Postorder = true;
        break;
    default:
        Directory = false;
        Postorder = false;
        break;
    }
    Path = Ent->fts_path;
    Stat = Ent->fts_statp;
    return OK;
}

void TPathWalk::Close() {
    if (Fts)
        fts_close(Fts);
    Fts = nullptr;
}
