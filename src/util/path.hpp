#pragma once

#include <string>
#include <vector>

#include "util/error.hpp"
#include "util/cred.hpp"
#include "util/string.hpp"

extern "C" {
#include <sys/stat.h>
#include <fts.h>
}

class TPath {
private:
    std::string Path;
    friend class TFile;

    TPath AddComponent(const TPath &component) const;

public:
    TPath(const std::string &path) : Path(path) {}
    TPath(const char *path) : Path(path) {}
    TPath() : Path("") {}

    bool IsAbsolute() const { return Path[0] == '/'; }

    bool IsRoot() const { return Path == "/"; }

    bool IsEmpty() const { return Path.empty(); }

    explicit operator bool() const { return !Path.empty(); }

    bool IsInside(const TPath &base) const;

    const char *c_str() const noexcept { return Path.c_str(); }

    TPath operator+(const TPath &p) const {
        return TPath(Path + p.ToString());
    }

    friend bool operator==(const TPath& a, const TPath& b) {
        return a.ToString() == b.ToString();
    }

    friend bool operator!=(const TPath& a, const TPath& b) {
        return a.ToString() != b.ToString();
    }

    friend bool operator<(const TPath& a, const TPath& b) {
        return a.ToString() < b.ToString();
    }

    friend std::ostream& operator<<(std::ostream& os, const TPath& path) {
        return os << path.ToString();
    }

    friend TPath operator/(const TPath& a, const TPath &b) {
        return a.AddComponent(b);
    }

    TPath& operator/=(const TPath &b) {
        *this = AddComponent(b);
        return *this;
    }

    TPath NormalPath() const;

    TPath DirNameNormal() const;
    std::string BaseNameNormal() const;

    TPath DirName() const;
    std::string BaseName() const;

    TPath AbsolutePath(const TPath &base = "") const;
    TPath RealPath() const;
    TPath RelativePath(const TPath &base) const;
    TPath InnerPath(const TPath &path, bool absolute = true) const;

    TError StatStrict(struct stat &st) const;

    bool IsRegularStrict() const;
    bool IsDirectoryStrict() const;
    bool IsDirectoryFollow() const;

    std::string ToString() const;
    bool Exists() const;
    bool PathExists() const; /* or dangling symlink */

    TError Lchown(uid_t uid, gid_t gid) const;

    TError Chmod(const int mode) const;
    TError ReadLink(TPath &value) const;
    TError Hardlink(const TPath &target) const;
    TError Symlink(const TPath &target) const;
    TError Mknod(unsigned int mode, unsigned int dev) const;
    TError Mkdir(unsigned int mode) const;
    TError MkdirAll(unsigned int mode) const;
    TError MkdirTmp(const TPath &parent, const std::string &prefix, unsigned int mode);
    TError Rmdir() const;
    TError Unlink() const;
    TError RemoveAll() const;
    TError ReadDirectory(std::vector<std::string> &result) const;
    TError ClearDirectory() const;
    TError GetXAttr(const std::string &name, std::string &value) const;
    TError SetXAttr(const std::string &name, const std::string &value) const;
    TError GetAttr(unsigned &flags) const;
    TError Chattr(unsigned add_flags, unsigned del_flags) const;
    TError Utimes(const struct timespec &atime, const struct timespec &mtime) const;

    TError ReadAll(std::string &text, size_t max = 1048576) const;
    TError WriteAll(const std::string &text) const;
};

template <> struct fmt::formatter<TPath> : fmt::ostream_formatter {};

class TFile {
private:
    TFile(const TFile&) = delete;
    TFile& operator=(const TFile&) = delete;

public:
    union {
        const int Fd;
        int SetFd;
    };
    TFile() : Fd(-1) { }
    TFile(int fd) : Fd(fd) { }
    ~TFile() { Close(); }
    explicit operator bool() const { return Fd >= 0; }
    TError Open(const TPath &path, int flags);
    TError OpenRead(const TPath &path);
    TError Create(const TPath &path, int flags, int mode);
    TError CreateTrunc(const TPath &path, int mode);
    void Close(void);
    TError ReadAll(std::string &text, size_t max) const;
    TError WriteAll(const std::string &text) const;
    TError WriteAll(const char *data, size_t len) const;
    static TError GetAttr(int fd, unsigned &flags);
    static TError Chattr(int fd, unsigned add_flags, unsigned del_flags);
};

class TPathWalk {
private:
    TPathWalk(const TPathWalk&) = delete;
    TPathWalk& operator=(const TPathWalk&) = delete;

public:
    FTS *Fts = nullptr;
    FTSENT *Ent = nullptr;
    TPath Path;
    struct stat *Stat;
    bool Directory = false;
    bool Postorder = false;

    static int CompareNames(const FTSENT **a, const FTSENT **b);

    TPathWalk() {}
    ~TPathWalk() { Close(); }
    TError Open(const TPath &path, int fts_flags = FTS_COMFOLLOW | FTS_NOCHDIR | FTS_PHYSICAL | FTS_XDEV, int (*compar)(const FTSENT **, const FTSENT **) = nullptr);
    TError OpenList(const TPath &path);
    TError OpenNoStat(const TPath &path);
    TError Next();
    std::string Name() { return Ent ? Ent->fts_name : ""; }
    int Level() { return Ent ? Ent->fts_level : -2; }
    void Close();
};
