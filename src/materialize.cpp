#include "materialize.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

extern "C" {
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/sysmacros.h>
#include <linux/fs.h>
}

static bool FlagsNotSupported(const TError &error) {
    return error.Errno == ENOTTY || error.Errno == ENOTSUP ||
           error.Errno == EOPNOTSUPP || error.Errno == EINVAL;
}

TError ParseFileFlags(const std::string &text, unsigned &flags) {
    flags = 0;
    for (auto &name: SplitString(text, ',')) {
        std::string flag = StringTrim(name);
        if (flag == "schg" || flag == "uchg" ||
                flag == "simmutable" || flag == "uimmutable")
            flags |= FS_IMMUTABLE_FL;
        else if (flag == "sappnd" || flag == "uappnd" ||
                 flag == "sappend" || flag == "uappend")
            flags |= FS_APPEND_FL;
        else if (flag == "nodump")
            flags |= FS_NODUMP_FL;
        else if (flag != "")
            return TError(EError::InvalidValue, "Unknown file flag: {}", flag);
    }
    return OK;
}

TError ResetImmutable(const TPath &path, const struct stat *st) {
    struct stat buf;
    unsigned flags;
    TError error;

    if (!st) {
        error = path.StatStrict(buf);
        if (error)
            return error;
        st = &buf;
    }

    /* attributes are defined only for files and directories */
    if (!S_ISREG(st->st_mode) && !S_ISDIR(st->st_mode))
        return OK;

    error = path.GetAttr(flags);
    if (error) {
        if (FlagsNotSupported(error) || error.Errno == EACCES)
            return OK;
        return error;
    }

    if (!(flags & (FS_IMMUTABLE_FL | FS_APPEND_FL)))
        return OK;

    L_VERBOSE("Reset immutable flags of {}", path);
    return path.Chattr(0, FS_IMMUTABLE_FL | FS_APPEND_FL);
}

TError WriteFileFlags(const TPath &path, const TTarEntry &entry) {
    unsigned flags;
    TError error;

    if (entry.FileFlags.empty())
        return OK;

    if (!entry.IsRegular() && !entry.IsDirectory())
        return OK;

    error = ParseFileFlags(entry.FileFlags, flags);
    if (error) {
        L_WRN("Ignore file flags of {}: {}", path, error);
        return OK;
    }

    if (!flags)
        return OK;

    error = path.Chattr(flags, 0);
    if (error) {
        if (!FlagsNotSupported(error))
            return error;
        L_WRN("Cannot set file flags {} at {}: {}", entry.FileFlags, path, error);
    }

    return OK;
}

TError CopyContent(const TFile &file, TInputStream &content,
                   std::vector<char> &buffer, uint64_t &total) {
    TError error;
    size_t got;

    total = 0;
    while (true) {
        error = content.Read(buffer.data(), buffer.size(), got);
        if (error)
            return error;
        if (!got)
            return OK;
        error = file.WriteAll(buffer.data(), got);
        if (error)
            return error;
        total += got;
    }
}

TError ExtractEntry(const TPath &path, const TPath &root, const TTarEntry &entry,
                    TInputStream &content, const TExtractOptions &options,
                    std::vector<char> &buffer) {
    unsigned mode = entry.Mode & 07777;
    TError error;

    switch (entry.Type) {
    case ETarType::Directory:
        /* keep existing directory, replace/merge done by caller */
        if (!path.IsDirectoryStrict()) {
            error = path.Mkdir(mode);
            if (error)
                return error;
        }
        break;

    case ETarType::Regular:
    {
        TFile file;
        uint64_t total;

        error = file.Create(path, O_CREAT | O_TRUNC | O_WRONLY | O_NOFOLLOW |
                                  O_CLOEXEC | O_NOCTTY, mode);
        if (error)
            return error;

        error = CopyContent(file, content, buffer, total);
        if (error)
            return TError(error, "Cannot write {}", path);

        if (Statistics)
            Statistics->BytesApplied += total;
        break;
    }

    case ETarType::CharDevice:
    case ETarType::BlockDevice:
        /* cannot create devices in user namespace */
        if (options.InUserNS) {
            L_DBG("Skip device {} in user namespace", path);
            return OK;
        }
        error = path.Mknod(mode | (entry.Type == ETarType::CharDevice ? S_IFCHR : S_IFBLK),
                           makedev(entry.DevMajor, entry.DevMinor));
        if (error)
            return error;
        break;

    case ETarType::Fifo:
        error = path.Mknod(mode | S_IFIFO, 0);
        if (error)
            return error;
        break;

    case ETarType::Hardlink:
    {
        TPath target = (root / TPath(entry.LinkName).NormalPath()).NormalPath();
        if (!target.IsInside(root))
            return TError(EError::Breakout, "Invalid hardlink {} -> {}: outside of {}",
                          path, entry.LinkName, root);
        /* directory symlinks on the way must not lead outside */
        TPath real = target.DirNameNormal().RealPath();
        if (!real.IsInside(root.RealPath()))
            return TError(EError::Breakout, "Invalid hardlink {} -> {}: {} is outside of {}",
                          path, entry.LinkName, real, root);
        error = path.Hardlink(target);
        if (error)
            return error;
        break;
    }

    case ETarType::Symlink:
    {
        TPath target = (path.DirNameNormal() / entry.LinkName).NormalPath();
        if (!target.IsInside(root))
            return TError(EError::Breakout, "Invalid symlink {} -> {}: outside of {}",
                          path, entry.LinkName, root);
        error = path.Symlink(entry.LinkName);
        if (error)
            return error;
        break;
    }
    }

    if (options.Lchown) {
        error = path.Lchown(entry.Uid, entry.Gid);
        if (error) {
            if (!options.IgnoreChownErrors)
                return TError(error, "Cannot chown {} to {}:{}", path, entry.Uid, entry.Gid);
            L_DBG("Ignore chown error: {}", error);
        }
    }

    if (options.ForceMode && entry.Type != ETarType::Symlink) {
        std::string value = fmt::format("{}:{}:0{:o}", entry.Uid, entry.Gid, mode);
        error = path.SetXAttr(LAYER_OVERRIDE_XATTR, value);
        if (error)
            L_WRN("Cannot record original owner and mode of {}: {}", path, error);
    }

    std::string xattrErrors;
    for (auto &it: entry.Xattrs) {
        error = path.SetXAttr(it.first, it.second);
        if (error) {
            if (error.Errno == ENOTSUP || error.Errno == EOPNOTSUPP ||
                    (options.InUserNS && error.Errno == EPERM)) {
                xattrErrors += (xattrErrors.empty() ? "" : " ") + it.first;
                continue;
            }
            return error;
        }
    }
    if (!xattrErrors.empty())
        L_WRN("Ignored xattrs {} of {}: not supported", xattrErrors, path);

    if (entry.Type != ETarType::Symlink && entry.Type != ETarType::Hardlink) {
        error = path.Chmod(options.ForceMode ? *options.ForceMode : mode);
        if (error)
            return error;
    }

    if (entry.Type != ETarType::Hardlink) {
        struct timespec atime = entry.HasAccessTime ? entry.AccessTime : entry.ModTime;
        if (atime.tv_sec < entry.ModTime.tv_sec ||
                (atime.tv_sec == entry.ModTime.tv_sec && atime.tv_nsec < entry.ModTime.tv_nsec))
            atime = entry.ModTime;
        error = path.Utimes(atime, entry.ModTime);
        if (error)
            return error;
    }

    if (entry.IsRegular())
        return WriteFileFlags(path, entry);

    return OK;
}
