#include "tar.hpp"
#include "util/log.hpp"

std::string TTarEntry::TypeName() const {
    switch (Type) {
    case ETarType::Regular:
        return "file";
    case ETarType::Hardlink:
        return "hardlink";
    case ETarType::Symlink:
        return "symlink";
    case ETarType::CharDevice:
        return "char device";
    case ETarType::BlockDevice:
        return "block device";
    case ETarType::Directory:
        return "directory";
    case ETarType::Fifo:
        return "fifo";
    }
    return "unknown";
}

/* names are kept as raw bytes, utf-8 is used if locale cannot hold them */
static std::string EntryString(const char *mbs, const char *utf8) {
    if (mbs)
        return mbs;
    if (utf8)
        return utf8;
    return "";
}

TError TTarEntry::Load(struct archive_entry *entry) {
    *this = TTarEntry();

    Name = EntryString(archive_entry_pathname(entry),
                       archive_entry_pathname_utf8(entry));
    if (Name.empty())
        return TError(EError::StreamError, "Entry without name");

    if (archive_entry_hardlink(entry) || archive_entry_hardlink_utf8(entry)) {
        Type = ETarType::Hardlink;
        LinkName = EntryString(archive_entry_hardlink(entry),
                               archive_entry_hardlink_utf8(entry));
    } else {
        switch (archive_entry_filetype(entry)) {
        case AE_IFREG:
            Type = ETarType::Regular;
            break;
        case AE_IFDIR:
            Type = ETarType::Directory;
            break;
        case AE_IFLNK:
            Type = ETarType::Symlink;
            LinkName = EntryString(archive_entry_symlink(entry),
                                   archive_entry_symlink_utf8(entry));
            break;
        case AE_IFCHR:
            Type = ETarType::CharDevice;
            break;
        case AE_IFBLK:
            Type = ETarType::BlockDevice;
            break;
        case AE_IFIFO:
            Type = ETarType::Fifo;
            break;
        default:
            return TError(EError::StreamError, "Unsupported tar entry type {:#o} for {}",
                          archive_entry_filetype(entry), Name);
        }
    }

    Mode = archive_entry_perm(entry) & 07777;
    Uid = archive_entry_uid(entry);
    Gid = archive_entry_gid(entry);
    UserName = EntryString(archive_entry_uname(entry), archive_entry_uname_utf8(entry));
    GroupName = EntryString(archive_entry_gname(entry), archive_entry_gname_utf8(entry));

    Size = archive_entry_size(entry);
    if (Size < 0)
        return TError(EError::StreamError, "Negative size {} of {}", Size, Name);

    ModTime.tv_sec = archive_entry_mtime(entry);
    ModTime.tv_nsec = archive_entry_mtime_nsec(entry);

    if (archive_entry_atime_is_set(entry)) {
        AccessTime.tv_sec = archive_entry_atime(entry);
        AccessTime.tv_nsec = archive_entry_atime_nsec(entry);
        HasAccessTime = true;
    }

    if (Type == ETarType::CharDevice || Type == ETarType::BlockDevice) {
        DevMajor = archive_entry_rdevmajor(entry);
        DevMinor = archive_entry_rdevminor(entry);
    }

    const char *name;
    const void *value;
    size_t size;

    archive_entry_xattr_reset(entry);
    while (archive_entry_xattr_next(entry, &name, &value, &size) == ARCHIVE_OK)
        Xattrs[name] = std::string((const char *)value, size);

    const char *fflags = archive_entry_fflags_text(entry);
    if (fflags)
        FileFlags = fflags;

    return OK;
}

TError TTarReader::Setup() {
    TError error;

    error = Check(archive_read_support_format_tar(Archive), "Cannot enable tar format");
    if (error)
        return error;

    /* layer without entries */
    return Check(archive_read_support_format_empty(Archive), "Cannot enable empty format");
}

TError TTarReader::Next(TTarEntry &entry, bool &found) {
    struct archive_entry *header;
    TError error;
    int ret;

    found = false;
    if (Done)
        return OK;

    if (!Opened) {
        error = Open();
        if (error)
            return error;
        Opened = true;
    }

    /* unread data of previous entry is skipped */
    ret = archive_read_next_header(Archive, &header);
    if (ret == ARCHIVE_EOF) {
        Done = true;
        return OK;
    }

    /* damaged headers are not resynced */
    error = Check(ret == ARCHIVE_RETRY ? ARCHIVE_FATAL : ret, "Cannot read tar header");
    if (error)
        return error;

    error = entry.Load(header);
    if (error)
        return error;

    L_DBG("Tar {} {} size {}", entry.TypeName(), entry.Name, entry.Size);

    found = true;
    return OK;
}
