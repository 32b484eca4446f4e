#pragma once

#include <string>

#include "common.hpp"
#include "stream.hpp"
#include "util/string.hpp"

extern "C" {
#include <sys/types.h>
#include <time.h>
#include <archive_entry.h>
}

enum class ETarType {
    Regular,
    Hardlink,
    Symlink,
    CharDevice,
    BlockDevice,
    Directory,
    Fifo,
};

struct TTarEntry {
    std::string Name;
    ETarType Type = ETarType::Regular;
    std::string LinkName;
    unsigned Mode = 0;
    uid_t Uid = 0;
    gid_t Gid = 0;
    std::string UserName;
    std::string GroupName;
    int64_t Size = 0;
    struct timespec ModTime = { 0, 0 };
    struct timespec AccessTime = { 0, 0 };
    bool HasAccessTime = false;
    unsigned DevMajor = 0;
    unsigned DevMinor = 0;

    /* SCHILY.xattr.<name> records */
    TStringMap Xattrs;

    /* SCHILY.fflags, for example "schg,nodump" */
    std::string FileFlags;

    bool IsDirectory() const { return Type == ETarType::Directory; }
    bool IsRegular() const { return Type == ETarType::Regular; }

    std::string TypeName() const;

    TError Load(struct archive_entry *entry);
};

/*
 * Sequential reader of ustar, gnu and pax archives.
 * Source must be already decompressed.
 */
class TTarReader : public TArchiveInputStream {
    bool Opened = false;
    bool Done = false;

protected:
    TError Setup() override;

public:
    TTarReader(TInputStream &source) : TArchiveInputStream(source) {}

    /* found == false at end of archive */
    TError Next(TTarEntry &entry, bool &found);
};
