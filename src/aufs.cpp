#include "aufs.hpp"
#include "materialize.hpp"
#include "util/log.hpp"

extern "C" {
#include <fcntl.h>
}

TAufsLinks::~TAufsLinks() {
    TError error = Cleanup();
    if (error)
        L_WRN("Cannot remove aufs scratch directory: {}", error);
}

TError TAufsLinks::Cleanup() {
    if (!Scratch)
        return OK;

    L_DBG("Remove aufs scratch directory {}", Scratch);

    TError error = Scratch.RemoveAll();
    if (error && error.Errno != ENOENT)
        return error;

    Scratch = TPath();
    Entries.clear();
    return OK;
}

bool TAufsLinks::IsLinkTarget(const std::string &linkname) {
    return TPath(linkname).NormalPath().DirNameNormal() == WHITEOUT_LINK_DIR;
}

TError TAufsLinks::Capture(const TTarEntry &entry, TInputStream &content,
                           std::vector<char> &buffer) {
    std::string base = TPath(entry.Name).BaseName();
    uint64_t total;
    TError error;
    TFile file;

    if (!Scratch) {
        error = Scratch.MkdirTmp(Parent, Prefix, 0700);
        if (error) {
            Scratch = TPath();
            return TError(error, "Cannot create aufs scratch directory");
        }
        L_DBG("Created aufs scratch directory {}", Scratch);
    }

    error = file.Create(Scratch / base, O_CREAT | O_TRUNC | O_WRONLY |
                                        O_NOFOLLOW | O_CLOEXEC, 0600);
    if (error)
        return error;

    error = CopyContent(file, content, buffer, total);
    if (error)
        return TError(error, "Cannot capture aufs hardlink source {}", entry.Name);

    Entries[base] = entry;

    L_DBG("Captured aufs hardlink source {} {} bytes", entry.Name, total);
    return OK;
}

TError TAufsLinks::Resolve(const std::string &linkname, TTarEntry &entry,
                           TFile &content) const {
    std::string base = TPath(linkname).BaseName();

    auto it = Entries.find(base);
    if (it == Entries.end())
        return TError(EError::InvalidHardlink, "Invalid aufs hardlink {}: source is not captured",
                      linkname);

    TError error = content.Open(Scratch / base, O_RDONLY | O_CLOEXEC | O_NOFOLLOW);
    if (error)
        return error;

    entry = it->second;
    return OK;
}
