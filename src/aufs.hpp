#pragma once

#include <map>
#include <string>
#include <vector>

#include "common.hpp"
#include "tar.hpp"
#include "util/path.hpp"

/*
 * AUFS keeps real content of hardlinked files under .wh..wh.plnk,
 * links elsewhere in the layer point there. Content is staged in
 * private scratch directory which is created on first capture and
 * removed with the object.
 */
class TAufsLinks : public TNonCopyable {
    TPath Parent;
    std::string Prefix;
    TPath Scratch;
    std::map<std::string, TTarEntry> Entries;

public:
    TAufsLinks(const TPath &parent, const std::string &prefix) :
        Parent(parent), Prefix(prefix) {}
    ~TAufsLinks();

    /* True if link target lies inside .wh..wh.plnk */
    static bool IsLinkTarget(const std::string &linkname);

    TError Capture(const TTarEntry &entry, TInputStream &content,
                   std::vector<char> &buffer);

    /* Returns copy of captured entry and opened content */
    TError Resolve(const std::string &linkname, TTarEntry &entry, TFile &content) const;

    const TPath &ScratchDir() const { return Scratch; }
    size_t Size() const { return Entries.size(); }

    TError Cleanup();
};
