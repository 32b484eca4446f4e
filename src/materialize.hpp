#pragma once

#include <vector>

#include "common.hpp"
#include "tar.hpp"
#include "util/path.hpp"

struct TExtractOptions {
    bool Lchown = true;
    bool InUserNS = false;
    bool IgnoreChownErrors = false;
    /* replaces entry mode, original is kept in override xattr */
    const unsigned *ForceMode = nullptr;
};

/*
 * Creates filesystem object for entry at path. Content is consumed for
 * regular files. Hardlink and symlink targets must stay inside root.
 */
TError ExtractEntry(const TPath &path, const TPath &root, const TTarEntry &entry,
                    TInputStream &content, const TExtractOptions &options,
                    std::vector<char> &buffer);

/* Clears immutable and append-only flags, st may be nullptr */
TError ResetImmutable(const TPath &path, const struct stat *st);

/* Applies SCHILY.fflags from entry */
TError WriteFileFlags(const TPath &path, const TTarEntry &entry);

/* Copies content until end of stream */
TError CopyContent(const TFile &file, TInputStream &content,
                   std::vector<char> &buffer, uint64_t &total);

TError ParseFileFlags(const std::string &text, unsigned &flags);
