#include "whiteout.hpp"
#include "materialize.hpp"
#include "util/log.hpp"

#include <algorithm>

EWhiteoutAction ClassifyMetaEntry(const std::string &name, const TTarEntry &entry) {
    if (!StringStartsWith(name, WHITEOUT_META_PREFIX))
        return EWhiteoutAction::None;

    if (entry.IsRegular() && TPath(name).DirNameNormal() == WHITEOUT_LINK_DIR)
        return EWhiteoutAction::CaptureLink;

    /* opaque marker of the root directory */
    if (name == WHITEOUT_OPAQUE_DIR)
        return EWhiteoutAction::None;

    return EWhiteoutAction::SkipMeta;
}

EWhiteoutAction ClassifyWhiteout(const TPath &path) {
    std::string base = path.BaseNameNormal();

    if (!StringStartsWith(base, WHITEOUT_PREFIX))
        return EWhiteoutAction::None;

    if (base == WHITEOUT_OPAQUE_DIR)
        return EWhiteoutAction::Opaque;

    return EWhiteoutAction::Whiteout;
}

std::string WhiteoutActionName(EWhiteoutAction action) {
    switch (action) {
    case EWhiteoutAction::None:
        return "none";
    case EWhiteoutAction::CaptureLink:
        return "capture";
    case EWhiteoutAction::SkipMeta:
        return "skip";
    case EWhiteoutAction::Whiteout:
        return "whiteout";
    case EWhiteoutAction::Opaque:
        return "opaque";
    }
    return "unknown";
}

TError ApplyWhiteout(const TPath &path, const TPath &root, const TPathPolicy &policy) {
    std::string base = path.BaseNameNormal();
    std::string name = base.substr(std::string(WHITEOUT_PREFIX).size());
    struct stat st;
    TError error;

    if (name == "" || name == "." || name == "..")
        return TError(EError::Breakout, "Invalid whiteout {}", path);

    TPath target = path.DirNameNormal() / name;
    TPath rel = target.RelativePath(root);
    if (rel.IsEmpty() || rel == "." || IsBreakout(rel, policy))
        return TError(EError::Breakout, "Whiteout {} is outside of {}", target, root);

    error = target.StatStrict(st);
    if (error) {
        if (error.Errno == ENOENT)
            return OK;
        return error;
    }

    error = ResetImmutable(target, &st);
    if (error)
        return error;

    L_DBG("Whiteout {}", target);

    error = target.RemoveAll();
    if (error && error.Errno != ENOENT)
        return TError(error, "Cannot remove {}", target);

    if (Statistics)
        Statistics->Whiteouts++;

    return OK;
}

TError ApplyOpaque(const TPath &dir, const std::set<std::string> &unpacked) {
    std::vector<std::string> names;
    TError error;

    error = dir.ReadDirectory(names);
    if (error) {
        /* already removed by previous entry */
        if (error.Errno == ENOENT)
            return OK;
        return error;
    }

    std::sort(names.begin(), names.end());

    for (auto &name: names) {
        TPath path = dir / name;

        if (unpacked.count(path.ToString())) {
            if (path.IsDirectoryStrict()) {
                error = ApplyOpaque(path, unpacked);
                if (error)
                    return error;
            }
            continue;
        }

        L_DBG("Opaque {} hides {}", dir, path);

        error = ResetImmutable(path, nullptr);
        if (error) {
            if (error.Errno == ENOENT)
                continue;
            return error;
        }

        error = path.RemoveAll();
        if (error && error.Errno != ENOENT)
            return TError(error, "Cannot remove {}", path);
    }

    return OK;
}
