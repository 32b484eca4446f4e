#pragma once

#include <set>
#include <string>

#include "common.hpp"
#include "policy.hpp"
#include "tar.hpp"
#include "util/path.hpp"

/*
 * AUFS conventions, shared by overlay layers:
 *
 * .wh.<name>           <name> is deleted in this layer
 * <dir>/.wh..wh..opq   everything in <dir> from lower layers is hidden
 * .wh..wh.plnk/<name>  real content of hardlinks elsewhere in the layer
 * .wh..wh.*            other aufs metadata, ignored
 */
enum class EWhiteoutAction {
    None,
    CaptureLink,
    SkipMeta,
    Whiteout,
    Opaque,
};

/* Decides by cleaned entry name before destination path is known */
EWhiteoutAction ClassifyMetaEntry(const std::string &name, const TTarEntry &entry);

/* Decides by base name of validated destination path */
EWhiteoutAction ClassifyWhiteout(const TPath &path);

std::string WhiteoutActionName(EWhiteoutAction action);

/* Removes sibling hidden by whiteout marker at path, absence is fine */
TError ApplyWhiteout(const TPath &path, const TPath &root, const TPathPolicy &policy);

/* Removes children of dir not unpacked in this run, dir may be missing */
TError ApplyOpaque(const TPath &dir, const std::set<std::string> &unpacked);
