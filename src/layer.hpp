#pragma once

#include <set>
#include <string>
#include <vector>

#include "common.hpp"
#include "aufs.hpp"
#include "policy.hpp"
#include "stream.hpp"
#include "tar.hpp"
#include "util/cred.hpp"
#include "util/idmap.hpp"
#include "util/path.hpp"

#include "config.pb.h"

struct TUnpackOptions {
    TIdMappings UidMaps;
    TIdMappings GidMaps;

    /* overrides owner of every entry */
    bool HasChown = false;
    TCred Chown;

    bool IgnoreChownErrors = false;
    bool InUserNS = false;

    bool HasForceMode = false;
    unsigned ForceMode = 0;

    /* nullptr - host policy */
    const TPathPolicy *Policy = nullptr;

    /* Fills defaults from unpack section of config */
    TError Load(const cfg::TConfig::TUnpackCfg &cfg);
};

/* Owner override wins, otherwise ids are translated to host */
TError RemapIds(TTarEntry &entry, const TIdMap &map, const TCred *chown);

/* Applies one layer onto root, state lives for one Unpack() */
class TLayerUnpacker : public TNonCopyable {
    TPath Root;
    TPath RealRoot;
    const TUnpackOptions &Options;
    const TPathPolicy &Policy;
    TIdMap IdMap;
    TAufsLinks Aufs;
    std::set<std::string> Unpacked;
    std::vector<std::pair<TPath, TTarEntry>> PendingDirs;
    std::vector<char> Buffer;
    uint64_t Size = 0;

    TError ApplyEntry(TTarReader &reader, TTarEntry &entry);
    TError PrepareParent(const TPath &path);
    TError ReplaceExisting(const TPath &path, const TTarEntry &entry);
    TError FinalizeDirectories();

public:
    TLayerUnpacker(const TPath &root, const TUnpackOptions &options);

    TError Unpack(TInputStream &stream, uint64_t &size);

    const TPath &ScratchDir() const { return Aufs.ScratchDir(); }
};

TError UnpackLayer(const TPath &dest, TInputStream &stream,
                   const TUnpackOptions &options, uint64_t &size);

/* Always decompress */
TError ApplyLayer(const TPath &dest, TInputStream &stream, uint64_t &size);
TError ApplyLayer(const TPath &dest, TInputStream &stream,
                  const TUnpackOptions &options, uint64_t &size);

/* Never decompress */
TError ApplyUncompressedLayer(const TPath &dest, TInputStream &stream,
                              const TUnpackOptions &options, uint64_t &size);
