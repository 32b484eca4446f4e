#include "layer.hpp"
#include "config.hpp"
#include "materialize.hpp"
#include "whiteout.hpp"
#include "util/log.hpp"
#include "util/unix.hpp"

extern "C" {
#include <stdlib.h>
#include <sys/stat.h>
}

TError TUnpackOptions::Load(const cfg::TConfig::TUnpackCfg &cfg) {
    TError error;

    error = FindPathPolicy(cfg.name_policy(), Policy);
    if (error)
        return error;

    UidMaps.clear();
    error = ParseIdMappings(cfg.uid_map(), UidMaps);
    if (error)
        return TError(error, "unpack.uid_map");

    GidMaps.clear();
    error = ParseIdMappings(cfg.gid_map(), GidMaps);
    if (error)
        return TError(error, "unpack.gid_map");

    IgnoreChownErrors = cfg.ignore_chown_errors();

    if (cfg.has_in_user_namespace())
        InUserNS = cfg.in_user_namespace();
    else
        InUserNS = InUserNamespace();

    return OK;
}

TError RemapIds(TTarEntry &entry, const TIdMap &map, const TCred *chown) {
    uid_t uid;
    gid_t gid;

    if (chown) {
        entry.Uid = chown->GetUid();
        entry.Gid = chown->GetGid();
        return OK;
    }

    TError error = map.ToHost(entry.Uid, entry.Gid, uid, gid);
    if (error)
        return TError(error, "Cannot remap owner of {}", entry.Name);

    entry.Uid = uid;
    entry.Gid = gid;
    return OK;
}

static TPath ScratchParent() {
    if (!config().unpack().scratch_dir().empty())
        return config().unpack().scratch_dir();
    const char *tmp = getenv("TMPDIR");
    if (tmp && tmp[0] == '/')
        return tmp;
    return "/tmp";
}

static const std::string ScratchPrefix() {
    if (config().unpack().scratch_prefix().empty())
        return LAYER_SCRATCH_PREFIX;
    return config().unpack().scratch_prefix();
}

TLayerUnpacker::TLayerUnpacker(const TPath &root, const TUnpackOptions &options) :
    Root(root.AbsolutePath().NormalPath()),
    Options(options),
    Policy(options.Policy ? *options.Policy : HostPathPolicy()),
    Aufs(ScratchParent(), ScratchPrefix())
{
    uint64_t size = config().unpack().copy_buffer_size();
    Buffer.resize(size ? size : LAYER_COPY_BUFFER);
}

TError TLayerUnpacker::PrepareParent(const TPath &path) {
    TPath parent = path.DirNameNormal();
    TPath base = parent;
    TError error;

    while (base != Root && !base.PathExists())
        base = base.DirNameNormal();

    /* symlinks from this or lower layers must not lead outside */
    TPath real = base.RealPath();
    if (!base.Exists() || !real.IsInside(RealRoot))
        return TError(EError::Breakout, "Parent of {} resolves to {} outside of {}",
                      path, real, Root);

    if (base != parent) {
        unsigned mode = config().unpack().directory_mode();
        error = parent.MkdirAll(mode ? mode : LAYER_DIRECTORY_MODE);
        if (error)
            return TError(error, "Cannot create parent directory for {}", path);
    }

    return OK;
}

TError TLayerUnpacker::ReplaceExisting(const TPath &path, const TTarEntry &entry) {
    struct stat st;
    TError error;

    error = path.StatStrict(st);
    if (error) {
        if (error.Errno == ENOENT)
            return OK;
        return error;
    }

    if (path == Root) {
        if (!entry.IsDirectory() || !S_ISDIR(st.st_mode))
            return TError(EError::StreamError, "Cannot replace root {} with {} {}",
                          Root, entry.TypeName(), entry.Name);
        return OK;
    }

    error = ResetImmutable(path, &st);
    if (error)
        return error;

    /* merge directory with lower layer */
    if (S_ISDIR(st.st_mode) && entry.IsDirectory())
        return OK;

    error = path.RemoveAll();
    if (error && error.Errno != ENOENT)
        return TError(error, "Cannot replace {}", path);

    return OK;
}

TError TLayerUnpacker::ApplyEntry(TTarReader &reader, TTarEntry &entry) {
    std::string name = TPath(entry.Name).NormalPath().ToString();
    TError error;
    TPath path;

    if (Policy.SkipName(entry.Name)) {
        L_WRN("Skip {}: name is not supported by {} policy", entry.Name, Policy.Name());
        if (Statistics)
            Statistics->EntriesSkipped++;
        return OK;
    }

    switch (ClassifyMetaEntry(name, entry)) {
    case EWhiteoutAction::CaptureLink:
        if (Statistics)
            Statistics->AufsLinks++;
        return Aufs.Capture(entry, reader, Buffer);
    case EWhiteoutAction::SkipMeta:
        L_DBG("Skip aufs metadata {}", entry.Name);
        if (Statistics)
            Statistics->EntriesSkipped++;
        return OK;
    default:
        break;
    }

    error = ValidateEntryPath(Root, name, Policy, path);
    if (error)
        return error;

    if (path != Root) {
        error = PrepareParent(path);
        if (error)
            return error;
    }

    switch (ClassifyWhiteout(path)) {
    case EWhiteoutAction::Opaque:
        if (Statistics)
            Statistics->OpaqueDirs++;
        return ApplyOpaque(path.DirNameNormal(), Unpacked);
    case EWhiteoutAction::Whiteout:
        return ApplyWhiteout(path, Root, Policy);
    default:
        break;
    }

    error = ReplaceExisting(path, entry);
    if (error)
        return error;

    TTarEntry *source = &entry;
    TInputStream *content = &reader;
    std::unique_ptr<TInputStream> linkContent;
    TTarEntry captured;
    TFile linkFile;

    if (entry.Type == ETarType::Hardlink && TAufsLinks::IsLinkTarget(entry.LinkName)) {
        error = Aufs.Resolve(entry.LinkName, captured, linkFile);
        if (error)
            return TError(error, "Cannot resolve {}", entry.Name);
        L_DBG("Resolved aufs hardlink {} -> {}", entry.Name, entry.LinkName);
        linkContent.reset(new TFdInputStream(linkFile.Fd));
        source = &captured;
        content = linkContent.get();
    }

    error = RemapIds(*source, IdMap, Options.HasChown ? &Options.Chown : nullptr);
    if (error)
        return error;

    TExtractOptions extract;
    extract.Lchown = true;
    extract.InUserNS = Options.InUserNS;
    extract.IgnoreChownErrors = Options.IgnoreChownErrors;
    extract.ForceMode = Options.HasForceMode ? &Options.ForceMode : nullptr;

    L_DBG("Extract {} {} uid {} gid {} mode {:#o}", source->TypeName(), path,
          source->Uid, source->Gid, source->Mode);

    error = ExtractEntry(path, Root, *source, *content, extract, Buffer);
    if (error)
        return TError(error, "Cannot extract {}", entry.Name);

    if (entry.IsDirectory())
        PendingDirs.emplace_back(path, entry);

    Unpacked.insert(path.ToString());

    if (Statistics)
        Statistics->EntriesApplied++;

    return OK;
}

TError TLayerUnpacker::FinalizeDirectories() {
    TError error;

    for (auto &it: PendingDirs) {
        const TPath &path = it.first;
        const TTarEntry &entry = it.second;

        struct timespec atime = entry.HasAccessTime ? entry.AccessTime : entry.ModTime;
        error = path.Utimes(atime, entry.ModTime);
        if (error)
            return error;

        error = WriteFileFlags(path, entry);
        if (error)
            return error;
    }

    return OK;
}

TError TLayerUnpacker::Unpack(TInputStream &stream, uint64_t &size) {
    TTarReader reader(stream);
    TError error;

    size = 0;

    error = IdMap.Init(Options.UidMaps, Options.GidMaps);
    if (error)
        return error;

    if (!Root.IsDirectoryFollow())
        return TError(EError::InvalidValue, ENOTDIR, "Destination {} is not a directory", Root);
    RealRoot = Root.RealPath();

    while (true) {
        TTarEntry entry;
        bool found;

        error = reader.Next(entry, found);
        if (error)
            return TError(error, "Cannot read layer");
        if (!found)
            break;

        Size += entry.Size;

        error = ApplyEntry(reader, entry);
        if (error)
            return error;
    }

    error = FinalizeDirectories();
    if (error)
        return error;

    error = Aufs.Cleanup();
    if (error)
        return error;

    size = Size;
    return OK;
}

TError UnpackLayer(const TPath &dest, TInputStream &stream,
                   const TUnpackOptions &options, uint64_t &size) {
    TLayerUnpacker unpacker(dest, options);
    return unpacker.Unpack(stream, size);
}

static TError ApplyLayerHandler(const TPath &dest, TInputStream &stream,
                                const TUnpackOptions &options, bool decompress,
                                uint64_t &size) {
    TPath root = dest.AbsolutePath().NormalPath();
    std::unique_ptr<TDecodedStream> decoded;
    TInputStream *input = &stream;
    TError error;

    /* archive modes are applied as is */
    TUmask mask(0);

    L_ACT("Apply layer to {}", root);

    if (decompress) {
        error = DecompressStream(stream, decoded);
        if (error)
            goto err;
        input = decoded.get();
    }

    error = UnpackLayer(root, *input, options, size);
    if (error)
        goto err;

    if (Statistics)
        Statistics->LayersApplied++;
    L_VERBOSE("Applied {} to {}", StringFormatSize(size), root);
    return OK;

err:
    if (Statistics)
        Statistics->LayersFailed++;
    L_ERR("Cannot apply layer to {}: {}", root, error);
    return error;
}

TError ApplyLayer(const TPath &dest, TInputStream &stream, uint64_t &size) {
    TUnpackOptions options;
    return ApplyLayerHandler(dest, stream, options, true, size);
}

TError ApplyLayer(const TPath &dest, TInputStream &stream,
                  const TUnpackOptions &options, uint64_t &size) {
    return ApplyLayerHandler(dest, stream, options, true, size);
}

TError ApplyUncompressedLayer(const TPath &dest, TInputStream &stream,
                              const TUnpackOptions &options, uint64_t &size) {
    return ApplyLayerHandler(dest, stream, options, false, size);
}
