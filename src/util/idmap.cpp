#include "util/idmap.hpp"
#include "util/string.hpp"

#include <algorithm>

std::string TIdMapping::ToString() const {
    return fmt::format("{}:{}:{}", ContainerId, HostId, Size);
}

TError ParseIdMappings(const std::string &text, TIdMappings &mappings) {
    TError error;

    for (auto &str: SplitString(text, ';')) {
        for (auto &item: SplitString(str, ',')) {
            item = StringTrim(item);
            if (item.empty())
                continue;

            auto cols = SplitString(item, ':');
            if (cols.size() != 3)
                return TError(EError::InvalidMapping, "Invalid id mapping: {}", item);

            uint64_t val[3];
            for (int i = 0; i < 3; i++) {
                error = StringToUint64(cols[i], val[i]);
                if (error || val[i] > UINT32_MAX)
                    return TError(EError::InvalidMapping, "Invalid id mapping: {}", item);
            }

            mappings.emplace_back(val[0], val[1], val[2]);
        }
    }

    return OK;
}

TError TIdMap::Validate(const char *kind, const TIdMappings &mappings) {
    for (auto it = mappings.begin(); it != mappings.end(); it++) {
        if (!it->Size)
            return TError(EError::InvalidMapping, "Empty {} mapping {}", kind, it->ToString());

        if ((uint64_t)it->ContainerId + it->Size - 1 > UINT32_MAX ||
                (uint64_t)it->HostId + it->Size - 1 > UINT32_MAX)
            return TError(EError::InvalidMapping, "Overflow in {} mapping {}", kind, it->ToString());

        for (auto prev = mappings.begin(); prev != it; prev++) {
            if (it->ContainerId < (uint64_t)prev->ContainerId + prev->Size &&
                    prev->ContainerId < (uint64_t)it->ContainerId + it->Size)
                return TError(EError::InvalidMapping, "Overlapping {} mappings {} and {}",
                              kind, prev->ToString(), it->ToString());
        }
    }
    return OK;
}

TError TIdMap::Init(const TIdMappings &uids, const TIdMappings &gids) {
    TError error;

    error = Validate("uid", uids);
    if (error)
        return error;

    error = Validate("gid", gids);
    if (error)
        return error;

    Uids = uids;
    Gids = gids;
    return OK;
}

TError TIdMap::ToHost(const char *kind, const TIdMappings &mappings,
                      uint32_t id, uint32_t &result) {
    if (mappings.empty()) {
        result = id;
        return OK;
    }

    for (auto &map: mappings) {
        if (id >= map.ContainerId && id - map.ContainerId < map.Size) {
            result = map.HostId + (id - map.ContainerId);
            return OK;
        }
    }

    return TError(EError::InvalidMapping, "Container {} {} is not mapped to host", kind, id);
}

TError TIdMap::ToHostUid(uid_t uid, uid_t &result) const {
    return ToHost("uid", Uids, uid, result);
}

TError TIdMap::ToHostGid(gid_t gid, gid_t &result) const {
    return ToHost("gid", Gids, gid, result);
}

TError TIdMap::ToHost(uid_t uid, gid_t gid, uid_t &hostUid, gid_t &hostGid) const {
    TError error = ToHostUid(uid, hostUid);
    if (!error)
        error = ToHostGid(gid, hostGid);
    return error;
}
