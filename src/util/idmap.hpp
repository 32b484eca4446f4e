#pragma once

#include <vector>
#include <string>

#include "common.hpp"

extern "C" {
#include <sys/types.h>
}

/* One contiguous range: container ids [ContainerId, ContainerId + Size) */
struct TIdMapping {
    uint32_t ContainerId = 0;
    uint32_t HostId = 0;
    uint32_t Size = 0;

    TIdMapping() {}
    TIdMapping(uint32_t container, uint32_t host, uint32_t size) :
        ContainerId(container), HostId(host), Size(size) {}

    std::string ToString() const;
};

typedef std::vector<TIdMapping> TIdMappings;

/* "container:host:size" separated by ';' or ',' */
TError ParseIdMappings(const std::string &text, TIdMappings &mappings);

class TIdMap {
    TIdMappings Uids;
    TIdMappings Gids;

    static TError Validate(const char *kind, const TIdMappings &mappings);
    static TError ToHost(const char *kind, const TIdMappings &mappings,
                         uint32_t id, uint32_t &result);
public:
    TIdMap() {}

    TError Init(const TIdMappings &uids, const TIdMappings &gids);

    bool Empty() const { return Uids.empty() && Gids.empty(); }

    TError ToHostUid(uid_t uid, uid_t &result) const;
    TError ToHostGid(gid_t gid, gid_t &result) const;
    TError ToHost(uid_t uid, gid_t gid, uid_t &hostUid, gid_t &hostGid) const;
};
