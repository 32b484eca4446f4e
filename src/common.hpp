#pragma once

#include "util/error.hpp"

#define __STDC_LIMIT_MACROS
#include <cstdint>
#undef __STDC_LIMIT_MACROS

class TNonCopyable {
protected:
    TNonCopyable() = default;
    ~TNonCopyable() = default;
private:
    TNonCopyable(TNonCopyable const&) = delete;
    TNonCopyable& operator= (TNonCopyable const&) = delete;
    TNonCopyable(TNonCopyable const&&) = delete;
    TNonCopyable& operator= (TNonCopyable const&&) = delete;
};

/* aufs whiteouts, see opencontainers image-spec layer.md */
constexpr const char *WHITEOUT_PREFIX = ".wh.";
constexpr const char *WHITEOUT_META_PREFIX = ".wh..wh.";
constexpr const char *WHITEOUT_LINK_DIR = ".wh..wh.plnk";
constexpr const char *WHITEOUT_OPAQUE_DIR = ".wh..wh..opq";

constexpr const char *LAYER_CONFIG = "/etc/layerunpack.conf";
constexpr const char *LAYER_CONFIG_DIR = "/etc/layerunpack.conf.d";

constexpr const char *LAYER_SCRATCH_PREFIX = "layerplnk";
constexpr const char *LAYER_OVERRIDE_XATTR = "user.containers.override_stat";

constexpr uint64_t LAYER_COPY_BUFFER = 1 << 20;
constexpr unsigned LAYER_DIRECTORY_MODE = 0755;
