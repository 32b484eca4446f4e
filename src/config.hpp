#pragma once

#include <string>

#include "common.hpp"
#include "util/path.hpp"

#include "config.pb.h"

extern cfg::TConfig &config();

/* Drops everything read and sets built-in defaults */
void ResetConfig();

/* Reads system configs and then optional explicit one */
TError ReadConfigs(const TPath &extra = "", bool silent = false);
TError ValidateConfig();
