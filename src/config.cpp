#include "config.hpp"
#include "policy.hpp"
#include "util/idmap.hpp"
#include "util/log.hpp"

#include <google/protobuf/text_format.h>
#include <google/protobuf/io/tokenizer.h>
#include <google/protobuf/io/zero_copy_stream_impl.h>

#include <algorithm>

extern "C" {
#include <fcntl.h>
#include <unistd.h>
}

class TProtobufLogger : public google::protobuf::io::ErrorCollector {
public:
    std::string Path;
    TProtobufLogger(const std::string &path) : Path(path) {}
    ~TProtobufLogger() {}

    void AddError(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }

    void AddWarning(int line, int column, const std::string& message) {
        L_WRN("Config {} at line {} column {} {}", Path, line + 1, column + 1, message);
    }
};

static cfg::TConfig Config;

cfg::TConfig &config() {
    return Config;
}

static void DefaultConfig() {
    config().mutable_log()->set_verbose(false);
    config().mutable_log()->set_debug(false);
    config().mutable_log()->set_path("");

    config().mutable_unpack()->set_copy_buffer_size(LAYER_COPY_BUFFER);
    config().mutable_unpack()->set_scratch_dir("");
    config().mutable_unpack()->set_scratch_prefix(LAYER_SCRATCH_PREFIX);
    config().mutable_unpack()->set_directory_mode(LAYER_DIRECTORY_MODE);
    config().mutable_unpack()->set_name_policy("host");
    config().mutable_unpack()->set_ignore_chown_errors(false);
}

void ResetConfig() {
    Config.Clear();
    DefaultConfig();
}

static TError ReadConfig(const TPath &path, bool silent) {
    TError error;
    TFile file;

    error = file.OpenRead(path);
    if (error) {
        if (!silent && error.Errno != ENOENT)
            L_WRN("Cannot read config {} {}", path, error);
        return error;
    }

    google::protobuf::io::FileInputStream stream(file.Fd);
    google::protobuf::TextFormat::Parser parser;
    TProtobufLogger logger(path.ToString());

    if (!silent) {
        L_VERBOSE("Read config {}", path);
        parser.RecordErrorsTo(&logger);
    }

    bool ok = parser.Merge(&stream, &Config);
    if (!ok && !silent)
        L_WRN("Cannot parse config {} the rest is skipped", path);

    return OK;
}

TError ReadConfigs(const TPath &extra, bool silent) {
    TError error;

    ResetConfig();

    (void)ReadConfig(LAYER_CONFIG, silent);

    TPath config_dir = LAYER_CONFIG_DIR;
    std::vector<std::string> config_names;
    if (!config_dir.ReadDirectory(config_names)) {
        std::sort(config_names.begin(), config_names.end());
        for (auto &name: config_names) {
            if (StringEndsWith(name, ".conf"))
                (void)ReadConfig(config_dir / name, silent);
        }
    }

    if (extra) {
        error = ReadConfig(extra, silent);
        if (error)
            return TError(error, "Cannot read config {}", extra);
    }

    Debug |= config().log().debug();
    Verbose |= Debug | config().log().verbose();

    return OK;
}

TError ValidateConfig() {
    const TPathPolicy *policy;
    TIdMappings mappings;
    TError error;

    auto &unpack = config().unpack();

    if (!unpack.copy_buffer_size())
        return TError(EError::InvalidValue, "unpack.copy_buffer_size must be positive");

    if (unpack.directory_mode() & ~07777u)
        return TError(EError::InvalidValue, "Invalid unpack.directory_mode {:#o}",
                      unpack.directory_mode());

    if (unpack.scratch_prefix().find('/') != std::string::npos)
        return TError(EError::InvalidValue, "Invalid unpack.scratch_prefix {}",
                      unpack.scratch_prefix());

    error = FindPathPolicy(unpack.name_policy(), policy);
    if (error)
        return error;

    error = ParseIdMappings(unpack.uid_map(), mappings);
    if (!error)
        error = ParseIdMappings(unpack.gid_map(), mappings);
    if (error)
        return error;

    return OK;
}
