#include <iostream>

#include "config.hpp"
#include "layer.hpp"
#include "util/log.hpp"
#include "util/string.hpp"

extern "C" {
#include <fcntl.h>
#include <getopt.h>
#include <unistd.h>
}

static void Usage() {
    std::cout
        << std::endl
        << "Usage: layer-apply [options...] <destination> [archive|-]" << std::endl
        << std::endl
        << "Applies container image layer diff onto destination directory." << std::endl
        << "Archive is read from stdin if omitted or \"-\"." << std::endl
        << std::endl
        << "Option: " << std::endl
        << "  -h | --help                  print this message" << std::endl
        << "  -c | --config <path>         read config after system ones" << std::endl
        << "  -v | --verbose               verbose logging" << std::endl
        << "  -d | --debug                 debug logging" << std::endl
        << "  -u | --uid-map <C:H:S>       map container uids to host, repeatable" << std::endl
        << "  -g | --gid-map <C:H:S>       map container gids to host, repeatable" << std::endl
        << "  -o | --chown <user[:group]>  set owner of every entry" << std::endl
        << "  -i | --ignore-chown-errors   do not fail if chown is not permitted" << std::endl
        << "  -U | --userns                running in user namespace" << std::endl
        << "  -m | --force-mode <octal>    set mode of every entry" << std::endl
        << "  -n | --no-decompress         archive is plain tar" << std::endl
        << "  -W | --windows-names         skip names not valid on windows" << std::endl
        << "  -V | --version               print version" << std::endl
        << std::endl;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> uidMaps, gidMaps;
    std::string configPath, chown, forceMode;
    bool userns = false, ignoreChown = false;
    bool decompress = true, windows = false;
    int opt = 0;

    static struct option long_options[] = {
        {"help",                no_argument,        0,  'h' },
        {"config",              required_argument,  0,  'c' },
        {"verbose",             no_argument,        0,  'v' },
        {"debug",               no_argument,        0,  'd' },
        {"uid-map",             required_argument,  0,  'u' },
        {"gid-map",             required_argument,  0,  'g' },
        {"chown",               required_argument,  0,  'o' },
        {"ignore-chown-errors", no_argument,        0,  'i' },
        {"userns",              no_argument,        0,  'U' },
        {"force-mode",          required_argument,  0,  'm' },
        {"no-decompress",       no_argument,        0,  'n' },
        {"windows-names",       no_argument,        0,  'W' },
        {"version",             no_argument,        0,  'V' },
        {0,                     0,                  0,   0  }
    };

    int long_index = 0;
    while ((opt = getopt_long(argc, argv, "hc:vdu:g:o:iUm:nWV", long_options, &long_index)) != -1) {
        switch (opt) {
            case 'h':
                Usage();
                return EXIT_SUCCESS;
            case 'c':
                configPath = optarg;
                break;
            case 'v':
                Verbose = true;
                break;
            case 'd':
                Debug = Verbose = true;
                break;
            case 'u':
                uidMaps.push_back(optarg);
                break;
            case 'g':
                gidMaps.push_back(optarg);
                break;
            case 'o':
                chown = optarg;
                break;
            case 'i':
                ignoreChown = true;
                break;
            case 'U':
                userns = true;
                break;
            case 'm':
                forceMode = optarg;
                break;
            case 'n':
                decompress = false;
                break;
            case 'W':
                windows = true;
                break;
            case 'V':
                std::cout << LAYERUNPACK_VERSION << std::endl;
                return EXIT_SUCCESS;
            default:
                Usage();
                return EXIT_FAILURE;
        }
    }

    if (optind >= argc || argc - optind > 2) {
        Usage();
        return EXIT_FAILURE;
    }

    TPath dest = argv[optind];
    std::string archive = argc - optind > 1 ? argv[optind + 1] : "-";
    TUnpackOptions options;
    TError error;
    TFile input;
    uint64_t size = 0;

    OpenLog();
    InitStatistics();

    error = ReadConfigs(configPath);
    if (!error)
        error = ValidateConfig();
    if (error) {
        L_ERR("Invalid config: {}", error);
        return EXIT_FAILURE;
    }

    if (!config().log().path().empty())
        OpenLog(config().log().path());

    error = options.Load(config().unpack());
    if (error) {
        L_ERR("Invalid unpack config: {}", error);
        return EXIT_FAILURE;
    }

    if (!uidMaps.empty() || !gidMaps.empty()) {
        options.UidMaps.clear();
        options.GidMaps.clear();
    }

    for (auto &map: uidMaps) {
        error = ParseIdMappings(map, options.UidMaps);
        if (error)
            goto err;
    }

    for (auto &map: gidMaps) {
        error = ParseIdMappings(map, options.GidMaps);
        if (error)
            goto err;
    }

    if (!chown.empty()) {
        error = options.Chown.Init(chown);
        if (error)
            goto err;
        options.HasChown = true;
    }

    if (!forceMode.empty()) {
        error = StringToOct(forceMode, options.ForceMode);
        if (!error && options.ForceMode > 07777)
            error = TError(EError::InvalidValue, "Invalid mode: {}", forceMode);
        if (error)
            goto err;
        options.HasForceMode = true;
    }

    if (ignoreChown)
        options.IgnoreChownErrors = true;
    if (userns)
        options.InUserNS = true;
    if (windows)
        options.Policy = &WindowsPathPolicy();

    if (archive == "-") {
        input.SetFd = dup(STDIN_FILENO);
        if (!input) {
            error = TError::System("dup stdin");
            goto err;
        }
    } else {
        error = input.OpenRead(archive);
        if (error)
            goto err;
    }

    {
        TFdInputStream stream(input.Fd);

        if (decompress)
            error = ApplyLayer(dest, stream, options, size);
        else
            error = ApplyUncompressedLayer(dest, stream, options, size);
    }
    if (error)
        return EXIT_FAILURE;

    std::cout << size << std::endl;

    if (Verbose)
        DumpStatistics();

    return EXIT_SUCCESS;

err:
    L_ERR("{}", error);
    return EXIT_FAILURE;
}
