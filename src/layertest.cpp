#include <iostream>
#include <csignal>

#include "config.hpp"
#include "util/log.hpp"
#include "util/unix.hpp"
#include "test/test.hpp"

extern "C" {
#include <errno.h>
#include <stdlib.h>
#include <string.h>
}

static void Usage() {
    std::cout << "usage: " << program_invocation_short_name << " [test]..." << std::endl;
}

int main(int argc, char *argv[]) {
    std::vector<std::string> names;

    if (argc >= 2) {
        std::string name(argv[1]);
        if (name == "-h" || name == "--help") {
            Usage();
            return EXIT_FAILURE;
        }

        if (name == "-v" || name == "--version") {
            std::cout << LAYERUNPACK_VERSION << std::endl;
            return EXIT_FAILURE;
        }
    }

    for (int i = 1; i < argc; i++)
        names.push_back(argv[i]);

    // in case stderr is closed under test runner
    signal(SIGPIPE, SIG_IGN);

    OpenLog();
    InitStatistics();
    ResetConfig();

    if (getenv("LAYERTEST_DEBUG"))
        Debug = Verbose = true;

    try {
        return test::SelfTest(names);
    } catch (const std::exception &exc) {
        std::cerr << "Exception: " << exc.what() << std::endl;
    }

    return EXIT_FAILURE;
}
