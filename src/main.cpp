//
// Copyright (C) 2025  HiPES - Universidade Federal do Paraná
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// (at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <https://www.gnu.org/licenses/>.
//
/**
 * @file main.cpp
 * @details Entry point. User interaction should go here. Besides, should mostly
 * just consume other public APIs.
 */

#include <getopt.h>

#include <camsim.hpp>
#include <config/engine_builder.hpp>
#include <cstdlib>
#include <cstring>

// Include our testing facilities in debug mode.
#ifndef NDEBUG
#include <tests.hpp>
#endif

/** @brief Used when -n isn't passed. */
const unsigned long DEFAULT_MAX_CYCLES = 10000000;

/**
 * @brief Prints licensing information.
 */
void license() {
    CAMSIM_LOG_PRINTF(
        "camsim - Cycle-level simulator of cached request/response channels.\n"
        "\n"
        " Copyright (C) 2025  HiPES - Universidade Federal do Paraná\n"
        "\n"
        " This program is free software: you can redistribute it and/or "
        "modify\n"
        " it under the terms of the GNU General Public License as published "
        "by\n"
        " the Free Software Foundation, either version 3 of the License, or\n"
        " (at your option) any later version.\n"
        "\n"
        " This program is distributed in the hope that it will be useful,\n"
        " but WITHOUT ANY WARRANTY; without even the implied warranty of\n"
        " MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the\n"
        " GNU General Public License for more details.\n"
        "\n"
        " You should have received a copy of the GNU General Public License\n"
        " along with this program.  If not, see "
        "<https://www.gnu.org/licenses/>.\n"
        "\n");
}

/**
 * @brief Prints the usage of the program.
 */
void usage() {
    license();
    CAMSIM_LOG_PRINTF("\n");
    CAMSIM_LOG_PRINTF(
        "Use -h to see this text, -c to set a configuration file (required for "
        "simulation) and -l to see license information.\n"
        "\n"
        "Other simulation options:\n"
        "   -n <cycles> stops the simulation after that many cycles (default "
        "%lu)\n",
        DEFAULT_MAX_CYCLES);
#ifndef NDEBUG
    CAMSIM_LOG_PRINTF("   -r <test> runs a built-in test\n");
#endif
}

/**
 * @brief Entry point.
 * @returns Non-zero on error.
 */
int main(int argc, char* const argv[]) {
    const char* rootConfigFile = NULL;
    unsigned long maxCycles = DEFAULT_MAX_CYCLES;
    int nextOpt;

    // When compiling debug mode, enable our testing facilities.
#ifdef NDEBUG
#define CAMSIM_SWITCHES "lhc:n:"
#else
#define CAMSIM_SWITCHES "r:lhc:n:"
    const char* testToRun = NULL;
#endif

    while ((nextOpt = getopt(argc, argv, CAMSIM_SWITCHES)) != -1) {
        switch (nextOpt) {
            // When compiling debug mode, enable our testing facilities.
#ifndef NDEBUG
            case 'r':
                testToRun = optarg;
                break;
#endif
            case 'c':
                rootConfigFile = optarg;
                break;
            case 'n': {
                char* end;
                maxCycles = strtoul(optarg, &end, 0);
                if (*optarg == '\0' || *end != '\0') {
                    CAMSIM_ERROR_PRINTF(
                        "-n takes a number of cycles, not %s.\n", optarg);
                    return 1;
                }
                break;
            }
            case 'l':
                license();
                return 0;
            case 'h':
                usage();
                return 0;
            default:
                usage();
                return 1;
        }
    }

    // When compiling debug mode and there's a test to run, run it.
#ifndef NDEBUG
    if (testToRun != NULL) {
        int ret = Test(testToRun);
        if (ret < 0) {
            CAMSIM_LOG_PRINTF("No such test: %s\n", testToRun);
        } else if (ret > 0) {
            CAMSIM_LOG_PRINTF("Test failed with code %d.\n", ret);
        }
        return ret;
    }
#endif

    if (rootConfigFile == NULL) {
        usage();
        return 1;
    }

    EngineBuilder builder;
    Engine* engine = builder.Instantiate(rootConfigFile);
    if (engine == NULL) return 1;

    int ret = engine->Simulate(maxCycles);
    delete engine;

    return ret;
}
