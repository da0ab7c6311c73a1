/**
 * @file launcher_main.cpp
 * @brief warden-launcher - child-side entry point
 *
 * Usage: warden-launcher <request.json> <response.json>
 *
 * Started by the sandbox backends inside the isolation boundary; not meant
 * to be run by hand.
 *
 * @date 2025
 */

#include "warden/core/launcher.hpp"

#include <cstdio>

int main(int argc, char** argv) {
    if (argc != 3) {
        std::fprintf(stderr, "usage: %s <request.json> <response.json>\n", argv[0]);
        return 2;
    }
    return warden::core::Launcher::Run(argv[1], argv[2]);
}
