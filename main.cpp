#include <atomic>
#include <csignal>
#include <exception>
#include <iostream>

#include "include/CommandHandler.hpp"
#include "include/Errors.hpp"
#include "misc/logger.hpp"

// Polled between index files, a second SIGINT falls back to the default handler
static std::atomic<bool> SHOULD_INTERRUPT {false};

int main(int argc, char **argv) {
    std::signal(SIGINT, [](int) {
        SHOULD_INTERRUPT = true;
        std::signal(SIGINT, SIG_DFL);
    });

    try {
        CommandHandler handler {SHOULD_INTERRUPT, std::cout};
        handler.handleArgs(argc, argv);
        return 0;
    }

    catch (const InterruptedError &ex) {
        Logging::Error(ex.what());
        return 130;
    }

    catch (const std::exception &ex) {
        Logging::Error("fatal: ", ex.what());
        return 1;
    }
}
