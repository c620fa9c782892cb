#pragma once

#include "../cli/argparse.hpp"

#include <atomic>
#include <ostream>

class CommandHandler {
    public:
        // `shouldInterrupt` is flipped asynchronously (SIGINT) and polled by long running commands
        CommandHandler(const std::atomic<bool> &shouldInterrupt, std::ostream &out);

        // Parse the CMD inputs and execute the appropriate function.
        // Errors propagate as exceptions, the caller maps them to exit codes
        void handleArgs(int argc, char **argv);

    private:
        argparse::ArgumentParser argparser;
        const std::atomic<bool> &shouldInterrupt;
        std::ostream &out;

        // Initialize the parser with all the gory details
        static argparse::ArgumentParser initParser();

        void write(const argparse::ArgumentParser &parser);
        void showIndex(const argparse::ArgumentParser &parser);
};
