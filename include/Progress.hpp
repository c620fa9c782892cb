#pragma once

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>

namespace cr = std::chrono;

// Progress sink for long running operations. Implementations decide
// whether to render, log or ignore the updates.
class Progress {
    public:
        virtual ~Progress() = default;

        // Name of the current phase, eg: "Collecting entries"
        virtual void setName(const std::string &name) = 0;

        // Start a new phase, resets the counter. `max` is unknown if unset
        virtual void init(std::optional<std::size_t> max, const std::string &unit) = 0;

        virtual void inc(std::size_t by = 1) = 0;

        // Report how fast the current phase went since `start`
        virtual void showThroughput(cr::steady_clock::time_point start) = 0;

        virtual std::size_t step() const = 0;
};

// Only counts, never reports anything
class DiscardProgress: public Progress {
    private:
        std::size_t current {0};

    public:
        void setName(const std::string&) override {}
        void init(std::optional<std::size_t>, const std::string&) override { current = 0; }
        void inc(std::size_t by = 1) override { current += by; }
        void showThroughput(cr::steady_clock::time_point) override {}
        std::size_t step() const override { return current; }
};

// Reports phases through the logger: progress at DEBUG, throughput at INFO
class LogProgress: public Progress {
    private:
        std::string name, unit;
        std::optional<std::size_t> max;
        std::size_t current {0};

    public:
        explicit LogProgress(const std::string &name = "progress");

        void setName(const std::string &name) override;
        void init(std::optional<std::size_t> max, const std::string &unit) override;
        void inc(std::size_t by = 1) override;
        void showThroughput(cr::steady_clock::time_point start) override;
        std::size_t step() const override { return current; }
};
