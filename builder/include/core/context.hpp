#pragma once

#include <iostream>
#include <mutex>

namespace muslforge {

class Context {
public:
    explicit Context(bool verbose = true, bool quiet = false) : verbose_(verbose), quiet_(quiet) {}

    template <typename... Args>
    void log(const Args &...args) const {
        if (quiet_) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex());
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void debug(const Args &...args) const {
        if (!verbose_ || quiet_) {
            return;
        }
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cout << "[debug] ";
        (std::cout << ... << args) << '\n';
    }

    template <typename... Args>
    void warn(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[warn] ";
        (std::cerr << ... << args) << '\n';
    }

    template <typename... Args>
    void error(const Args &...args) const {
        std::lock_guard<std::mutex> lock(outputMutex());
        std::cerr << "[error] ";
        (std::cerr << ... << args) << '\n';
    }

    bool verbose() const { return verbose_; }
    bool quiet() const { return quiet_; }

private:
    // Pipeline steps log from worker threads.
    static std::mutex &outputMutex() {
        static std::mutex mutex;
        return mutex;
    }

    bool verbose_;
    bool quiet_;
};

} // namespace muslforge
