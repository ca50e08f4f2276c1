#pragma once

#include <unistd.h>
#include <atomic>
#include <string_view>
#include <mutex>

namespace chkr::compact {

enum class Verbosity {
    Silent,   // nothing at all, status only
    Quiet,    // errors and failures only
    Normal,
    Verbose
};

// Lock-guarded writer straight to the standard descriptors.
class Writer {
public:
    static void set_verbosity(Verbosity v) { level().store(v); }
    static Verbosity verbosity() { return level().load(); }

    static void print(std::string_view s) {
        if (verbosity() < Verbosity::Normal) return;
        write_fd(STDOUT_FILENO, s);
    }

    // Failures still reach stdout in quiet mode, md5sum -c does the same.
    static void failure(std::string_view s) {
        if (verbosity() < Verbosity::Quiet) return;
        write_fd(STDOUT_FILENO, s);
    }

    static void error(std::string_view s) {
        if (verbosity() < Verbosity::Quiet) return;
        write_fd(STDERR_FILENO, s);
    }

    static void debug(std::string_view s) {
        if (verbosity() < Verbosity::Verbose) return;
        write_fd(STDERR_FILENO, s);
    }

private:
    static void write_fd(int fd, std::string_view s) {
        std::lock_guard<std::mutex> lock(get_mutex());
        while (!s.empty()) {
            ssize_t n = ::write(fd, s.data(), s.size());
            if (n <= 0) return;
            s.remove_prefix(static_cast<size_t>(n));
        }
    }

    static std::atomic<Verbosity>& level() {
        static std::atomic<Verbosity> v{Verbosity::Normal};
        return v;
    }

    static std::mutex& get_mutex() {
        static std::mutex m;
        return m;
    }
};

} // namespace chkr::compact
