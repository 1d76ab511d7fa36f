#pragma once

#include <string>
#include <memory>
#include <core/types.hpp>

namespace platform {

// Terminal dimensions of `fd`. Falls back to 80x24 when they cannot be read.
TermGeometry term_geometry(int fd);

// Controlling terminal opened read/write (/dev/tty), so stdin stays free
// for piped input.
class Tty {
public:
    static Result<std::unique_ptr<Tty>> open_controlling();

    explicit Tty(int fd) : fd_(fd) {}
    ~Tty();

    Tty(const Tty&) = delete;
    Tty& operator=(const Tty&) = delete;

    int fd() const { return fd_; }

    // Blocking read of up to `cap` bytes. Retries on EINTR.
    // End of file and read errors are both failures.
    Result<int> read_bytes(unsigned char* buf, int cap);

    // Write everything or fail.
    Result<void> write_all(const std::string& data);

private:
    int fd_;
};

// RAII guard for raw terminal mode.
// Constructor saves the current mode and enters raw mode.
// Destructor restores the saved mode.
class RawModeGuard {
public:
    explicit RawModeGuard(int fd);
    ~RawModeGuard();

    RawModeGuard(const RawModeGuard&) = delete;
    RawModeGuard& operator=(const RawModeGuard&) = delete;

    bool active() const { return impl_ != nullptr; }
    const std::string& error() const { return error_; }

private:
    struct Impl;
    Impl* impl_ = nullptr;
    int fd_;
    std::string error_;
};

// RAII guard for the alternate screen with the cursor hidden.
class ScreenGuard {
public:
    explicit ScreenGuard(Tty& tty);
    ~ScreenGuard();

    ScreenGuard(const ScreenGuard&) = delete;
    ScreenGuard& operator=(const ScreenGuard&) = delete;

private:
    Tty& tty_;
};

} // namespace platform
