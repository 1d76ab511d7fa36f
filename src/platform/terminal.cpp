#include "terminal.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <cli/theme.hpp>
#include <fmt/format.h>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

TermGeometry term_geometry(int fd) {
    TermGeometry g{DEFAULT_TERM_WIDTH, DEFAULT_TERM_HEIGHT};
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0) {
        g.width = ws.ws_col;
        g.height = ws.ws_row;
    }
    return g;
}

// ── Tty ──────────────────────────────────────────────────────

Result<std::unique_ptr<Tty>> Tty::open_controlling() {
    int fd = ::open(TTY_DEVICE, O_RDWR | O_CLOEXEC);
    if (fd < 0) {
        return Result<std::unique_ptr<Tty>>::Err(
            fmt::format("opening {}: {}", TTY_DEVICE, std::strerror(errno)));
    }
    return Result<std::unique_ptr<Tty>>::Ok(std::make_unique<Tty>(fd));
}

Tty::~Tty() {
    if (fd_ >= 0) ::close(fd_);
}

Result<int> Tty::read_bytes(unsigned char* buf, int cap) {
    for (;;) {
        ssize_t n = ::read(fd_, buf, static_cast<size_t>(cap));
        if (n > 0) return Result<int>::Ok(static_cast<int>(n));
        if (n == 0) return Result<int>::Err("read tty: end of input");
        if (errno == EINTR) continue;
        return Result<int>::Err(fmt::format("read tty: {}", std::strerror(errno)));
    }
}

Result<void> Tty::write_all(const std::string& data) {
    size_t sent = 0;
    while (sent < data.size()) {
        ssize_t w = ::write(fd_, data.data() + sent, data.size() - sent);
        if (w < 0) {
            if (errno == EINTR) continue;
            return Result<void>::Err(fmt::format("write tty: {}", std::strerror(errno)));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

// ── RawModeGuard ─────────────────────────────────────────────

struct RawModeGuard::Impl {
    struct termios old_term;
};

RawModeGuard::RawModeGuard(int fd) : fd_(fd) {
    struct termios old_term;
    if (tcgetattr(fd_, &old_term) != 0) {
        error_ = fmt::format("tcgetattr: {}", std::strerror(errno));
        return;
    }
    struct termios raw = old_term;
    cfmakeraw(&raw);
    if (tcsetattr(fd_, TCSAFLUSH, &raw) != 0) {
        error_ = fmt::format("tcsetattr: {}", std::strerror(errno));
        return;
    }
    impl_ = new Impl{old_term};
}

RawModeGuard::~RawModeGuard() {
    if (impl_) {
        tcsetattr(fd_, TCSAFLUSH, &impl_->old_term);
        delete impl_;
    }
}

// ── ScreenGuard ──────────────────────────────────────────────

ScreenGuard::ScreenGuard(Tty& tty) : tty_(tty) {
    auto r = tty_.write_all(theme::screen::ALT_ON + theme::screen::HIDE_CURSOR);
    if (r.is_err()) jpick_log(fmt::format("ScreenGuard: enter failed: {}", r.error));
}

ScreenGuard::~ScreenGuard() {
    auto r = tty_.write_all(theme::screen::SHOW_CURSOR + theme::screen::ALT_OFF);
    if (r.is_err()) jpick_log(fmt::format("ScreenGuard: leave failed: {}", r.error));
}

} // namespace platform
