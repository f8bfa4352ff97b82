#pragma once

// ============================================================
// platform.hpp -- Portable types and console abstraction
// ============================================================

#include <string>
#include <cstdint>
#include <cstddef>

#ifdef _WIN32
#  ifndef WIN32_LEAN_AND_MEAN
#    define WIN32_LEAN_AND_MEAN
#  endif
#  ifndef NOMINMAX
#    define NOMINMAX
#  endif
#  include <windows.h>
#else // POSIX
#  include <termios.h>
#  include <unistd.h>
#endif

// ---- Portable types ----
using u8  = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;
using i8  = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

namespace platform {

// ---- Console echo control (password prompts) ----
// Disables echo on the controlling terminal for the lifetime of the guard.
// If there is no terminal (stdin redirected), the guard is a no-op.
class EchoGuard {
public:
    EchoGuard() {
#ifdef _WIN32
        handle_ = GetStdHandle(STD_INPUT_HANDLE);
        if (handle_ != INVALID_HANDLE_VALUE && GetConsoleMode(handle_, &old_mode_)) {
            active_ = SetConsoleMode(handle_, old_mode_ & ~ENABLE_ECHO_INPUT) != 0;
        }
#else
        if (isatty(STDIN_FILENO) && tcgetattr(STDIN_FILENO, &old_) == 0) {
            termios nt = old_;
            nt.c_lflag &= ~ECHO;
            active_ = tcsetattr(STDIN_FILENO, TCSANOW, &nt) == 0;
        }
#endif
    }

    ~EchoGuard() {
        if (!active_) return;
#ifdef _WIN32
        SetConsoleMode(handle_, old_mode_);
#else
        tcsetattr(STDIN_FILENO, TCSANOW, &old_);
#endif
    }

    bool active() const { return active_; }

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

private:
    bool active_{false};
#ifdef _WIN32
    HANDLE handle_{INVALID_HANDLE_VALUE};
    DWORD  old_mode_{0};
#else
    termios old_{};
#endif
};

} // namespace platform
