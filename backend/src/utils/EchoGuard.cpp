#include "EchoGuard.hpp"
#include <unistd.h>
#include <spdlog/spdlog.h>

EchoGuard::EchoGuard(int f)
    : fd(f)
{
    if (!isatty(fd))
        return;

    if (tcgetattr(fd, &saved) != 0) {
        spdlog::warn("tcgetattr failed; input will be echoed");
        return;
    }

    termios quiet = saved;
    quiet.c_lflag &= ~static_cast<tcflag_t>(ECHO);
    if (tcsetattr(fd, TCSAFLUSH, &quiet) != 0) {
        spdlog::warn("tcsetattr failed; input will be echoed");
        return;
    }

    configured = true;
}

EchoGuard::~EchoGuard() {
    if (configured && tcsetattr(fd, TCSAFLUSH, &saved) != 0)
        spdlog::warn("Failed to restore terminal settings");
}
