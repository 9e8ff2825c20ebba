#pragma once
#include <termios.h>

// Turns terminal echo off for `fd` while alive and restores the previous
// settings on destruction. Does nothing when `fd` is not a terminal
// (piped input, tests).
class EchoGuard {
public:
    explicit EchoGuard(int fd);
    ~EchoGuard();

    EchoGuard(const EchoGuard&) = delete;
    EchoGuard& operator=(const EchoGuard&) = delete;

    bool active() const { return configured; }

private:
    int fd;
    bool configured = false;
    termios saved{};
};
