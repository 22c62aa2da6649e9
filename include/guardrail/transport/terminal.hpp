#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace guardrail::transport {

struct TerminalSize {
    unsigned short rows = 24;
    unsigned short cols = 80;
};

// A child program attached to a terminal the wrapper controls.
class TerminalSession {
public:
    virtual ~TerminalSession() = default;

    // Non-blocking. Readable when the child produced output (or hung up),
    // writable when the child's input has room again.
    virtual int fd() const = 0;
    // Available output; empty when nothing is ready, nullopt once the child side is gone.
    virtual std::optional<std::string> read_output() = 0;
    // Writes what fits without blocking and returns the number of bytes taken,
    // 0 when the child's input is full. Throws TransportError when the child side is gone.
    virtual std::size_t write_input(std::string_view bytes) = 0;
    virtual void resize(TerminalSize size) = 0;
    virtual void terminate() = 0;
    // Blocks until the child exits; returns its exit status (128 + signal when killed).
    virtual int wait() = 0;
};

using TerminalSessionPtr = std::unique_ptr<TerminalSession>;

// Spawns argv[0] (looked up in PATH) on a new pseudo-terminal. Throws
// TransportError when the pty or the child cannot be created.
TerminalSessionPtr spawn_pty_session(const std::vector<std::string>& argv, TerminalSize size);

// Size of the terminal on `fd`, or nullopt when it is not a terminal.
std::optional<TerminalSize> query_terminal_size(int fd);

} // namespace guardrail::transport
