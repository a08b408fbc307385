#pragma once

#include <chrono>
#include <map>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include <sys/types.h>

namespace testbed {

// ============================================================================
// Process Spawning
// ============================================================================

struct ProcessSpec {
    std::vector<std::string> argv;          // argv[0] resolved against env PATH if relative
    std::string cwd;                        // empty = inherit
    std::map<std::string, std::string> env; // complete environment, nothing inherited
    std::chrono::seconds timeout{0};        // 0 = wait forever
};

struct ProcessResult {
    bool ok = false;       // process was spawned and reaped
    int exit_code = -1;    // 128 + signal when killed
    std::string stdout_data;
    std::string stderr_data;
    bool timed_out = false;
    std::string error;
};

/**
 * Records the process groups spawned for one owner (a sandbox) so they
 * can be signalled when the owner is torn down while commands are still
 * in flight. Thread-safe.
 */
class ProcessTracker {
public:
    void add(pid_t pgid);
    void remove(pid_t pgid);
    size_t size() const;

    // SIGTERM every tracked group, then SIGKILL whatever is still alive
    // after the grace period. Returns the number of groups signalled.
    size_t terminate_all(std::chrono::milliseconds grace = std::chrono::milliseconds(2000));

private:
    mutable std::mutex mutex_;
    std::set<pid_t> groups_;
};

/**
 * Run a process to completion with both output streams captured.
 *
 * The child becomes the leader of a new process group so a timeout or a
 * tracker can kill everything it spawned. stdin is /dev/null. Both
 * streams are drained until EOF before the child is reaped.
 */
ProcessResult run_process(const ProcessSpec& spec, ProcessTracker* tracker = nullptr);

// Quote a single argument for /bin/sh
std::string shell_quote(const std::string& arg);

// Join arguments into a /bin/sh command line, quoting where needed
std::string shell_join(const std::vector<std::string>& args);

} // namespace testbed
