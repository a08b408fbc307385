#include "testbed/process.hpp"
#include "testbed/platform.hpp"

#include <spdlog/spdlog.h>

#include <cctype>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace testbed {

// ============================================================================
// ProcessTracker
// ============================================================================

void ProcessTracker::add(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.insert(pgid);
}

void ProcessTracker::remove(pid_t pgid) {
    std::lock_guard<std::mutex> lock(mutex_);
    groups_.erase(pgid);
}

size_t ProcessTracker::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return groups_.size();
}

size_t ProcessTracker::terminate_all(std::chrono::milliseconds grace) {
    std::set<pid_t> groups;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        groups = groups_;
    }
    if (groups.empty()) return 0;

    for (pid_t pg : groups) {
        spdlog::debug("sending SIGTERM to process group {}", pg);
        kill(-pg, SIGTERM);
    }

    auto deadline = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < deadline) {
        bool alive = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (pid_t pg : groups) {
                if (groups_.count(pg) && kill(-pg, 0) == 0) {
                    alive = true;
                    break;
                }
            }
        }
        if (!alive) return groups.size();
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    for (pid_t pg : groups) {
        if (groups_.count(pg)) {
            spdlog::debug("sending SIGKILL to process group {}", pg);
            kill(-pg, SIGKILL);
        }
    }
    return groups.size();
}

// ============================================================================
// Helpers
// ============================================================================

namespace {

struct Pipe {
    int fds[2] = {-1, -1};

    ~Pipe() { close_all(); }

    bool open() { return pipe(fds) == 0; }
    int read_end() const { return fds[0]; }
    int write_end() const { return fds[1]; }

    void close_read() {
        if (fds[0] >= 0) { ::close(fds[0]); fds[0] = -1; }
    }
    void close_write() {
        if (fds[1] >= 0) { ::close(fds[1]); fds[1] = -1; }
    }
    void close_all() {
        close_read();
        close_write();
    }
};

std::string resolve_program(const std::string& program,
                            const std::map<std::string, std::string>& env) {
    if (program.find('/') != std::string::npos) return program;
    auto it = env.find("PATH");
    if (it == env.end()) return program;
    auto found = find_executable(program, split_path_list(it->second));
    return found ? *found : program;
}

bool drain(int fd, std::string& out) {
    char buf[8192];
    for (;;) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n > 0) {
            out.append(buf, static_cast<size_t>(n));
            continue;
        }
        if (n == 0) return false;  // EOF
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) return true;
        return false;
    }
}

} // namespace

// ============================================================================
// run_process
// ============================================================================

ProcessResult run_process(const ProcessSpec& spec, ProcessTracker* tracker) {
    ProcessResult result;

    if (spec.argv.empty()) {
        result.error = "empty command";
        return result;
    }

    // Everything the child touches is prepared before fork
    std::string program = resolve_program(spec.argv[0], spec.env);

    std::vector<std::string> env_strings;
    env_strings.reserve(spec.env.size());
    for (const auto& [key, value] : spec.env) {
        env_strings.push_back(key + "=" + value);
    }

    std::vector<char*> argv;
    for (const auto& s : spec.argv) {
        argv.push_back(const_cast<char*>(s.c_str()));
    }
    argv.push_back(nullptr);

    std::vector<char*> envp;
    for (auto& s : env_strings) {
        envp.push_back(const_cast<char*>(s.c_str()));
    }
    envp.push_back(nullptr);

    Pipe out_pipe;
    Pipe err_pipe;
    if (!out_pipe.open() || !err_pipe.open()) {
        result.error = "pipe failed: " + std::string(strerror(errno));
        return result;
    }

    int devnull = open("/dev/null", O_RDONLY);
    if (devnull < 0) {
        result.error = "failed to open /dev/null: " + std::string(strerror(errno));
        return result;
    }

    const char* cwd = spec.cwd.empty() ? nullptr : spec.cwd.c_str();

    pid_t pid = fork();
    if (pid == -1) {
        close(devnull);
        result.error = "fork failed: " + std::string(strerror(errno));
        return result;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);
        if (cwd && chdir(cwd) != 0) {
            _exit(127);
        }
        dup2(devnull, STDIN_FILENO);
        dup2(out_pipe.write_end(), STDOUT_FILENO);
        dup2(err_pipe.write_end(), STDERR_FILENO);
        close(devnull);
        close(out_pipe.read_end());
        close(out_pipe.write_end());
        close(err_pipe.read_end());
        close(err_pipe.write_end());

        execve(program.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Parent process. Set the group here too so the child cannot exec
    // before the group exists from our point of view.
    setpgid(pid, pid);
    close(devnull);
    out_pipe.close_write();
    err_pipe.close_write();

    if (tracker) tracker->add(pid);
    spdlog::debug("spawned pid {}: {}", pid, shell_join(spec.argv));

    fcntl(out_pipe.read_end(), F_SETFL, O_NONBLOCK);
    fcntl(err_pipe.read_end(), F_SETFL, O_NONBLOCK);

    bool out_open = true;
    bool err_open = true;
    bool killed = false;
    auto deadline = std::chrono::steady_clock::now() + spec.timeout;

    while (out_open || err_open) {
        int wait_ms = -1;
        if (spec.timeout.count() > 0 && !killed) {
            auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now());
            if (remaining.count() <= 0) {
                spdlog::warn("pid {} exceeded timeout of {}s, killing", pid,
                             spec.timeout.count());
                kill(-pid, SIGKILL);
                killed = true;
                result.timed_out = true;
            } else {
                wait_ms = static_cast<int>(remaining.count());
            }
        }

        struct pollfd fds[2];
        nfds_t count = 0;
        int out_idx = -1;
        int err_idx = -1;
        if (out_open) {
            out_idx = static_cast<int>(count);
            fds[count++] = {out_pipe.read_end(), POLLIN, 0};
        }
        if (err_open) {
            err_idx = static_cast<int>(count);
            fds[count++] = {err_pipe.read_end(), POLLIN, 0};
        }

        int rc = poll(fds, count, wait_ms);
        if (rc < 0) {
            if (errno == EINTR) continue;
            result.error = "poll failed: " + std::string(strerror(errno));
            kill(-pid, SIGKILL);
            break;
        }
        if (rc == 0) continue;

        if (out_idx >= 0 && fds[out_idx].revents) {
            out_open = drain(out_pipe.read_end(), result.stdout_data);
        }
        if (err_idx >= 0 && fds[err_idx].revents) {
            err_open = drain(err_pipe.read_end(), result.stderr_data);
        }
    }

    int status = 0;
    pid_t waited;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited == -1 && errno == EINTR);

    if (tracker) tracker->remove(pid);

    if (waited == -1) {
        result.error = "waitpid failed: " + std::string(strerror(errno));
        return result;
    }
    if (!result.error.empty()) {
        return result;
    }

    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
        result.ok = true;
    } else if (WIFSIGNALED(status)) {
        result.exit_code = 128 + WTERMSIG(status);
        result.ok = true;
    } else {
        result.error = "process terminated abnormally";
    }

    return result;
}

std::string shell_quote(const std::string& arg) {
    if (arg.empty()) return "''";

    bool safe = true;
    for (char c : arg) {
        if (!(std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' ||
              c == '.' || c == '/' || c == '=' || c == ':' || c == ',' || c == '@' ||
              c == '+')) {
            safe = false;
            break;
        }
    }
    if (safe) return arg;

    std::string out = "'";
    for (char c : arg) {
        if (c == '\'') {
            out += "'\\''";
        } else {
            out += c;
        }
    }
    out += "'";
    return out;
}

std::string shell_join(const std::vector<std::string>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); ++i) {
        if (i > 0) out += ' ';
        out += shell_quote(args[i]);
    }
    return out;
}

} // namespace testbed
