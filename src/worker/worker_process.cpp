#include "../../include/worker/worker_process.hpp"
#include "../../include/rpc/line_decoder.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <mutex>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

extern char** environ;

namespace mcpgw::worker {

namespace LogCategory = logging::LogCategory;
using rpc::RpcError;
namespace error_code = rpc::error_code;

namespace {

// How long a dead worker's stdout may keep delivering buffered responses
constexpr auto OUTPUT_DRAIN = std::chrono::milliseconds(250);

void close_fd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Writes to a dead worker must fail with EPIPE instead of killing the gateway
void ignore_sigpipe_once() {
    static std::once_flag once;
    std::call_once(once, []() { std::signal(SIGPIPE, SIG_IGN); });
}

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        std::string key = eq == std::string::npos ? kv : kv.substr(0, eq);
        if (overrides.count(key) == 0)
            env.push_back(std::move(kv));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

WorkerProcess::WorkerProcess(WorkerDescriptor descriptor, size_t max_pending, logging::AsyncLogger& logger)
    : descriptor_(std::move(descriptor)), logger_(logger), pending_(max_pending) {}

WorkerProcess::~WorkerProcess() {
    terminate(std::chrono::milliseconds(1000));
}

// =============================================================================
// Spawn
// =============================================================================

void WorkerProcess::spawn() {
    if (pid_ > 0) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " already started");
    }
    if (descriptor_.command.empty()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " has no command");
    }

    ignore_sigpipe_once();

    // Everything the child needs is prepared before fork()
    std::vector<std::string> args = descriptor_.command;
    std::vector<char*> argv;
    for (auto& arg : args)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    std::vector<std::string> env = build_environment(descriptor_.env);
    std::vector<char*> envp;
    for (auto& entry : env)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    const char* working_dir = descriptor_.working_dir.empty() ? nullptr : descriptor_.working_dir.c_str();

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    int wake_pipe[2] = {-1, -1};

    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe, wake_pipe}) {
            close_fd(p[0]);
            close_fd(p[1]);
        }
    };

    // O_CLOEXEC keeps one worker's pipes out of workers spawned concurrently
    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(exec_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(wake_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_all();
        throw RpcError(error_code::MCP_BRIDGE_ERROR,
                       "Failed to create pipes for worker " + name() + ": " + std::strerror(err));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        close_all();
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Failed to fork worker " + name() + ": " + std::strerror(err));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only. Its own process group lets
        // terminate() and the exit waiter reach anything it spawns.
        ::setpgid(0, 0);
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);

        if (working_dir && ::chdir(working_dir) != 0) {
            int err = errno;
            ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            ::_exit(127);
        }

        ::execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = ::write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        ::_exit(127);
    }

    close_fd(in_pipe[0]);
    close_fd(out_pipe[1]);
    close_fd(err_pipe[1]);
    close_fd(exec_pipe[1]);

    // exec_pipe closes on successful exec; otherwise the child reports errno
    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(exec_pipe[0]);

    if (n > 0) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        close_all();
        LOGF_ERROR(logger_, LogCategory::Worker, "Failed to start worker %s (%s): %s", name().c_str(),
                   descriptor_.command[0].c_str(), std::strerror(child_errno));
        throw RpcError(error_code::MCP_BRIDGE_ERROR,
                       "Failed to start worker " + name() + ": " + std::strerror(child_errno));
    }

    pid_ = pid;
    stdin_fd_ = in_pipe[1];
    stdout_fd_ = out_pipe[0];
    stderr_fd_ = err_pipe[0];
    wake_read_fd_ = wake_pipe[0];
    wake_write_fd_ = wake_pipe[1];

    reader_thread_ = std::thread(&WorkerProcess::read_loop, this);
    stderr_thread_ = std::thread(&WorkerProcess::stderr_loop, this);
    waiter_thread_ = std::thread(&WorkerProcess::wait_loop, this);

    LOGF_INFO(logger_, LogCategory::Worker, "Started worker %s (pid %d)", name().c_str(), static_cast<int>(pid_));
}

// =============================================================================
// Requests
// =============================================================================

json WorkerProcess::send_request(const json& request) {
    if (pid_ <= 0 || has_exited()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " is not running");
    }

    auto id = request.find("id");
    if (id == request.end()) {
        throw RpcError(error_code::INVALID_REQUEST, "Request to worker " + name() + " has no id");
    }

    const std::string key = id_key(*id);
    const std::string method = request.value("method", "");

    std::future<json> future = pending_.add(key);
    try {
        write_line(request.dump(-1, ' ', false, json::error_handler_t::replace));
    } catch (const RpcError&) {
        pending_.remove(key);
        throw;
    }

    LOGF_DEBUG(logger_, LogCategory::Worker, "[%s] -> %s id=%s", name().c_str(), method.c_str(), key.c_str());

    if (future.wait_for(descriptor_.timeout) == std::future_status::ready) {
        return future.get();
    }

    if (pending_.remove(key)) {
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        LOGF_WARN(logger_, LogCategory::Worker, "[%s] %s id=%s timed out after %lld ms", name().c_str(),
                  method.c_str(), key.c_str(), static_cast<long long>(descriptor_.timeout.count()));
        throw RpcError(error_code::MCP_TIMEOUT_ERROR, "Request timeout for worker " + name(),
                       json{{"worker", name()}, {"method", method}, {"timeoutMs", descriptor_.timeout.count()}});
    }

    // The response won the race against the deadline
    return future.get();
}

void WorkerProcess::send_notification(const json& notification) {
    if (pid_ <= 0 || has_exited()) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " is not running");
    }
    write_line(notification.dump(-1, ' ', false, json::error_handler_t::replace));
}

void WorkerProcess::write_line(const std::string& line) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (stdin_fd_ < 0) {
        throw RpcError(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " input is closed");
    }

    std::string data = line;
    data.push_back('\n');

    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t n = ::write(stdin_fd_, p, remaining);
        if (n < 0) {
            if (errno == EINTR)
                continue;
            int err = errno;
            throw RpcError(error_code::MCP_BRIDGE_ERROR,
                           "Failed to write to worker " + name() + ": " + std::strerror(err));
        }
        p += n;
        remaining -= static_cast<size_t>(n);
    }
}

void WorkerProcess::close_stdin() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    close_fd(stdin_fd_);
}

// =============================================================================
// Reader threads
// =============================================================================

void WorkerProcess::read_loop() {
    rpc::LineReader reader(stdout_fd_);
    reader.set_wake_fd(wake_read_fd_);
    rpc::JsonLineStream stream(reader, [this](const std::string& line) {
        discarded_lines_.fetch_add(1, std::memory_order_relaxed);
        LOGF_DEBUG(logger_, LogCategory::Worker, "[%s] non-protocol output: %.160s", name().c_str(), line.c_str());
    });

    while (auto message = stream.next()) {
        dispatch_message(*message);
    }

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        output_closed_ = true;
    }
    exit_cv_.notify_all();
}

void WorkerProcess::stderr_loop() {
    rpc::LineReader reader(stderr_fd_);
    reader.set_wake_fd(wake_read_fd_);
    while (auto line = reader.next_line()) {
        if (line->find_first_not_of(" \t") == std::string::npos)
            continue;
        LOGF_WARN(logger_, LogCategory::WorkerStderr, "[%s] %s", name().c_str(), line->c_str());
    }
}

void WorkerProcess::dispatch_message(const json& message) {
    if (!message.is_object())
        return;

    // No notification or worker-initiated request channel
    if (message.contains("method") || !message.contains("id"))
        return;

    const std::string key = id_key(message["id"]);
    if (!pending_.resolve(key, message)) {
        late_responses_.fetch_add(1, std::memory_order_relaxed);
        LOGF_DEBUG(logger_, LogCategory::Worker, "[%s] dropped response with no pending request id=%s",
                   name().c_str(), key.c_str());
    }
}

void WorkerProcess::wait_loop() {
    const pid_t pid = pid_;

    // Wait without reaping: the zombie keeps the process group id reserved
    siginfo_t info{};
    int rc;
    do {
        rc = ::waitid(P_PID, static_cast<id_t>(pid), &info, WEXITED | WNOWAIT);
    } while (rc < 0 && errno == EINTR);

    // Descendants that inherited stdout would otherwise hold the pipe open
    ::kill(-pid, SIGKILL);

    int status = 0;
    pid_t reaped;
    do {
        reaped = ::waitpid(pid, &status, 0);
    } while (reaped < 0 && errno == EINTR);

    // Give responses already in the pipe a chance to reach their callers
    {
        std::unique_lock<std::mutex> lock(exit_mutex_);
        if (!exit_cv_.wait_for(lock, OUTPUT_DRAIN, [this]() { return output_closed_; })) {
            LOGF_WARN(logger_, LogCategory::Worker, "[%s] stdout still open after exit, abandoning it",
                      name().c_str());
        }
    }
    wake_readers();

    on_exit(reaped == pid ? status : 0);
}

void WorkerProcess::wake_readers() {
    if (wake_write_fd_ < 0)
        return;
    char byte = 1;
    ssize_t n;
    do {
        n = ::write(wake_write_fd_, &byte, 1);
    } while (n < 0 && errno == EINTR);
}

void WorkerProcess::on_exit(int status) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    int sig = WIFSIGNALED(status) ? WTERMSIG(status) : 0;
    bool expected = terminating_.load(std::memory_order_acquire);

    if (!expected) {
        set_state(WorkerState::Exited);
    }

    {
        std::lock_guard<std::mutex> lock(exit_mutex_);
        exit_code_ = code;
        exit_signal_ = sig;
        exited_.store(true, std::memory_order_release);
    }
    exit_cv_.notify_all();

    size_t rejected = pending_.close(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " exited");

    if (expected) {
        LOGF_INFO(logger_, LogCategory::Worker, "Worker %s stopped (code=%d signal=%d)", name().c_str(), code, sig);
        return;
    }

    LOGF_ERROR(logger_, LogCategory::Worker, "Worker %s exited unexpectedly (code=%d signal=%d, %zu pending rejected)",
               name().c_str(), code, sig, rejected);
    if (exit_callback_) {
        exit_callback_(*this, code, sig);
    }
}

// =============================================================================
// Shutdown
// =============================================================================

bool WorkerProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(exit_mutex_);
    return exit_cv_.wait_for(lock, timeout, [this]() { return exited_.load(std::memory_order_acquire); });
}

void WorkerProcess::terminate(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> guard(terminate_mutex_);

    if (pid_ <= 0) {
        pending_.close(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " shut down");
        set_state(WorkerState::Terminated);
        return;
    }

    terminating_.store(true, std::memory_order_release);

    if (!has_exited()) {
        LOGF_INFO(logger_, LogCategory::Worker, "Shutting down worker %s (pid %d)", name().c_str(),
                  static_cast<int>(pid_));
        close_stdin();
        ::kill(-pid_, SIGTERM);

        if (!wait_for_exit(grace)) {
            LOGF_WARN(logger_, LogCategory::Worker, "Force killing worker %s (pid %d)", name().c_str(),
                      static_cast<int>(pid_));
            ::kill(-pid_, SIGKILL);
            wait_for_exit(std::chrono::seconds(5));
        }
    }

    join_threads();
    close_stdin();
    close_fd(stdout_fd_);
    close_fd(stderr_fd_);
    close_fd(wake_read_fd_);
    close_fd(wake_write_fd_);

    pending_.close(error_code::MCP_BRIDGE_ERROR, "Worker " + name() + " shut down");
    set_state(WorkerState::Terminated);
}

void WorkerProcess::join_threads() {
    for (std::thread* t : {&reader_thread_, &stderr_thread_, &waiter_thread_}) {
        if (!t->joinable())
            continue;
        if (t->get_id() == std::this_thread::get_id()) {
            t->detach();
        } else {
            t->join();
        }
    }
}

} // namespace mcpgw::worker
