#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <vector>

#include "CommandRunner.hpp"

//=============================================================================================
CommandResult::CommandResult() :
    started(false),
    timed_out(false),
    exit_status(-1)
{
}

//=============================================================================================
std::string CommandRunner::describe(const std::vector<std::string>& arguments)
{
    std::string description;

    for (std::vector<std::string>::const_iterator iter = arguments.begin();
         iter != arguments.end();
         ++iter)
    {
        if (iter != arguments.begin())
        {
            description += " ";
        }

        description += *iter;
    }

    return description;
}

//=============================================================================================
PosixCommandRunner::PosixCommandRunner()
{
}

//=============================================================================================
PosixCommandRunner::~PosixCommandRunner()
{
}

//=============================================================================================
bool PosixCommandRunner::run(const std::vector<std::string>& arguments,
                             const std::chrono::milliseconds& timeout,
                             CommandResult&                   result)
{
    result = CommandResult();

    if (arguments.empty())
    {
        return false;
    }

    // Output pipes, plus one that only carries an errno back if exec fails; it is close-on-exec
    // so a successful exec closes it without writing anything
    int stdout_pipe[2];
    int stderr_pipe[2];
    int exec_pipe[2];

    if (pipe(stdout_pipe) == -1)
    {
        result.error_output = std::strerror(errno);
        return false;
    }

    if (pipe(stderr_pipe) == -1)
    {
        result.error_output = std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        return false;
    }

    if (pipe2(exec_pipe, O_CLOEXEC) == -1)
    {
        result.error_output = std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        return false;
    }

    // Built before forking; only async-signal-safe calls are allowed in the child
    std::vector<char*> argv;
    for (unsigned int i = 0; i < arguments.size(); i++)
    {
        argv.push_back(const_cast<char*>(arguments[i].c_str()));
    }
    argv.push_back(0);

    pid_t pid = fork();

    if (pid == -1)
    {
        result.error_output = std::strerror(errno);
        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close(exec_pipe[0]);
        close(exec_pipe[1]);
        return false;
    }

    if (pid == 0)
    {
        setpgid(0, 0);

        int null_fd = open("/dev/null", O_RDONLY);
        if (null_fd != -1)
        {
            dup2(null_fd, STDIN_FILENO);
            close(null_fd);
        }

        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);

        close(stdout_pipe[0]);
        close(stdout_pipe[1]);
        close(stderr_pipe[0]);
        close(stderr_pipe[1]);
        close(exec_pipe[0]);

        execvp(argv[0], &argv[0]);

        int exec_errno = errno;
        ssize_t unused = write(exec_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)unused;
        _exit(127);
    }

    close(stdout_pipe[1]);
    close(stderr_pipe[1]);
    close(exec_pipe[1]);

    std::chrono::steady_clock::time_point deadline = std::chrono::steady_clock::now() + timeout;

    int exec_errno = 0;
    ssize_t exec_bytes = 0;
    do
    {
        exec_bytes = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    }
    while (exec_bytes == -1 && errno == EINTR);
    close(exec_pipe[0]);

    if (exec_bytes == static_cast<ssize_t>(sizeof(exec_errno)))
    {
        result.error_output = std::string("cannot execute ") + arguments[0] + ": " +
            std::strerror(exec_errno);

        close(stdout_pipe[0]);
        close(stderr_pipe[0]);

        bool unused_timed_out = false;
        result.exit_status = reap(pid, deadline, unused_timed_out);
        return false;
    }

    result.started = true;

    pollfd fds[2];
    fds[0].fd      = stdout_pipe[0];
    fds[0].events  = POLLIN;
    fds[0].revents = 0;
    fds[1].fd      = stderr_pipe[0];
    fds[1].events  = POLLIN;
    fds[1].revents = 0;

    std::string* destinations[2] = { &result.output, &result.error_output };

    unsigned int open_count = 2;
    char buffer[4096];

    // Collect output until the child closes both pipes or time runs out
    while (open_count > 0)
    {
        std::chrono::steady_clock::duration remaining =
            deadline - std::chrono::steady_clock::now();

        if (remaining <= std::chrono::steady_clock::duration::zero())
        {
            result.timed_out = true;
            break;
        }

        int remaining_ms = static_cast<int>(
            std::chrono::duration_cast<std::chrono::milliseconds>(remaining).count()) + 1;

        int ready = poll(fds, 2, remaining_ms);
        if (ready == -1)
        {
            if (errno == EINTR)
            {
                continue;
            }

            break;
        }

        for (unsigned int i = 0; i < 2; i++)
        {
            if (fds[i].fd == -1 || fds[i].revents == 0)
            {
                continue;
            }

            ssize_t bytes_read = read(fds[i].fd, buffer, sizeof(buffer));
            if (bytes_read > 0)
            {
                destinations[i]->append(buffer, bytes_read);
            }
            else if (bytes_read == 0 || errno != EINTR)
            {
                close(fds[i].fd);
                fds[i].fd = -1;
                open_count--;
            }
        }
    }

    for (unsigned int i = 0; i < 2; i++)
    {
        if (fds[i].fd != -1)
        {
            close(fds[i].fd);
        }
    }

    if (result.timed_out)
    {
        kill(-pid, SIGKILL);
        kill(pid, SIGKILL);
    }

    bool reap_timed_out = false;
    result.exit_status = reap(pid, deadline, reap_timed_out);
    result.timed_out = result.timed_out || reap_timed_out;

    return !result.timed_out && result.exit_status == 0;
}

//=============================================================================================
int PosixCommandRunner::reap(pid_t                                        pid,
                             const std::chrono::steady_clock::time_point& deadline,
                             bool&                                        timed_out)
{
    int status = 0;

    // The child may outlive its output pipes, so keep honoring the deadline while waiting
    while (true)
    {
        pid_t reaped = waitpid(pid, &status, WNOHANG);

        if (reaped == pid)
        {
            return decodeStatus(status);
        }

        if (reaped == -1 && errno != EINTR)
        {
            return -1;
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            timed_out = true;
            kill(-pid, SIGKILL);
            kill(pid, SIGKILL);
            break;
        }

        usleep(10000);
    }

    while (waitpid(pid, &status, 0) == -1)
    {
        if (errno != EINTR)
        {
            return -1;
        }
    }

    return decodeStatus(status);
}

//=============================================================================================
int PosixCommandRunner::decodeStatus(int status)
{
    if (WIFEXITED(status))
    {
        return WEXITSTATUS(status);
    }

    if (WIFSIGNALED(status))
    {
        return 128 + WTERMSIG(status);
    }

    return -1;
}
