#if !defined COMMAND_RUNNER_HPP
#define COMMAND_RUNNER_HPP

#include <chrono>
#include <string>
#include <sys/types.h>
#include <vector>

struct CommandResult
{
    CommandResult();

    // False if the program could not be executed at all
    bool started;

    // True if the program was killed for running past its timeout
    bool timed_out;

    // Exit code, or 128 + signal number if the program was killed by a signal; -1 if unknown
    int exit_status;

    std::string output;

    std::string error_output;
};

// Runs external programs and waits for them, never for longer than the given timeout
class CommandRunner
{
public:

    virtual ~CommandRunner() {}

    // arguments[0] is searched for on PATH.  Returns true only if the program ran to
    // completion within timeout and exited with status 0.
    virtual bool run(const std::vector<std::string>& arguments,
                     const std::chrono::milliseconds& timeout,
                     CommandResult&                   result) = 0;

    // Space-separated rendition of arguments, for log messages
    static std::string describe(const std::vector<std::string>& arguments);
};

// fork()/exec() implementation.  Each child is placed in its own process group and the whole
// group is sent SIGKILL when the timeout expires.
class PosixCommandRunner : public CommandRunner
{
public:

    PosixCommandRunner();

    virtual ~PosixCommandRunner();

    virtual bool run(const std::vector<std::string>& arguments,
                     const std::chrono::milliseconds& timeout,
                     CommandResult&                   result);

private:

    // Waits for the child to exit, killing it at the deadline
    static int reap(pid_t pid, const std::chrono::steady_clock::time_point& deadline,
                    bool& timed_out);

    static int decodeStatus(int status);

    PosixCommandRunner(const PosixCommandRunner&);
    PosixCommandRunner& operator=(const PosixCommandRunner&);
};

#endif
