#include "vshadertest/process.hpp"

#include <cerrno>
#include <cstring>
#include <ctime>
#include <string>
#include <utility>
#include <vector>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace vshadertest
{
    namespace
    {
        // --------------------------------------------------------
        // SIGPIPE handling (calling thread only)
        //
        // A child that exits without draining stdin must surface as EPIPE
        // on write, not kill the host. SIGPIPE is blocked for this thread
        // while stdin is fed; one raised by our own writes is consumed
        // before the previous mask is restored. The process-wide
        // disposition is never touched.
        // --------------------------------------------------------
        class ScopedSigpipeBlock
        {
        public:
            ScopedSigpipeBlock()
            {
                sigemptyset(&m_Pipe);
                sigaddset(&m_Pipe, SIGPIPE);

                sigset_t pending;
                sigemptyset(&pending);
                m_WasPending = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;

                m_Active = ::pthread_sigmask(SIG_BLOCK, &m_Pipe, &m_Previous) == 0;
            }

            ~ScopedSigpipeBlock()
            {
                if (!m_Active)
                    return;

                if (!m_WasPending)
                {
                    sigset_t pending;
                    sigemptyset(&pending);
                    if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1)
                    {
                        const timespec zero {0, 0};
                        while (::sigtimedwait(&m_Pipe, nullptr, &zero) < 0 && errno == EINTR)
                        {
                        }
                    }
                }

                ::pthread_sigmask(SIG_SETMASK, &m_Previous, nullptr);
            }

            ScopedSigpipeBlock(const ScopedSigpipeBlock&)            = delete;
            ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

        private:
            sigset_t m_Pipe {};
            sigset_t m_Previous {};
            bool     m_WasPending = false;
            bool     m_Active     = false;
        };

        class FileDescriptor
        {
        public:
            FileDescriptor() = default;
            explicit FileDescriptor(int fd) : m_Fd(fd) {}
            ~FileDescriptor() { reset(); }

            FileDescriptor(const FileDescriptor&)            = delete;
            FileDescriptor& operator=(const FileDescriptor&) = delete;

            FileDescriptor(FileDescriptor&& other) noexcept : m_Fd(std::exchange(other.m_Fd, -1)) {}
            FileDescriptor& operator=(FileDescriptor&& other) noexcept
            {
                if (this != &other)
                {
                    reset();
                    m_Fd = std::exchange(other.m_Fd, -1);
                }
                return *this;
            }

            int  get() const { return m_Fd; }
            bool valid() const { return m_Fd >= 0; }

            void reset()
            {
                if (m_Fd >= 0)
                    ::close(m_Fd);
                m_Fd = -1;
            }

        private:
            int m_Fd = -1;
        };

        struct PipePair
        {
            FileDescriptor read;
            FileDescriptor write;
        };

        bool make_pipe(PipePair& out)
        {
            int fds[2] = {-1, -1};
            if (::pipe2(fds, O_CLOEXEC) != 0)
                return false;
            out.read  = FileDescriptor(fds[0]);
            out.write = FileDescriptor(fds[1]);
            return true;
        }

        std::string errno_message(const std::string& what, int err) { return what + ": " + std::strerror(err); }

        bool drain_into(int fd, std::string& out, bool& eof)
        {
            char buf[4096];
            for (;;)
            {
                const ssize_t n = ::read(fd, buf, sizeof(buf));
                if (n > 0)
                {
                    out.append(buf, static_cast<size_t>(n));
                    return true;
                }
                if (n == 0)
                {
                    eof = true;
                    return true;
                }
                if (errno == EINTR)
                    continue;
                if (errno == EAGAIN || errno == EWOULDBLOCK)
                    return true;
                return false;
            }
        }

        // argv for execvp, pointing into `command`. Built before fork() so
        // the child only makes async-signal-safe calls.
        std::vector<char*> make_argv(const ProcessCommand& command)
        {
            std::vector<char*> argv;
            argv.reserve(command.args.size() + 2);
            argv.push_back(const_cast<char*>(command.program.c_str()));
            for (const auto& a : command.args)
                argv.push_back(const_cast<char*>(a.c_str()));
            argv.push_back(nullptr);
            return argv;
        }

        // Child side: never returns. No allocation between fork() and exec.
        [[noreturn]] void exec_child(const char* program,
                                     char* const* argv,
                                     PipePair&    in,
                                     PipePair&    out,
                                     PipePair&    err,
                                     PipePair&    status)
        {
            // The tools start with default SIGPIPE handling and an empty
            // signal mask whatever the host process uses.
            ::signal(SIGPIPE, SIG_DFL);
            sigset_t none;
            sigemptyset(&none);
            ::sigprocmask(SIG_SETMASK, &none, nullptr);

            if (::dup2(in.read.get(), STDIN_FILENO) < 0 || ::dup2(out.write.get(), STDOUT_FILENO) < 0 ||
                ::dup2(err.write.get(), STDERR_FILENO) < 0)
            {
                const int e = errno;
                (void)!::write(status.write.get(), &e, sizeof(e));
                ::_exit(127);
            }

            ::execvp(program, argv);

            // Only reached when exec failed. The status pipe is O_CLOEXEC, so
            // the parent reads EOF on success and an errno value on failure.
            const int e = errno;
            (void)!::write(status.write.get(), &e, sizeof(e));
            ::_exit(127);
        }
    } // namespace

    std::string format_command_line(const ProcessCommand& command)
    {
        std::string line = command.program;
        for (const auto& a : command.args)
        {
            line.push_back(' ');
            if (a.empty() || a.find_first_of(" \t\"'") != std::string::npos)
            {
                line.push_back('\'');
                line += a;
                line.push_back('\'');
            }
            else
            {
                line += a;
            }
        }
        return line;
    }

    Result<ProcessOutput> PosixProcessRunner::run(const ProcessCommand& command)
    {
        if (command.program.empty())
            return Result<ProcessOutput>::err({ErrorCode::eInvalidArgument, "No program given to run."});

        std::vector<char*> argv = make_argv(command);

        PipePair in, out, err, status;
        if (!make_pipe(in) || !make_pipe(out) || !make_pipe(err) || !make_pipe(status))
            return Result<ProcessOutput>::err(
                {ErrorCode::eSpawnError, errno_message("Failed to create pipes for " + command.program, errno)});

        const pid_t pid = ::fork();
        if (pid < 0)
            return Result<ProcessOutput>::err(
                {ErrorCode::eSpawnError, errno_message("Failed to fork for " + command.program, errno)});

        if (pid == 0)
            exec_child(command.program.c_str(), argv.data(), in, out, err, status);

        // Parent: close the child's ends.
        in.read.reset();
        out.write.reset();
        err.write.reset();
        status.write.reset();

        // Wait for exec to succeed or report failure.
        {
            int     childErrno = 0;
            ssize_t n          = 0;
            do
            {
                n = ::read(status.read.get(), &childErrno, sizeof(childErrno));
            } while (n < 0 && errno == EINTR);

            if (n == static_cast<ssize_t>(sizeof(childErrno)))
            {
                int ws = 0;
                while (::waitpid(pid, &ws, 0) < 0 && errno == EINTR)
                {
                }
                return Result<ProcessOutput>::err(
                    {ErrorCode::eSpawnError, errno_message("Failed to spawn " + command.program, childErrno)});
            }
        }

        ::fcntl(out.read.get(), F_SETFL, ::fcntl(out.read.get(), F_GETFL) | O_NONBLOCK);
        ::fcntl(err.read.get(), F_SETFL, ::fcntl(err.read.get(), F_GETFL) | O_NONBLOCK);

        const std::string stdinData = command.stdinData.value_or(std::string {});
        size_t            written   = 0;
        if (stdinData.empty())
            in.write.reset();
        else
            ::fcntl(in.write.get(), F_SETFL, ::fcntl(in.write.get(), F_GETFL) | O_NONBLOCK);

        ScopedSigpipeBlock sigpipeBlock;

        ProcessOutput result;
        bool          outEof  = false;
        bool          errEof  = false;
        Error         ioError = Error::ok();

        while (!outEof || !errEof || in.write.valid())
        {
            pollfd fds[3];
            nfds_t count = 0;

            int outIdx = -1, errIdx = -1, inIdx = -1;
            if (!outEof)
            {
                outIdx = static_cast<int>(count);
                fds[count++] = {out.read.get(), POLLIN, 0};
            }
            if (!errEof)
            {
                errIdx = static_cast<int>(count);
                fds[count++] = {err.read.get(), POLLIN, 0};
            }
            if (in.write.valid())
            {
                inIdx = static_cast<int>(count);
                fds[count++] = {in.write.get(), POLLOUT, 0};
            }

            const int ready = ::poll(fds, count, -1);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                ioError = {ErrorCode::eIO, errno_message("poll failed while running " + command.program, errno)};
                break;
            }

            if (outIdx >= 0 && (fds[outIdx].revents & (POLLIN | POLLHUP | POLLERR)))
            {
                if (!drain_into(out.read.get(), result.stdoutText, outEof))
                {
                    ioError = {ErrorCode::eIO, errno_message("Failed to read stdout of " + command.program, errno)};
                    break;
                }
            }

            if (errIdx >= 0 && (fds[errIdx].revents & (POLLIN | POLLHUP | POLLERR)))
            {
                if (!drain_into(err.read.get(), result.stderrText, errEof))
                {
                    ioError = {ErrorCode::eIO, errno_message("Failed to read stderr of " + command.program, errno)};
                    break;
                }
            }

            if (inIdx >= 0 && (fds[inIdx].revents & (POLLOUT | POLLERR | POLLHUP)))
            {
                const ssize_t n = ::write(in.write.get(), stdinData.data() + written, stdinData.size() - written);
                if (n > 0)
                {
                    written += static_cast<size_t>(n);
                    if (written == stdinData.size())
                        in.write.reset();
                }
                else if (n < 0 && errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK)
                {
                    // The child stopped reading (EPIPE); whatever it reports on
                    // its output streams is the useful diagnostic.
                    in.write.reset();
                }
            }
        }

        in.write.reset();
        out.read.reset();
        err.read.reset();

        int waitStatus = 0;
        while (::waitpid(pid, &waitStatus, 0) < 0)
        {
            if (errno != EINTR)
                return Result<ProcessOutput>::err(
                    {ErrorCode::eIO, errno_message("Failed to wait for " + command.program, errno)});
        }

        if (ioError.code != ErrorCode::eOk)
            return Result<ProcessOutput>::err(ioError);

        if (WIFEXITED(waitStatus))
            result.exitCode = WEXITSTATUS(waitStatus);
        else if (WIFSIGNALED(waitStatus))
            result.exitCode = 128 + WTERMSIG(waitStatus);
        else
            result.exitCode = -1;

        return Result<ProcessOutput>::ok(std::move(result));
    }
} // namespace vshadertest
