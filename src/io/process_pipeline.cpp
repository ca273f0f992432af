#include "process_pipeline.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <gifpipe/errors.hpp>
#include <gifpipe/logger.hpp>
#include <gifpipe/settings.hpp>
#include <pthread.h>
#include <spawn.h>
#include <sys/wait.h>
#include <system_error>
#include <unistd.h>

extern char** environ;

namespace gifpipe
{

namespace
{

inline void close_fd(int& fd)
{
    if (fd >= 0)
    {
        ::close(fd);
        fd = -1;
    }
}

// Blocks SIGPIPE for the calling thread so that writing to a pipe whose
// reader has exited fails with EPIPE instead of terminating the process.
// A SIGPIPE raised while blocked is consumed before the mask is restored.
class ScopedSigpipeBlock
{
   public:
    ScopedSigpipeBlock()
    {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigemptyset(&pending);
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_mask_);
    }

    ~ScopedSigpipeBlock()
    {
        if (!was_pending_)
        {
            sigset_t pending;
            sigemptyset(&pending);
            sigpending(&pending);
            if (sigismember(&pending, SIGPIPE) == 1)
            {
                struct timespec zero
                {
                };
                while (sigtimedwait(&sigpipe_, nullptr, &zero) < 0 && errno == EINTR)
                {
                }
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_mask_, nullptr);
    }

    ScopedSigpipeBlock(const ScopedSigpipeBlock&)            = delete;
    ScopedSigpipeBlock& operator=(const ScopedSigpipeBlock&) = delete;

   private:
    sigset_t sigpipe_;
    sigset_t old_mask_;
    bool     was_pending_ = false;
};

pid_t wait_for(pid_t pid, int& status)
{
    pid_t r;
    do
    {
        r = ::waitpid(pid, &status, 0);
    } while (r < 0 && errno == EINTR);
    return r;
}

std::string launch_hint()
{
    return std::string("The encoder may not be installed, or ") + FFMPEG_BINARY_ENV + " / "
           + IMAGEMAGICK_BINARY_ENV + " may point to the wrong binary";
}

}   // namespace

// ─── Plan validation ─────────────────────────────────────────────────────────

void validate_plan(const std::vector<EncoderStageSpec>& specs)
{
    if (specs.empty())
        throw ConfigurationError("encoder plan has no stages");

    for (size_t i = 0; i < specs.size(); ++i)
    {
        const auto& spec = specs[i];
        if (spec.program.empty())
            throw ConfigurationError("encoder stage " + std::to_string(i) + " has no program");

        bool last = i + 1 == specs.size();
        if (spec.output == OutputMode::File && !last)
            throw ConfigurationError("encoder stage " + std::to_string(i)
                                     + " writes a file but is not the last stage");

        if (i > 0)
        {
            bool upstream_pipes = specs[i - 1].output == OutputMode::Pipe;
            bool reads_pipe     = spec.input == InputMode::Pipe;
            if (upstream_pipes != reads_pipe)
                throw ConfigurationError("encoder stage " + std::to_string(i)
                                         + " input does not match stage " + std::to_string(i - 1)
                                         + " output");
        }
    }
}

// ─── Pipeline ────────────────────────────────────────────────────────────────

Pipeline Pipeline::start(const std::vector<EncoderStageSpec>& specs)
{
    validate_plan(specs);

    Pipeline pipeline;
    pipeline.finished_ = false;
    pipeline.stages_.reserve(specs.size());
    pipeline.exits_.reserve(specs.size());

    // Read end of the previous stage's stdout, owned by us until handed on.
    int upstream_read = -1;

    for (size_t i = 0; i < specs.size(); ++i)
    {
        const auto& spec = specs[i];

        int child_stdin  = -1;
        int child_stdout = -1;
        int next_read    = -1;

        auto fail = [&](const std::string& reason)
        {
            close_fd(child_stdin);
            close_fd(child_stdout);
            close_fd(next_read);
            close_fd(upstream_read);
            pipeline.abort_launched();
            GIFPIPE_LOG_ERROR("pipeline", "Stage {} ({}) failed to start: {}", i, spec.program, reason);
            throw LaunchError(spec.program, reason, launch_hint());
        };

        if (spec.input == InputMode::Pipe)
        {
            if (i == 0)
            {
                int fds[2];
                if (::pipe2(fds, O_CLOEXEC) < 0)
                    fail(std::strerror(errno));
                child_stdin        = fds[0];
                pipeline.input_fd_ = fds[1];
            }
            else
            {
                child_stdin   = upstream_read;
                upstream_read = -1;
            }
        }

        if (spec.output == OutputMode::Pipe)
        {
            int fds[2];
            if (::pipe2(fds, O_CLOEXEC) < 0)
                fail(std::strerror(errno));
            next_read    = fds[0];
            child_stdout = fds[1];
        }

        std::vector<char*> argv;
        argv.reserve(spec.args.size() + 2);
        argv.push_back(const_cast<char*>(spec.program.c_str()));
        for (const auto& arg : spec.args)
            argv.push_back(const_cast<char*>(arg.c_str()));
        argv.push_back(nullptr);

        posix_spawn_file_actions_t actions;
        int                        ret = posix_spawn_file_actions_init(&actions);
        if (ret != 0)
            fail(std::strerror(ret));

        if (child_stdin >= 0)
            ret = posix_spawn_file_actions_adddup2(&actions, child_stdin, STDIN_FILENO);
        else
            ret = posix_spawn_file_actions_addopen(&actions, STDIN_FILENO, "/dev/null", O_RDONLY, 0);
        if (ret == 0 && child_stdout >= 0)
            ret = posix_spawn_file_actions_adddup2(&actions, child_stdout, STDOUT_FILENO);
        else if (ret == 0)
            ret = posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        if (ret == 0)
            ret = posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
        if (ret != 0)
        {
            posix_spawn_file_actions_destroy(&actions);
            fail(std::strerror(ret));
        }

        pid_t pid = 0;
        ret       = posix_spawnp(&pid, spec.program.c_str(), &actions, nullptr, argv.data(), environ);
        posix_spawn_file_actions_destroy(&actions);

        // The child holds its own copies now.
        close_fd(child_stdin);
        close_fd(child_stdout);

        if (ret != 0)
            fail(std::strerror(ret));

        GIFPIPE_LOG_DEBUG("pipeline", "Started stage {} pid={}: {}", i, pid, spec.command_line());
        pipeline.stages_.push_back(Stage{spec.program, pid});
        upstream_read = next_read;
    }

    pipeline.output_fd_ = upstream_read;
    return pipeline;
}

Pipeline::~Pipeline()
{
    try
    {
        release();
    }
    catch (const std::exception&)
    {
        reap_unwaited();
    }
}

Pipeline::Pipeline(Pipeline&& other) noexcept
    : stages_(std::move(other.stages_)),
      exits_(std::move(other.exits_)),
      input_fd_(other.input_fd_),
      output_fd_(other.output_fd_),
      finished_(other.finished_)
{
    other.input_fd_  = -1;
    other.output_fd_ = -1;
    other.finished_  = true;
}

Pipeline& Pipeline::operator=(Pipeline&& other) noexcept
{
    if (this != &other)
    {
        release();
        stages_          = std::move(other.stages_);
        exits_           = std::move(other.exits_);
        input_fd_        = other.input_fd_;
        output_fd_       = other.output_fd_;
        finished_        = other.finished_;
        other.input_fd_  = -1;
        other.output_fd_ = -1;
        other.finished_  = true;
    }
    return *this;
}

void Pipeline::write(const uint8_t* data, size_t len)
{
    if (input_fd_ < 0)
        throw std::system_error(EBADF, std::generic_category(), "pipeline input is closed");

    ScopedSigpipeBlock block_sigpipe;

    size_t total = 0;
    while (total < len)
    {
        ssize_t n = ::write(input_fd_, data + total, len - total);
        if (n < 0)
        {
            int err = errno;
            if (err == EINTR)
                continue;
            throw std::system_error(err,
                                    std::generic_category(),
                                    "write to " + stages_.front().program);
        }
        total += static_cast<size_t>(n);
    }
}

void Pipeline::close_input()
{
    close_fd(input_fd_);
}

int Pipeline::take_output()
{
    int fd     = output_fd_;
    output_fd_ = -1;
    return fd;
}

std::vector<StageExit> Pipeline::finish()
{
    if (finished_)
        return exits_;

    // EOF to stage 0 cascades down the chain as each stage exits. An
    // untaken output pipe is closed too so the last stage never blocks
    // on a reader that does not exist.
    close_input();
    close_fd(output_fd_);

    // Resumes after the last recorded stage if an earlier call was cut short.
    // Each exit is recorded before it is logged.
    for (size_t i = exits_.size(); i < stages_.size(); ++i)
    {
        StageExit exit;
        exit.program = stages_[i].program;
        exit.pid     = stages_[i].pid;

        int status   = 0;
        int wait_err = 0;
        if (wait_for(stages_[i].pid, status) < 0)
            wait_err = errno;
        else if (WIFEXITED(status))
            exit.exit_code = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            exit.term_signal = WTERMSIG(status);

        exits_.push_back(std::move(exit));
        const StageExit& recorded = exits_.back();

        if (wait_err != 0)
            GIFPIPE_LOG_WARN("pipeline",
                             "waitpid failed for stage {} pid={}: {}",
                             i,
                             recorded.pid,
                             std::strerror(wait_err));
        else if (recorded.success())
            GIFPIPE_LOG_DEBUG("pipeline", "Stage {} ({}) exited cleanly", i, recorded.program);
        else
            GIFPIPE_LOG_WARN("pipeline",
                             "Stage {} ({}) ended with exit_code={} signal={}",
                             i,
                             recorded.program,
                             recorded.exit_code,
                             recorded.term_signal);
    }

    finished_ = true;
    return exits_;
}

void Pipeline::release()
{
    if (!finished_)
        finish();
    close_fd(input_fd_);
    close_fd(output_fd_);
}

void Pipeline::reap_unwaited() noexcept
{
    close_fd(input_fd_);
    close_fd(output_fd_);

    for (size_t i = exits_.size(); i < stages_.size(); ++i)
    {
        int status = 0;
        wait_for(stages_[i].pid, status);
    }
    finished_ = true;
}

void Pipeline::abort_launched()
{
    close_fd(input_fd_);
    close_fd(output_fd_);

    for (const auto& stage : stages_)
    {
        ::kill(stage.pid, SIGTERM);
        int status = 0;
        wait_for(stage.pid, status);
        GIFPIPE_LOG_DEBUG("pipeline", "Reaped pid={} after failed launch", stage.pid);
    }
    stages_.clear();
    finished_ = true;
}

}   // namespace gifpipe
