#pragma once

#include <cstddef>
#include <cstdint>
#include <gifpipe/encoder_plan.hpp>
#include <string>
#include <sys/types.h>
#include <vector>

namespace gifpipe
{

// How a stage process ended.
struct StageExit
{
    std::string program;
    pid_t       pid         = -1;
    int         exit_code   = -1;   // Valid when term_signal == 0
    int         term_signal = 0;

    bool success() const { return term_signal == 0 && exit_code == 0; }
};

// Pipeline — A chain of encoder processes connected stdout -> stdin.
//
// Usage:
//   auto pipeline = Pipeline::start(plan);
//   pipeline.write(bytes, size);      // feeds stage 0
//   auto exits = pipeline.finish();   // EOF to stage 0, then waits for all stages
//
// Only stage 0's stdin is exposed to the caller. Stage i's stdin is the
// read end of stage i-1's stdout pipe. stderr of every stage goes to
// /dev/null. The pipeline owns every pid and fd it creates; each pid is
// waited for exactly once, by finish() or the destructor.
//
// Not thread-safe. A Pipeline belongs to one export call.
class Pipeline
{
   public:
    // Validates the plan, then launches stages in order.
    // Throws ConfigurationError for a malformed plan (nothing launched) and
    // LaunchError if a stage cannot start (earlier stages are reaped first).
    static Pipeline start(const std::vector<EncoderStageSpec>& specs);

    ~Pipeline();

    Pipeline(const Pipeline&)            = delete;
    Pipeline& operator=(const Pipeline&) = delete;
    Pipeline(Pipeline&& other) noexcept;
    Pipeline& operator=(Pipeline&& other) noexcept;

    size_t stage_count() const { return stages_.size(); }
    pid_t  pid(size_t stage) const { return stages_.at(stage).pid; }

    // True while stage 0 can still receive bytes.
    bool is_input_open() const { return input_fd_ >= 0; }

    // Writes all of data into stage 0. Blocks while the pipe is full.
    // Throws std::system_error (EPIPE when stage 0 has exited) on failure.
    void write(const uint8_t* data, size_t len);

    // Signals end-of-stream to stage 0. Idempotent.
    void close_input();

    // Hands the read end of the last stage's stdout pipe to the caller,
    // who becomes responsible for closing it. Returns -1 if the last stage
    // does not write to a pipe or the fd was already taken.
    int take_output();

    // Closes stage 0's input, then waits for stage 0, 1, ... in order.
    // Safe to call more than once; later calls return the same result.
    std::vector<StageExit> finish();

    bool is_finished() const { return finished_; }

   private:
    struct Stage
    {
        std::string program;
        pid_t       pid = -1;
    };

    Pipeline() = default;

    void release();
    void abort_launched();

    // Waits for every stage finish() has not recorded yet, without
    // allocating or logging. Used when finish() throws inside the destructor.
    void reap_unwaited() noexcept;

    std::vector<Stage>     stages_;
    std::vector<StageExit> exits_;
    int                    input_fd_  = -1;
    int                    output_fd_ = -1;
    bool                   finished_  = true;
};

// Throws ConfigurationError if specs cannot be chained.
void validate_plan(const std::vector<EncoderStageSpec>& specs);

}   // namespace gifpipe
