#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "runtime/runtime_backend.hpp"
#include "sandbox/process_runner.hpp"

namespace kiln::sandbox {

// Splits a child's output stream into user output and the end-of-frame
// marker line written by the interpreter driver. Text that could be the
// beginning of a marker is held back until it can be decided.
class MarkerDemux {
public:
    explicit MarkerDemux(std::string marker) : marker_(std::move(marker)) {}

    struct Event {
        std::string text;        // user output preceding the marker (or all of it)
        bool marker_seen = false;
        std::string marker_payload;  // rest of the marker line, without the newline
    };

    // Feeds a chunk and returns the events it completes, in order.
    std::vector<Event> Feed(const std::string& chunk);
    // Returns whatever was held back (end of stream).
    std::string Flush();

private:
    std::string marker_;
    std::string pending_;
};

// A long-lived Python interpreter that executes code frames in one shared
// global namespace, so variables persist between calls. The launcher spec
// names the interpreter (e.g. "python3", or "docker exec -i <id> python3");
// the driver arguments are appended to it.
class InterpreterSession {
public:
    explicit InterpreterSession(ProcessSpec launcher);
    ~InterpreterSession();

    InterpreterSession(const InterpreterSession&) = delete;
    InterpreterSession& operator=(const InterpreterSession&) = delete;

    void Start();
    bool Alive();

    // Runs one frame and returns the driver's status (0, 1 on an uncaught
    // exception, or the SystemExit code). Restarts a dead interpreter first.
    // Throws std::runtime_error if the interpreter dies mid-frame.
    int Execute(const std::string& code, kiln::runtime::OutputSink& sink);

    // Kills the interpreter; a pending Execute returns with an error.
    void Abort();
    // Stops the interpreter and joins its readers within a bounded time.
    // Returns false if any process started by it has outlived it (it left the
    // process group and kept the output pipes open).
    bool Close(std::chrono::milliseconds grace);

    static const char* DriverSource();

private:
    void ReadLoop(std::shared_ptr<ChildProcess> process, bool is_stdout);
    bool StopProcess(std::chrono::milliseconds grace);
    bool StopLocked(std::chrono::milliseconds grace);

    ProcessSpec launcher_;
    std::string marker_;

    std::mutex exec_mutex_;
    std::mutex lifecycle_mutex_;
    std::mutex state_mutex_;
    std::condition_variable state_cv_;
    std::shared_ptr<ChildProcess> process_;
    std::thread stdout_reader_;
    std::thread stderr_reader_;
    kiln::runtime::OutputSink* sink_ = nullptr;
    std::uint64_t stdout_marks_ = 0;
    std::uint64_t stderr_marks_ = 0;
    int last_status_ = 0;
    bool stdout_eof_ = false;
    bool stderr_eof_ = false;
    bool escaped_ = false;  // guarded by lifecycle_mutex_
};

}  // namespace kiln::sandbox
