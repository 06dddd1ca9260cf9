#include "sandbox/interpreter_session.hpp"

#include <algorithm>
#include <stdexcept>

#include <signal.h>

#include "utils/common.hpp"
#include "utils/hash.hpp"
#include "utils/logging.hpp"

namespace kiln::sandbox {
namespace {

constexpr std::chrono::milliseconds kOutputDrain{500};

// Reads "<length>\n<source>" frames from stdin and executes each in one
// shared namespace. After a frame, "<marker> <status>" goes to stdout and
// "<marker>" to stderr so the host knows both streams are drained.
constexpr const char* kDriver = R"PY(
import importlib, io, os, sys, traceback
_marker = sys.argv[1]
_frames = os.fdopen(os.dup(0), "rb")
_null = os.open(os.devnull, os.O_RDONLY)
os.dup2(_null, 0)
os.close(_null)
sys.stdin = io.StringIO()
_namespace = {"__name__": "__main__", "__builtins__": __builtins__}
while True:
    _header = _frames.readline()
    if not _header:
        break
    _size = int(_header.strip() or b"0")
    _source = _frames.read(_size).decode("utf-8", "replace")
    _status = 0
    importlib.invalidate_caches()
    try:
        exec(compile(_source, "<sandbox>", "exec"), _namespace)
    except SystemExit as _exit:
        _code = _exit.code
        _status = _code if isinstance(_code, int) else (0 if _code is None else 1)
    except BaseException:
        traceback.print_exc()
        _status = 1
    for _stream in (sys.stdout, sys.stderr):
        try:
            _stream.flush()
        except Exception:
            pass
    sys.__stdout__.write(_marker + " " + str(_status) + "\n")
    sys.__stdout__.flush()
    sys.__stderr__.write(_marker + "\n")
    sys.__stderr__.flush()
)PY";

}  // namespace

std::vector<MarkerDemux::Event> MarkerDemux::Feed(const std::string& chunk) {
    std::vector<Event> events;
    pending_ += chunk;
    for (;;) {
        const auto pos = pending_.find(marker_);
        if (pos != std::string::npos) {
            const auto newline = pending_.find('\n', pos + marker_.size());
            if (newline == std::string::npos) {
                if (pos > 0) {
                    events.push_back(Event{pending_.substr(0, pos), false, {}});
                    pending_.erase(0, pos);
                }
                break;
            }
            Event event{};
            event.text = pending_.substr(0, pos);
            event.marker_seen = true;
            event.marker_payload = kiln::utils::Trim(
                pending_.substr(pos + marker_.size(), newline - pos - marker_.size()));
            events.push_back(std::move(event));
            pending_.erase(0, newline + 1);
            continue;
        }
        std::size_t hold = std::min(pending_.size(), marker_.size() - 1);
        while (hold > 0 && pending_.compare(pending_.size() - hold, hold, marker_, 0, hold) != 0) {
            --hold;
        }
        if (pending_.size() > hold) {
            events.push_back(Event{pending_.substr(0, pending_.size() - hold), false, {}});
            pending_.erase(0, pending_.size() - hold);
        }
        break;
    }
    return events;
}

std::string MarkerDemux::Flush() {
    std::string rest;
    rest.swap(pending_);
    return rest;
}

InterpreterSession::InterpreterSession(ProcessSpec launcher) : launcher_(std::move(launcher)) {}

InterpreterSession::~InterpreterSession() {
    StopProcess(std::chrono::milliseconds(0));
}

const char* InterpreterSession::DriverSource() {
    return kDriver;
}

void InterpreterSession::Start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    StopLocked(std::chrono::milliseconds(0));
    marker_ = "__KILN_FRAME_" + kiln::utils::RandomHex(16) + "__";

    auto spec = launcher_;
    spec.args.insert(spec.args.end(), {"-u", "-c", kDriver, marker_});
    std::shared_ptr<ChildProcess> process = ChildProcess::Launch(spec);
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process_ = process;
        stdout_marks_ = 0;
        stderr_marks_ = 0;
        last_status_ = 0;
        stdout_eof_ = false;
        stderr_eof_ = false;
    }
    stdout_reader_ = std::thread(&InterpreterSession::ReadLoop, this, process, true);
    stderr_reader_ = std::thread(&InterpreterSession::ReadLoop, this, process, false);
}

bool InterpreterSession::Alive() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return process_ && !stdout_eof_ && !stderr_eof_ && !process_->TryWait().has_value();
}

int InterpreterSession::Execute(const std::string& code, kiln::runtime::OutputSink& sink) {
    std::lock_guard<std::mutex> exec_lock(exec_mutex_);
    if (!Alive()) {
        bool had_process = false;
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            had_process = static_cast<bool>(process_);
        }
        if (had_process) {
            kiln::utils::LogWarn("process", "python interpreter exited; starting a fresh one");
        }
        Start();
    }

    std::shared_ptr<ChildProcess> process;
    std::uint64_t target_out = 0;
    std::uint64_t target_err = 0;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process = process_;
        sink_ = &sink;
        target_out = stdout_marks_ + 1;
        target_err = stderr_marks_ + 1;
    }

    try {
        process->Write(std::to_string(code.size()) + "\n" + code);
    } catch (const std::exception& ex) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        sink_ = nullptr;
        throw std::runtime_error(std::string("python interpreter is not accepting input: ") + ex.what());
    }

    std::unique_lock<std::mutex> lock(state_mutex_);
    state_cv_.wait(lock, [&] {
        return (stdout_marks_ >= target_out && stderr_marks_ >= target_err) || stdout_eof_ || stderr_eof_;
    });
    const bool completed = stdout_marks_ >= target_out && stderr_marks_ >= target_err;
    sink_ = nullptr;
    if (!completed) {
        throw std::runtime_error("python interpreter exited during execution");
    }
    return last_status_;
}

void InterpreterSession::Abort() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (process_) {
        process_->Signal(SIGKILL);
    }
}

bool InterpreterSession::Close(std::chrono::milliseconds grace) {
    return StopProcess(grace);
}

bool InterpreterSession::StopProcess(std::chrono::milliseconds grace) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    return StopLocked(grace);
}

bool InterpreterSession::StopLocked(std::chrono::milliseconds grace) {
    std::shared_ptr<ChildProcess> process;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        process = std::move(process_);
        process_.reset();
    }
    if (process) {
        // EOF on stdin ends the driver loop.
        process->CloseStdin();
        process->Stop(grace);
        std::unique_lock<std::mutex> lock(state_mutex_);
        const bool drained = state_cv_.wait_for(lock, kOutputDrain, [this] { return stdout_eof_ && stderr_eof_; });
        lock.unlock();
        if (!drained) {
            kiln::utils::LogWarn("process", "interpreter output held open by a detached descendant",
                                 {{"pid", std::to_string(process->Pid())}});
            process->AbandonOutput();
            escaped_ = true;
        }
    }
    if (stdout_reader_.joinable()) {
        stdout_reader_.join();
    }
    if (stderr_reader_.joinable()) {
        stderr_reader_.join();
    }
    return !escaped_;
}

void InterpreterSession::ReadLoop(std::shared_ptr<ChildProcess> process, bool is_stdout) {
    MarkerDemux demux(marker_);
    auto deliver = [&](const std::string& text) {
        if (text.empty() || sink_ == nullptr) {
            return;
        }
        if (is_stdout) {
            sink_->AppendStdout(text);
        } else {
            sink_->AppendStderr(text);
        }
    };
    try {
        for (;;) {
            const auto chunk = is_stdout ? process->ReadStdout() : process->ReadStderr();
            if (chunk.empty()) {
                break;
            }
            for (auto& event : demux.Feed(chunk)) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                deliver(event.text);
                if (!event.marker_seen) {
                    continue;
                }
                if (is_stdout) {
                    try {
                        last_status_ = std::stoi(event.marker_payload);
                    } catch (const std::exception&) {
                        last_status_ = 1;
                    }
                    ++stdout_marks_;
                } else {
                    ++stderr_marks_;
                }
                state_cv_.notify_all();
            }
        }
    } catch (const std::exception& ex) {
        kiln::utils::LogWarn("process", "interpreter reader failed",
                             {{"stream", is_stdout ? "stdout" : "stderr"}, {"error", ex.what()}});
    }
    std::lock_guard<std::mutex> lock(state_mutex_);
    deliver(demux.Flush());
    if (is_stdout) {
        stdout_eof_ = true;
    } else {
        stderr_eof_ = true;
    }
    state_cv_.notify_all();
}

}  // namespace kiln::sandbox
