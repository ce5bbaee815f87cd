#include "sandbox/sandbox_executor.hpp"

#include <array>
#include <functional>

#include <signal.h>
#include <sys/wait.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "sandbox/exec_environment.hpp"
#include "utils/common.hpp"
#include "utils/logging.hpp"
#include "utils/process.hpp"

namespace rampart::sandbox {
namespace bp = utils::bp;
namespace {

std::string SignalName(int sig) {
    switch (sig) {
        case SIGTERM: return "SIGTERM";
        case SIGKILL: return "SIGKILL";
        case SIGINT: return "SIGINT";
        case SIGHUP: return "SIGHUP";
        case SIGQUIT: return "SIGQUIT";
        case SIGABRT: return "SIGABRT";
        case SIGSEGV: return "SIGSEGV";
        case SIGPIPE: return "SIGPIPE";
        default: return "SIG" + std::to_string(sig);
    }
}

struct StreamState {
    std::array<char, 8192> buffer{};
    std::string accumulated;
    bool done = false;
};

}  // namespace

SandboxExecutor::SandboxExecutor(ExecutorOptions options, SandboxWrapper* wrapper)
    : options_(std::move(options))
    , wrapper_(wrapper) {
    if (options_.home_dir.empty()) {
        options_.home_dir = utils::GetHomePath();
    }
}

CommandExecutionResult SandboxExecutor::Run(const CommandExecutionRequest& request, OutputChannel* events) const {
    CommandExecutionResult result;
    std::error_code cwd_ec;
    const auto cwd = request.working_dir.empty() ? std::filesystem::current_path(cwd_ec) : request.working_dir;

    WrappedCommand wrapped = ShellCommand(request.command);
    if (request.sandbox && HasSandbox()) {
        try {
            wrapped = wrapper_->Wrap(request.command, cwd);
            result.sandboxed = true;
        } catch (const std::exception& ex) {
            utils::Log(utils::LogLevel::kWarn, "sandbox", "wrap failed, running unsandboxed",
                       {{"wrapper", wrapper_->Name()}, {"error", ex.what()}});
            wrapped = ShellCommand(request.command);
        }
    }

    try {
        boost::asio::io_context ioc;
        bp::async_pipe out_pipe(ioc);
        bp::async_pipe err_pipe(ioc);
        bp::group group;

        bp::environment env = boost::this_process::environment();
        const auto path_it = env.find("PATH");
        const std::string current_path = path_it != env.end() ? path_it->to_string() : std::string();
        env["PATH"] = BuildAugmentedPath(options_.home_dir, current_path);
        for (const auto& [key, value] : wrapped.env) {
            env[key] = value;
        }

        const std::vector<std::string> args(wrapped.argv.begin() + 1, wrapped.argv.end());
        bp::child child(bp::exe = wrapped.argv.front(),
                        bp::args = args,
                        env,
                        bp::start_dir = cwd.string(),
                        bp::std_in.close(),
                        bp::std_out > out_pipe,
                        bp::std_err > err_pipe,
                        group);

        StreamState out_state;
        StreamState err_state;
        const auto deliver = [&](OutputStream stream, StreamState& state, std::size_t n) {
            if (n == 0) {
                return;
            }
            if (state.accumulated.size() + n <= options_.max_buffer) {
                state.accumulated.append(state.buffer.data(), n);
            }
            if (events) {
                events->Publish(OutputEvent{stream, std::string(state.buffer.data(), n)});
            }
        };

        std::function<void(bp::async_pipe&, OutputStream, StreamState&)> read_stream;
        read_stream = [&](bp::async_pipe& pipe, OutputStream stream, StreamState& state) {
            pipe.async_read_some(boost::asio::buffer(state.buffer),
                                 [&, stream](const boost::system::error_code& ec, std::size_t n) {
                deliver(stream, state, n);
                if (ec) {
                    state.done = true;
                    return;
                }
                read_stream(pipe, stream, state);
            });
        };
        read_stream(out_pipe, OutputStream::kStdout, out_state);
        read_stream(err_pipe, OutputStream::kStderr, err_state);

        boost::asio::steady_timer timer(ioc);
        bool term_sent = false;
        bool kill_sent = false;
        std::chrono::steady_clock::time_point kill_deadline;
        std::function<void()> watch;
        watch = [&] {
            timer.expires_after(options_.poll_interval);
            timer.async_wait([&](const boost::system::error_code& ec) {
                if (ec) {
                    return;
                }
                std::error_code running_ec;
                const bool running = child.running(running_ec);
                if (!running && out_state.done && err_state.done) {
                    return;
                }
                if (request.cancel.IsCancelled() && !term_sent) {
                    ::killpg(group.native_handle(), SIGTERM);
                    term_sent = true;
                    kill_deadline = std::chrono::steady_clock::now() + options_.grace_period;
                } else if (term_sent && !kill_sent && std::chrono::steady_clock::now() >= kill_deadline) {
                    std::error_code kill_ec;
                    group.terminate(kill_ec);
                    kill_sent = true;
                }
                watch();
            });
        };
        watch();
        ioc.run();

        std::error_code wait_ec;
        child.wait(wait_ec);
        const int status = child.native_exit_code();
        if (WIFSIGNALED(status)) {
            result.signal = SignalName(WTERMSIG(status));
        } else if (WIFEXITED(status)) {
            result.exit_code = WEXITSTATUS(status);
        }
        result.killed = term_sent;
        result.stdout_text = utils::Trim(out_state.accumulated);
        result.stderr_text = utils::Trim(err_state.accumulated);
    } catch (const bp::process_error& ex) {
        result.error = std::string("Failed to start command: ") + ex.what();
        utils::LogError("sandbox", *result.error);
    } catch (const std::exception& ex) {
        result.error = std::string("Command execution failed: ") + ex.what();
        utils::LogError("sandbox", *result.error);
    }

    if (!result.error) {
        if (result.killed) {
            result.error = "Command was cancelled";
        } else if (result.exit_code && *result.exit_code != 0) {
            result.error = "Command exited with code " + std::to_string(*result.exit_code);
        } else if (result.signal) {
            result.error = "Command terminated by " + *result.signal;
        }
    }
    result.success = !result.error && !result.killed && result.exit_code && *result.exit_code == 0;

    if (result.sandboxed && !result.success && wrapper_) {
        result.stderr_text = wrapper_->AnnotateFailure(request.command, result.stderr_text);
    }
    if (events) {
        events->Close();
    }
    return result;
}

nlohmann::json ToJson(const CommandExecutionResult& result) {
    nlohmann::json doc = {
        {"success", result.success},
        {"stdout", utils::SanitizeUtf8(result.stdout_text)},
        {"stderr", utils::SanitizeUtf8(result.stderr_text)},
        {"exitCode", result.exit_code ? nlohmann::json(*result.exit_code) : nlohmann::json(nullptr)},
        {"killed", result.killed},
        {"signal", result.signal ? nlohmann::json(*result.signal) : nlohmann::json(nullptr)},
        {"sandboxed", result.sandboxed},
    };
    if (result.error) {
        doc["error"] = utils::SanitizeUtf8(*result.error);
    }
    return doc;
}

}  // namespace rampart::sandbox
