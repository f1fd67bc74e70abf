#pragma once

#include "tempo/format.hpp"

extern "C" {
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>
}

#include <cerrno>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

extern "C" char** environ;

namespace tempo::internal::process {
    using namespace std::string_view_literals;
    using namespace tempo::literals;

    using env_list = std::vector<std::pair<std::string, std::string>>;

    // Basename of the first token of a command line, used as the default tool name.
    inline std::string program_name(std::string_view command) {
        auto tokens = utils::split_whitespace(command);
        if (tokens.empty()) {
            return {};
        }
        return std::filesystem::path{tokens.front()}.filename().string();
    }

    inline std::string join_command(const std::vector<std::string>& args) {
        return utils::join_with_separator(args, " "sv);
    }

    inline int open_write_file(const std::filesystem::path& path) {
        auto fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, 0644);
        if (fd < 0) {
            throw std::runtime_error("failed to open file for write: {}"_format(path.string()));
        }
        return fd;
    }

    // Current environment with `overrides` replacing or extending it, as "KEY=VALUE" strings.
    inline std::vector<std::string> make_environment(const env_list& overrides) {
        std::vector<std::string> env{};
        for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
            std::string_view kv{*entry};
            auto eq = kv.find('=');
            auto key = kv.substr(0U, eq);
            bool replaced = false;
            for (const auto& [k, v] : overrides) {
                if (k == key) {
                    replaced = true;
                    break;
                }
            }
            if (!replaced) {
                env.emplace_back(kv);
            }
        }
        for (const auto& [k, v] : overrides) {
            env.push_back("{}={}"_format(k, v));
        }
        return env;
    }

    inline std::vector<char*> to_argv(std::vector<std::string>& values) {
        std::vector<char*> argv{};
        argv.reserve(values.size() + 1U);
        for (auto& value : values) {
            argv.push_back(value.data());
        }
        argv.push_back(nullptr);
        return argv;
    }

    inline int wait_exit_code(pid_t pid) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0) {
            if (errno != EINTR) {
                throw std::runtime_error("waitpid failed");
            }
        }
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return 128 + WTERMSIG(status);
        }
        return 1;
    }

    // Runs `args` to completion with stdout/stderr redirected into files; returns the exit code.
    inline int run_process(
            const std::vector<std::string>& args,
            const std::filesystem::path& stdout_path,
            const std::filesystem::path& stderr_path) {
        if (args.empty()) {
            throw std::invalid_argument("empty command");
        }
        auto values = args;
        auto argv = to_argv(values);
        auto stdout_fd = open_write_file(stdout_path);
        auto stderr_fd = open_write_file(stderr_path);

        auto pid = ::fork();
        if (pid < 0) {
            ::close(stdout_fd);
            ::close(stderr_fd);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            if (::dup2(stdout_fd, STDOUT_FILENO) < 0 || ::dup2(stderr_fd, STDERR_FILENO) < 0) {
                _exit(127);
            }
            ::close(stdout_fd);
            ::close(stderr_fd);
            ::execvp(argv[0], argv.data());
            _exit(127);
        }

        ::close(stdout_fd);
        ::close(stderr_fd);
        return wait_exit_code(pid);
    }

    // Splits everything readable from `fd` into lines until EOF.
    inline void read_lines(int fd, const std::function<void(std::string_view)>& on_line) {
        std::string pending{};
        char buffer[4096];
        for (;;) {
            auto n = ::read(fd, buffer, sizeof(buffer));
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                break;
            }
            if (n == 0) {
                break;
            }
            pending.append(buffer, static_cast<size_t>(n));

            size_t start = 0U;
            for (auto nl = pending.find('\n'); nl != std::string::npos; nl = pending.find('\n', start)) {
                std::string_view line{pending.data() + start, nl - start};
                if (!line.empty() && line.back() == '\r') {
                    line.remove_suffix(1U);
                }
                on_line(line);
                start = nl + 1U;
            }
            pending.erase(0U, start);
        }
        if (!pending.empty()) {
            on_line(pending);
        }
    }

    /*
     * Runs `args` with `env` added to the environment, calling `on_line` for every line
     * the child writes to stdout (without the trailing newline). stderr is inherited.
     * Returns the exit code.
     */
    inline int run_process_lines(
            const std::vector<std::string>& args,
            const env_list& env,
            const std::function<void(std::string_view)>& on_line) {
        if (args.empty()) {
            throw std::invalid_argument("empty command");
        }

        // built before fork(): the child must not allocate
        auto arg_values = args;
        auto argv = to_argv(arg_values);
        auto env_values = make_environment(env);
        auto envp = to_argv(env_values);

        // close-on-exec keeps the write end out of processes forked by other threads
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            throw std::runtime_error("pipe failed");
        }

        auto pid = ::fork();
        if (pid < 0) {
            ::close(fds[0]);
            ::close(fds[1]);
            throw std::runtime_error("fork failed");
        }

        if (pid == 0) {
            ::close(fds[0]);
            if (::dup2(fds[1], STDOUT_FILENO) < 0) {
                _exit(127);
            }
            ::close(fds[1]);
            ::execvpe(argv[0], argv.data(), envp.data());
            _exit(127);
        }

        ::close(fds[1]);

        try {
            read_lines(fds[0], on_line);
        } catch (...) {
            ::close(fds[0]);
            ::kill(pid, SIGKILL);
            (void)wait_exit_code(pid);
            throw;
        }
        ::close(fds[0]);
        return wait_exit_code(pid);
    }

}  // namespace tempo::internal::process
