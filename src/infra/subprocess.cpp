#include "infra.h"

extern char** environ;

namespace infra
{
    namespace
    {
        std::atomic<pid_t> g_running_child { 0 };
        static_assert(std::atomic<pid_t>::is_always_lock_free);

        void close_fd(int& fd) noexcept
        {
            if (fd != -1) {
                (void)close(fd);
                fd = -1;
            }
        }

        void make_pipe(int (&fds)[2])
        {
            if (pipe(fds) != 0) {
                LOG_ERROR("pipe() failed. errno = {} ({})", errno, strerror(errno));
                THROW_SYSTEM_ERROR(errno, pipe);
            }
            (void)fcntl(fds[0], F_SETFD, FD_CLOEXEC);
            (void)fcntl(fds[1], F_SETFD, FD_CLOEXEC);
        }

        int open_output_file(const stdfs::path& path, const bool truncate)
        {
            const int flags = O_WRONLY | O_CREAT | O_CLOEXEC | (truncate ? O_TRUNC : O_APPEND);
            const int fd = open(path.c_str(), flags, 0644);
            if (fd == -1) {
                LOG_ERROR("open() {} for write failed. errno = {} ({})", path.string(), errno, strerror(errno));
                THROW_SYSTEM_ERROR(errno, open);
            }
            return fd;
        }

        std::vector<std::string> build_environment(const std::vector<std::pair<std::string, std::string>>& extra)
        {
            std::vector<std::string> result;
            for (char** p = environ; p != nullptr && *p != nullptr; ++p) {
                const std::string_view entry(*p);
                const bool overridden = std::any_of(extra.begin(), extra.end(), [&](const auto& kv) {
                    return entry.size() > kv.first.size() &&
                           entry.compare(0, kv.first.size(), kv.first) == 0 &&
                           entry[kv.first.size()] == '=';
                });
                if (!overridden) {
                    result.emplace_back(entry);
                }
            }
            for (const auto& [key, value] : extra) {
                result.push_back(key + "=" + value);
            }
            return result;
        }

        // Only async-signal-safe calls from here on: we are in the forked child
        [[noreturn]]
        void exec_child(char* const* args, char** envp, const int stdout_fd, const int stderr_fd) noexcept
        {
            const int null_fd = open("/dev/null", O_RDONLY);
            if (null_fd != -1) {
                (void)dup2(null_fd, STDIN_FILENO);
                (void)close(null_fd);
            }
            (void)dup2(stdout_fd, STDOUT_FILENO);
            (void)dup2(stderr_fd, STDERR_FILENO);

            environ = envp;
            execvp(args[0], args);

            static constexpr const char EXEC_FAILED[] = "exec failed: ";
            const char* const reason = strerror(errno);
            (void)!write(STDERR_FILENO, EXEC_FAILED, sizeof(EXEC_FAILED) - 1);
            (void)!write(STDERR_FILENO, args[0], strlen(args[0]));
            (void)!write(STDERR_FILENO, ": ", 2);
            (void)!write(STDERR_FILENO, reason, strlen(reason));
            (void)!write(STDERR_FILENO, "\n", 1);
            _exit(127);
        }

        void drain_pipes(int& out_fd, std::string& output, int& err_fd, std::string& error_output)
        {
            char buffer[4096];
            while (out_fd != -1 || err_fd != -1) {
                struct pollfd fds[2] { };
                nfds_t count = 0;
                int* owners[2] { };
                std::string* sinks[2] { };

                if (out_fd != -1) {
                    fds[count] = { out_fd, POLLIN, 0 };
                    owners[count] = &out_fd;
                    sinks[count] = &output;
                    ++count;
                }
                if (err_fd != -1) {
                    fds[count] = { err_fd, POLLIN, 0 };
                    owners[count] = &err_fd;
                    sinks[count] = &error_output;
                    ++count;
                }

                const int ready = poll(fds, count, -1);
                if (ready < 0) {
                    if (errno == EINTR) continue;
                    LOG_ERROR("poll() failed. errno = {} ({})", errno, strerror(errno));
                    THROW_SYSTEM_ERROR(errno, poll);
                }

                for (nfds_t i = 0; i < count; ++i) {
                    if (fds[i].revents == 0) continue;

                    const ssize_t cnt = read(fds[i].fd, buffer, sizeof(buffer));
                    if (cnt > 0) {
                        sinks[i]->append(buffer, static_cast<size_t>(cnt));
                    }
                    else if (cnt == 0 || errno != EINTR) {
                        close_fd(*owners[i]);
                    }
                }
            }
        }

        int wait_child(const pid_t pid)
        {
            int status = 0;
            while (waitpid(pid, &status, 0) < 0) {
                if (errno == EINTR) continue;
                LOG_ERROR("waitpid({}) failed. errno = {} ({})", pid, errno, strerror(errno));
                THROW_SYSTEM_ERROR(errno, waitpid);
            }

            if (WIFEXITED(status)) return WEXITSTATUS(status);
            if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
            return -1;
        }

    }  // namespace


    std::string format_command_line(const std::vector<std::string>& argv, const std::vector<std::string>& secrets)
    {
        std::string result;
        for (const std::string& arg : argv) {
            std::string shown = arg;
            for (const std::string& secret : secrets) {
                if (secret.empty()) continue;
                for (size_t pos = shown.find(secret); pos != std::string::npos; pos = shown.find(secret, pos + 4)) {
                    shown.replace(pos, secret.size(), "****");
                }
            }

            if (!result.empty()) result += ' ';
            if (shown.empty() || shown.find_first_of(" \t'\"") != std::string::npos) {
                result += '\'';
                result += shown;
                result += '\'';
            }
            else {
                result += shown;
            }
        }
        return result;
    }

    subprocess_result run_subprocess(const std::vector<std::string>& argv, const subprocess_options& options)
    {
        ASSERT(!argv.empty());
        LOG_DEBUG("Run: {}", format_command_line(argv, options.secrets));

        // Everything the child needs is prepared before fork()
        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const std::string& arg : argv) {
            args.push_back(const_cast<char*>(arg.c_str()));
        }
        args.push_back(nullptr);

        const std::vector<std::string> env_strings = build_environment(options.environment);
        std::vector<char*> envp;
        envp.reserve(env_strings.size() + 1);
        for (const std::string& entry : env_strings) {
            envp.push_back(const_cast<char*>(entry.c_str()));
        }
        envp.push_back(nullptr);

        int out_pipe[2] = { -1, -1 };
        int err_pipe[2] = { -1, -1 };
        int out_file = -1;
        int err_file = -1;
        const sweeper sweep_fds = [&]() {
            close_fd(out_pipe[0]);
            close_fd(out_pipe[1]);
            close_fd(err_pipe[0]);
            close_fd(err_pipe[1]);
            close_fd(out_file);
            close_fd(err_file);
        };

        if (options.stdout_file.has_value()) {
            out_file = open_output_file(options.stdout_file.value(), options.truncate_files);
        }
        else {
            make_pipe(out_pipe);
        }

        if (options.stderr_file.has_value()) {
            err_file = open_output_file(options.stderr_file.value(), options.truncate_files);
        }
        else {
            make_pipe(err_pipe);
        }

        const pid_t pid = fork();
        if (pid < 0) {
            LOG_ERROR("fork() failed. errno = {} ({})", errno, strerror(errno));
            THROW_SYSTEM_ERROR(errno, fork);
        }
        if (pid == 0) {
            exec_child(
                args.data(),
                envp.data(),
                (out_file != -1) ? out_file : out_pipe[1],
                (err_file != -1) ? err_file : err_pipe[1]);
        }

        g_running_child = pid;
        const sweeper sweep_child = [&]() {
            g_running_child = 0;
        };

        close_fd(out_pipe[1]);
        close_fd(err_pipe[1]);

        subprocess_result result;
        drain_pipes(out_pipe[0], result.output, err_pipe[0], result.error_output);
        result.exit_code = wait_child(pid);

        LOG_TRACE("Process {} exited with code {}", pid, result.exit_code);
        return result;
    }

    void signal_running_subprocess(const int sig) noexcept
    {
        const pid_t pid = g_running_child.load();
        if (pid > 0) {
            (void)kill(pid, sig);
        }
    }

}  // namespace infra
