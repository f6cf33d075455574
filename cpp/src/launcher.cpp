#include "launcher.hpp"
#include "errors.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>

#include <fcntl.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {
    const int FORWARDED_SIGNALS[] = {SIGINT, SIGTERM, SIGHUP, SIGQUIT, SIGUSR1, SIGUSR2};

    std::vector<char*> build_argv(const gate::LaunchSpec& spec) {
        std::vector<char*> argv;
        argv.reserve(spec.args.size() + 2);
        argv.push_back(const_cast<char*>(spec.executable.c_str()));
        for (const auto& arg : spec.args) {
            argv.push_back(const_cast<char*>(arg.c_str()));
        }
        argv.push_back(nullptr);
        return argv;
    }

    // Inherited environment with the launch overrides applied
    std::vector<std::string> build_environment(const gate::LaunchSpec& spec) {
        std::vector<std::string> entries;
        for (char** var = environ; var != nullptr && *var != nullptr; ++var) {
            std::string entry(*var);
            auto eq = entry.find('=');
            if (eq != std::string::npos && spec.environment.count(entry.substr(0, eq)) > 0) {
                continue;
            }
            entries.push_back(std::move(entry));
        }
        for (const auto& [key, value] : spec.environment) {
            entries.push_back(key + "=" + value);
        }
        return entries;
    }

    std::vector<char*> to_pointers(std::vector<std::string>& entries) {
        std::vector<char*> pointers;
        pointers.reserve(entries.size() + 1);
        for (auto& entry : entries) {
            pointers.push_back(&entry[0]);
        }
        pointers.push_back(nullptr);
        return pointers;
    }

    int exit_code_from_status(int status) {
        if (WIFEXITED(status)) {
            return WEXITSTATUS(status);
        }
        if (WIFSIGNALED(status)) {
            return gate::exit_code::SIGNAL_BASE + WTERMSIG(status);
        }
        return gate::exit_code::FAILURE;
    }

    // Keeps the child's signal dispositions and exit status in one place.
    // Constructed before fork so that no SIGCHLD can slip past it.
    class ChildSupervisor {
    public:
        explicit ChildSupervisor(asio::io_context& ioc)
            : ioc_(ioc)
            , child_exit_(ioc, SIGCHLD)
            , forwarded_(ioc)
        {
            for (int sig : FORWARDED_SIGNALS) {
                forwarded_.add(sig);
            }
        }

        int run(pid_t pid) {
            pid_ = pid;
            if (try_reap()) {
                return exit_code_;
            }
            wait_child_exit();
            wait_forwarded();
            ioc_.restart();
            ioc_.run();
            return exit_code_;
        }

    private:
        bool try_reap() {
            int status = 0;
            pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
            if (reaped != pid_) {
                return false;
            }
            exit_code_ = exit_code_from_status(status);
            std::cout << "[Launcher] Child " << pid_ << " exited with code " << exit_code_ << std::endl;

            boost::system::error_code ignored;
            child_exit_.cancel(ignored);
            forwarded_.cancel(ignored);
            // Abandoned name lookups may still hold the context
            ioc_.stop();
            return true;
        }

        void wait_child_exit() {
            child_exit_.async_wait([this](const boost::system::error_code& ec, int) {
                if (ec) {
                    return;
                }
                if (!try_reap()) {
                    wait_child_exit();
                }
            });
        }

        void wait_forwarded() {
            forwarded_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
                if (ec) {
                    return;
                }
                std::cout << "[Launcher] Forwarding signal " << signal_number
                          << " to child " << pid_ << std::endl;
                if (::kill(pid_, signal_number) != 0) {
                    std::cerr << "[Launcher] kill failed: " << std::strerror(errno) << std::endl;
                }
                wait_forwarded();
            });
        }

        asio::io_context& ioc_;
        asio::signal_set child_exit_;
        asio::signal_set forwarded_;
        pid_t pid_ = -1;
        int exit_code_ = gate::exit_code::FAILURE;
    };
}

namespace gate {

std::string LaunchSpec::describe() const {
    std::string text = executable;
    for (const auto& arg : args) {
        text += " " + arg;
    }
    return text;
}

void exec_process(const LaunchSpec& spec) {
    auto argv = build_argv(spec);
    auto entries = build_environment(spec);
    auto envp = to_pointers(entries);

    std::cout << "[Launcher] Handing over to " << spec.describe() << std::endl;
    ::execvpe(argv[0], argv.data(), envp.data());

    throw LaunchError(spec.executable, errno);
}

int supervise_process(asio::io_context& ioc, const LaunchSpec& spec) {
    auto argv = build_argv(spec);
    auto entries = build_environment(spec);
    auto envp = to_pointers(entries);

    // The child reports a failed exec through this pipe; a successful exec closes it
    int exec_pipe[2];
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        throw LaunchError(spec.executable, errno);
    }

    ChildSupervisor supervisor(ioc);

    // Block everything across fork so the child cannot run our handlers
    // before it has reset them
    sigset_t all_signals;
    sigset_t previous;
    sigfillset(&all_signals);
    ::pthread_sigmask(SIG_BLOCK, &all_signals, &previous);

    pid_t pid = ::fork();
    if (pid == 0) {
        for (int sig : FORWARDED_SIGNALS) {
            ::signal(sig, SIG_DFL);
        }
        ::signal(SIGCHLD, SIG_DFL);
        ::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
        ::close(exec_pipe[0]);

        ::execvpe(argv[0], argv.data(), envp.data());

        int error_number = errno;
        ssize_t written;
        do {
            written = ::write(exec_pipe[1], &error_number, sizeof(error_number));
        } while (written < 0 && errno == EINTR);
        ::_exit(exit_code::NOT_FOUND);
    }

    int fork_errno = errno;
    ::pthread_sigmask(SIG_SETMASK, &previous, nullptr);
    ::close(exec_pipe[1]);
    if (pid < 0) {
        ::close(exec_pipe[0]);
        throw LaunchError(spec.executable, fork_errno);
    }

    int child_errno = 0;
    ssize_t received;
    do {
        received = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (received < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (received == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        throw LaunchError(spec.executable, child_errno);
    }

    std::cout << "[Launcher] Started " << spec.describe() << " as pid " << pid << std::endl;
    return supervisor.run(pid);
}

} // namespace gate
