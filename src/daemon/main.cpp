//
// Copyright Amazon.com, Inc. or its affiliates. All Rights Reserved.
// SPDX-License-Identifier: MIT
//

#include "engine/config.hpp"
#include "engine/engine.hpp"
#include "setup_logging.hpp"

#include <spdlog/spdlog.h>

#include <array>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <fcntl.h>
#include <iostream>
#include <signal.h>  // NOLINT
#include <sstream>
#include <string>
#include <sys/resource.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

namespace
{

const auto* const s_init_complete = "init_complete";
const auto* const s_pid_file_path = "/var/run/btmuxd.pid";

// NOLINTNEXTLINE(cppcoreguidelines-avoid-non-const-global-variables)
volatile sig_atomic_t g_running = 1;

struct Options
{
    bool        daemonize{true};
    std::string config_file;
};

Options parseOptions(const int argc, const char** const argv)
{
    static const std::string config_file_prefix = "CONFIG_FILE=";

    Options options;
    for (int i = 1; i < argc; ++i)
    {
        const std::string arg_str = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg_str == "--dev")
        {
            options.daemonize = false;
        }
        else if (0 == arg_str.compare(0, config_file_prefix.size(), config_file_prefix))
        {
            options.config_file = arg_str.substr(config_file_prefix.size());
        }
    }
    if (options.config_file.empty())
    {
        options.config_file = options.daemonize ? "/etc/btmuxd/btmuxd.toml" : "./btmuxd.toml";
    }
    return options;
}

extern "C" void signalHandler(const int sig)
{
    if ((sig == SIGTERM) || (sig == SIGINT))
    {
        g_running = 0;
    }
}

void setupSignalHandlers()
{
    struct sigaction sigbreak
    {};
    sigbreak.sa_handler = &signalHandler;
    ::sigaction(SIGINT, &sigbreak, nullptr);
    ::sigaction(SIGTERM, &sigbreak, nullptr);
}

[[noreturn]] void exitWithFailure(const int fd, const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    writeString(fd, msg);
    writeString(fd, err_txt);
    ::exit(EXIT_FAILURE);
}

[[noreturn]] void exitWithStdError(const char* const msg)
{
    const char* const err_txt = std::strerror(errno);
    std::cerr << msg << err_txt << "\n";
    ::exit(EXIT_FAILURE);
}

/// Leaves only standard streams open, and creates the pipe which reports readiness back to the launcher.
///
std::array<int, 2> prepareDescriptors()
{
    rlimit rlimit_files{};
    if (::getrlimit(RLIMIT_NOFILE, &rlimit_files) != 0)
    {
        exitWithStdError("Failed to getrlimit(RLIMIT_NOFILE): ");
    }
    constexpr int first_fd_to_close = 3;  // 0, 1 & 2 for standard input, output, and error.
    for (int fd = first_fd_to_close; fd <= rlimit_files.rlim_cur; ++fd)
    {
        (void) ::close(fd);
    }

    std::array<int, 2> pipe_fds{-1, -1};
    if (::pipe(pipe_fds.data()) == -1)
    {
        exitWithStdError("Failed to create pipe: ");
    }
    return pipe_fds;
}

/// Blocks the launcher until the daemon reports its init outcome, then exits with it.
///
[[noreturn]] void awaitDaemonAndExit(const int pipe_read_fd)
{
    constexpr std::size_t      buf_size = 1024;
    std::array<char, buf_size> msg_from_child{};
    const auto                 res = ::read(pipe_read_fd, msg_from_child.data(), msg_from_child.size() - 1);
    if (res == -1)
    {
        exitWithStdError("Failed to read pipe: ");
    }
    msg_from_child[res] = '\0';  // NOLINT
    ::close(pipe_read_fd);

    if (::strcmp(msg_from_child.data(), s_init_complete) != 0)
    {
        std::cerr << "Daemon init failed: " << msg_from_child.data() << "\n";
        ::exit(EXIT_FAILURE);
    }
    ::exit(EXIT_SUCCESS);
}

void detachFromTerminal(const int pipe_write_fd)
{
    if (::setsid() < 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to setsid: ");
    }

    // The second fork guarantees the daemon can't reacquire a controlling terminal.
    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to fork: ");
    }
    if (pid > 0)
    {
        ::close(pipe_write_fd);
        ::exit(EXIT_SUCCESS);
    }

    const int null_fd = ::open("/dev/null", O_RDWR);  // NOLINT *-vararg
    if (null_fd == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to open(/dev/null): ");
    }
    ::dup2(null_fd, STDIN_FILENO);
    ::dup2(null_fd, STDOUT_FILENO);
    ::dup2(null_fd, STDERR_FILENO);
    if (null_fd > STDERR_FILENO)
    {
        ::close(null_fd);
    }

    ::umask(0);
    if (::chdir("/") != 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to chdir(/): ");
    }
}

/// Creates and locks the PID file. It stays open (and locked) until the process exits.
///
void lockPidFile(const int pipe_write_fd)
{
    const int fd = ::open(s_pid_file_path, O_RDWR | O_CREAT, 0644);  // NOLINT *-vararg
    if (fd == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to create PID file: ");
    }
    if (::lockf(fd, F_TLOCK, 0) == -1)
    {
        exitWithFailure(pipe_write_fd, "Failed to lock PID file (already running?): ");
    }
    if (::ftruncate(fd, 0) != 0)
    {
        exitWithFailure(pipe_write_fd, "Failed to ftruncate PID file: ");
    }

    constexpr std::size_t             max_pid_str_len = 32;
    std::array<char, max_pid_str_len> buf{};
    const auto len = ::snprintf(buf.data(), buf.size(), "%ld\n", static_cast<long>(::getpid()));  // NOLINT *-vararg
    if (::write(fd, buf.data(), len) != len)
    {
        exitWithFailure(pipe_write_fd, "Failed to write to PID file: ");
    }
}

void notifyInitComplete(int& pipe_write_fd)
{
    writeString(pipe_write_fd, s_init_complete);
    ::close(pipe_write_fd);
    pipe_write_fd = -1;
}

/// Daemonization procedure of the `man 7 daemon` manual page.
///
/// Returns in the daemon process only, with the write end of the readiness pipe.
/// The launcher process exits once the daemon reports (see `notifyInitComplete`).
///
int daemonize()
{
    auto pipe_fds = prepareDescriptors();
    setupSignalHandlers();

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        exitWithStdError("Failed to fork: ");
    }
    if (pid > 0)
    {
        ::close(pipe_fds[1]);
        awaitDaemonAndExit(pipe_fds[0]);
    }

    ::close(pipe_fds[0]);
    const int pipe_write_fd = pipe_fds[1];

    detachFromTerminal(pipe_write_fd);
    lockPidFile(pipe_write_fd);
    return pipe_write_fd;
}

btmux::daemon::engine::Config::Ptr loadConfig(const int err_fd, const std::string& cfg_file_path)
{
    try
    {
        return btmux::daemon::engine::Config::make(cfg_file_path);

    } catch (const std::exception& ex)
    {
        std::stringstream ss;
        ss << "Failed to load configuration file (path='" << cfg_file_path << "').\n" << ex.what();
        writeString(err_fd, ss.str().c_str());
    }
    ::exit(EXIT_FAILURE);
}

}  // namespace

int main(const int argc, const char** const argv)
{
    const auto options = parseOptions(argc, argv);

    // In dev mode failures go to the standard error output,
    // otherwise through the pipe to the launcher process.
    int report_fd = STDERR_FILENO;
    if (options.daemonize)
    {
        report_fd = daemonize();
    }
    else
    {
        setupSignalHandlers();
    }

    const auto config = loadConfig(report_fd, options.config_file);
    setupLogging(report_fd, options.daemonize, argc, argv, config);

    spdlog::info("BTMUXD started (ver='{}.{}', config='{}').", VERSION_MAJOR, VERSION_MINOR, options.config_file);
    int result = EXIT_SUCCESS;
    try
    {
        btmux::daemon::engine::Engine engine{config};
        if (const auto failure_str = engine.init())
        {
            spdlog::critical("Failed to init engine: {}", failure_str.value());

            writeString(report_fd, "Failed to init engine: ");
            writeString(report_fd, failure_str.value().c_str());
            ::exit(EXIT_FAILURE);
        }
        if (options.daemonize)
        {
            notifyInitComplete(report_fd);
        }

        engine.runWhile([] { return g_running == 1; });

    } catch (const std::exception& ex)
    {
        spdlog::critical("Unhandled exception: {}", ex.what());
        result = EXIT_FAILURE;
    }

    if (g_running == 0)
    {
        spdlog::debug("Received termination signal.");
    }
    spdlog::info("BTMUXD terminated.");

    return result;
}
