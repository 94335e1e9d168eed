#include "warden/process.hpp"
#include <cerrno>
#include <csignal>
#include <cstring>
#include <sys/types.h>
#include <unistd.h>

namespace warden
{

    int PosixProcessProbe::current_pid() const
    {
        return static_cast<int>(::getpid());
    }

    bool PosixProcessProbe::is_alive(int pid) const
    {
        if (pid <= 0)
            return false;
        if (::kill(static_cast<pid_t>(pid), 0) == 0)
            return true;
        // EPERM: the process exists but belongs to someone else
        return errno == EPERM;
    }

    Result<void> PosixProcessProbe::terminate(int pid) const
    {
        if (pid <= 0)
            return std::unexpected(WardenError::invalid_input("Invalid pid"));
        if (::kill(static_cast<pid_t>(pid), SIGTERM) != 0)
        {
            return std::unexpected(WardenError::io(
                std::format("Failed to signal pid {}: {}", pid, std::strerror(errno))));
        }
        return {};
    }

    std::shared_ptr<ProcessProbe> posix_process_probe()
    {
        static auto instance = std::make_shared<PosixProcessProbe>();
        return instance;
    }

} // namespace warden
