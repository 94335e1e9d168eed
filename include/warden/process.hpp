#pragma once

#include "types.hpp"
#include <memory>

namespace warden
{

    /**
     * Liveness view of the process table. The supervisor never calls kill(2)
     * directly so tests can model crashed and foreign processes.
     */
    class ProcessProbe
    {
    public:
        virtual ~ProcessProbe() = default;

        virtual int current_pid() const = 0;

        /** True when a process with this pid exists (including ones we may not signal). */
        virtual bool is_alive(int pid) const = 0;

        /** Deliver SIGTERM to pid. */
        virtual Result<void> terminate(int pid) const = 0;
    };

    class PosixProcessProbe : public ProcessProbe
    {
    public:
        int current_pid() const override;
        bool is_alive(int pid) const override;
        Result<void> terminate(int pid) const override;
    };

    std::shared_ptr<ProcessProbe> posix_process_probe();

} // namespace warden
