#pragma once

namespace warden::cli
{

    /** Parse the command line and dispatch. Returns the process exit code. */
    int run(int argc, char *argv[]);

} // namespace warden::cli
