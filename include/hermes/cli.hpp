#pragma once

namespace hermes::cli
{
    /** Entry point of the `hermes` relay server. */
    int run_server(int argc, char *argv[]);

    /** Entry point of `hermes-admin` (validate-config, test-template, list-endpoints). */
    int run_admin(int argc, char *argv[]);

} // namespace hermes::cli
