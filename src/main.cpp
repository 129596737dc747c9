#include "hermes/cli.hpp"

int main(int argc, char *argv[])
{
    return hermes::cli::run_server(argc, argv);
}
