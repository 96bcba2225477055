#include "ward/cli.hpp"

int main(int argc, char *argv[])
{
    return ward::cli::run(argc, argv);
}
