#pragma once

namespace ward::cli
{
	/** Parse arguments and run one command. Exit codes: 0 ok, 1 error, 2 denied. */
	int run(int argc, char *argv[]);
}
