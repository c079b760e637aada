// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "lib/fmt/RuntimeError.hxx"

#include <stdexcept>

#include <getopt.h>
#include <stdio.h>
#include <stdlib.h>

static void
PrintUsage(const char *program) noexcept
{
	printf("usage: %s [OPTIONS]\n\n"
	       "options:\n"
	       "  -h, --help         print this help\n"
	       "  -c, --config FILE  load this configuration file\n"
	       "  -v, --verbose      be more verbose (repeatable)\n"
	       "  -q, --quiet        be quiet\n",
	       program);
}

CommandLine
ParseCommandLine(int argc, char **argv)
{
	static constexpr struct option long_options[] = {
		{"help", 0, nullptr, 'h'},
		{"config", 1, nullptr, 'c'},
		{"verbose", 0, nullptr, 'v'},
		{"quiet", 0, nullptr, 'q'},
		{nullptr, 0, nullptr, 0},
	};

	CommandLine cmdline;

	/* reset getopt's global state so this function may be
	   called more than once (unit tests) */
	optind = 0;

	while (true) {
		int option_index = 0;
		const int ch = getopt_long(argc, argv, "hc:vq",
					   long_options, &option_index);
		if (ch == -1)
			break;

		switch (ch) {
		case 'h':
			PrintUsage(argv[0]);
			exit(EXIT_SUCCESS);

		case 'c':
			cmdline.config_path = optarg;
			break;

		case 'v':
			++cmdline.verbose;
			break;

		case 'q':
			cmdline.verbose = 0;
			break;

		case '?':
			throw std::runtime_error{"Invalid command line option"};
		}
	}

	if (optind < argc)
		throw FmtRuntimeError("Unrecognized argument: {}", argv[optind]);

	return cmdline;
}
