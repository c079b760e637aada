// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <filesystem>

struct CommandLine {
	std::filesystem::path config_path = "/etc/cm4all/media-delivery/media-delivery.conf";

	/**
	 * The log level passed to SetLogLevel().
	 */
	unsigned verbose = 1;
};

/**
 * Parse the command line.  Prints a usage message and exits on
 * "--help".
 *
 * Throws on error.
 */
CommandLine
ParseCommandLine(int argc, char **argv);
