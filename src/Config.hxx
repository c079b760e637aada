// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>
#include <filesystem>
#include <string>

struct Config {
	/**
	 * The listener address ("HOST:PORT").
	 */
	std::string listen = "0.0.0.0:8080";

	unsigned workers = 16;

	std::chrono::seconds idle_timeout{30};
	std::chrono::seconds storage_timeout{10};
	std::chrono::seconds cache_max_age{3600};

	/**
	 * The base directory of the file backing store.
	 */
	std::filesystem::path blob_directory;

	/**
	 * The PostgreSQL connect string of the record store.  Empty
	 * if the file record store is used.
	 */
	std::string pg_conninfo;

	/**
	 * The PostgreSQL schema containing the "media" table.  Empty
	 * means the server's default search path.
	 */
	std::string pg_schema;

	/**
	 * The records file of the file record store.  Empty if
	 * PostgreSQL is used.
	 */
	std::filesystem::path record_file;

	/**
	 * Throws if the configuration is not complete.
	 */
	void Check() const;
};

/**
 * Load the configuration file (with comments and "@include"
 * support).
 *
 * Throws on error.
 */
void
LoadConfigFile(Config &config, const std::filesystem::path &path);
