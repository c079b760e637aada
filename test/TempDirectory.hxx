// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "system/Error.hxx"

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <stdlib.h>

/**
 * A temporary directory which is deleted recursively by the
 * destructor.
 */
class TempDirectory {
	std::filesystem::path path;

public:
	TempDirectory() {
		std::string pattern = std::filesystem::temp_directory_path() / "media-test-XXXXXX";
		if (mkdtemp(pattern.data()) == nullptr)
			throw MakeErrno("mkdtemp() failed");

		path = std::move(pattern);
	}

	~TempDirectory() noexcept {
		std::error_code ec;
		std::filesystem::remove_all(path, ec);
	}

	TempDirectory(const TempDirectory &) = delete;
	TempDirectory &operator=(const TempDirectory &) = delete;

	const std::filesystem::path &GetPath() const noexcept {
		return path;
	}

	/**
	 * Create a file (and its parent directories) with the given
	 * contents.
	 */
	std::filesystem::path WriteFile(const std::filesystem::path &relative,
					std::string_view contents) const {
		auto p = path / relative;
		std::filesystem::create_directories(p.parent_path());

		std::ofstream f{p, std::ios::binary};
		f.write(contents.data(), contents.size());
		f.close();
		if (!f)
			throw std::runtime_error{"Failed to write " + p.string()};

		return p;
	}
};
