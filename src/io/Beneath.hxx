// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

class UniqueFileDescriptor;

/**
 * Open a directory as O_PATH file descriptor, to be used as anchor
 * for OpenReadOnlyBeneath().
 *
 * Throws on error.
 */
UniqueFileDescriptor
OpenDirectoryPath(const char *path);

/**
 * Open a regular file for reading, but refuse to resolve the path to
 * anything outside the given directory (openat2() with
 * RESOLVE_BENEATH).  Absolute paths, ".." escapes and symlinks
 * pointing outside the directory fail with EXDEV.
 *
 * @return an undefined file descriptor on error (with errno set)
 */
UniqueFileDescriptor
TryOpenReadOnlyBeneath(const UniqueFileDescriptor &directory,
		       const char *path) noexcept;
