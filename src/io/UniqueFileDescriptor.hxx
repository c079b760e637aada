// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <span>
#include <utility>

#include <sys/types.h>
#include <unistd.h>

/**
 * An OO wrapper for an owned file descriptor.  It is closed
 * automatically by the destructor.
 */
class UniqueFileDescriptor {
	int fd = -1;

public:
	UniqueFileDescriptor() noexcept = default;

	explicit UniqueFileDescriptor(int _fd) noexcept
		:fd(_fd) {}

	UniqueFileDescriptor(UniqueFileDescriptor &&src) noexcept
		:fd(std::exchange(src.fd, -1)) {}

	~UniqueFileDescriptor() noexcept {
		Close();
	}

	UniqueFileDescriptor &operator=(UniqueFileDescriptor &&src) noexcept {
		using std::swap;
		swap(fd, src.fd);
		return *this;
	}

	bool IsDefined() const noexcept {
		return fd >= 0;
	}

	int Get() const noexcept {
		return fd;
	}

	int Release() noexcept {
		return std::exchange(fd, -1);
	}

	void Close() noexcept {
		if (IsDefined())
			::close(Release());
	}

	ssize_t Read(std::span<std::byte> dest) const noexcept {
		return ::read(fd, dest.data(), dest.size());
	}

	off_t Skip(off_t offset) const noexcept {
		return ::lseek(fd, offset, SEEK_CUR);
	}

	[[gnu::pure]]
	off_t Tell() const noexcept {
		return ::lseek(fd, 0, SEEK_CUR);
	}
};
