// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Beneath.hxx"
#include "UniqueFileDescriptor.hxx"
#include "system/Error.hxx"

#include <cassert>

#include <fcntl.h>
#include <linux/openat2.h> // for struct open_how
#include <sys/syscall.h>
#include <unistd.h>

static constexpr struct open_how ro_beneath{
	.flags = O_RDONLY|O_NOCTTY|O_CLOEXEC,
	.resolve = RESOLVE_BENEATH|RESOLVE_NO_MAGICLINKS,
};

UniqueFileDescriptor
OpenDirectoryPath(const char *path)
{
	UniqueFileDescriptor fd{::open(path, O_PATH|O_DIRECTORY|O_CLOEXEC)};
	if (!fd.IsDefined())
		throw FmtErrno("Failed to open directory {}", path);

	return fd;
}

UniqueFileDescriptor
TryOpenReadOnlyBeneath(const UniqueFileDescriptor &directory,
		       const char *path) noexcept
{
	assert(directory.IsDefined());

	return UniqueFileDescriptor{
		static_cast<int>(syscall(__NR_openat2, directory.Get(), path,
					 &ro_beneath, sizeof(ro_beneath))),
	};
}
