// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "FileBlobStore.hxx"
#include "ContentType.hxx"
#include "Error.hxx"
#include "io/Beneath.hxx"
#include "system/Error.hxx"

#include <fmt/core.h>

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <string>

#include <sys/stat.h>

namespace Media {

class FileBlobReader final : public BlobReader {
	UniqueFileDescriptor fd;

	const uint64_t size;

	uint64_t position = 0;

public:
	FileBlobReader(UniqueFileDescriptor &&_fd, uint64_t _size) noexcept
		:fd(std::move(_fd)), size(_size) {}

	/* virtual methods from class BlobReader */
	std::size_t Read(std::span<std::byte> dest) override {
		const auto nbytes = fd.Read(dest);
		if (nbytes < 0)
			throw BackingStoreError{
				MakeErrno("Failed to read from file").what(),
			};

		position += static_cast<uint64_t>(nbytes);
		return static_cast<std::size_t>(nbytes);
	}

	uint64_t Skip(uint64_t n) override {
		/* lseek() would happily move beyond the end of the
		   file; clamp to the size seen by fstat() */
		n = std::min(n, size - std::min(position, size));
		if (n == 0)
			return 0;

		if (fd.Skip(static_cast<off_t>(n)) < 0)
			throw BackingStoreError{
				MakeErrno("Failed to seek file").what(),
			};

		position += n;
		return n;
	}
};

static void
CheckDeadline(std::string_view key, Deadline deadline)
{
	if (IsExpired(deadline))
		throw BackingStoreTimeout{
			fmt::format("Timeout while accessing '{}'", key),
		};
}

FileBlobStore::FileBlobStore(const std::filesystem::path &path)
	:directory(OpenDirectoryPath(path.c_str())) {}

UniqueFileDescriptor
FileBlobStore::OpenFile(std::string_view key, Deadline deadline,
			uint64_t &size_r) const
{
	CheckDeadline(key, deadline);

	try {
		if (key.empty())
			throw std::invalid_argument{"Empty object key"};

		const std::string path{key};
		auto fd = TryOpenReadOnlyBeneath(directory, path.c_str());
		if (!fd.IsDefined())
			throw FmtErrno("Failed to open '{}'", key);

		struct stat st;
		if (fstat(fd.Get(), &st) < 0)
			throw FmtErrno("Failed to stat '{}'", key);

		if (!S_ISREG(st.st_mode))
			throw std::runtime_error{"Not a regular file"};

		size_r = static_cast<uint64_t>(st.st_size);
		return fd;
	} catch (...) {
		std::throw_with_nested(BackingStoreError{
				fmt::format("Failed to access object '{}'", key),
			});
	}
}

BlobMetadata
FileBlobStore::GetMetadata(std::string_view key, Deadline deadline)
{
	uint64_t size;
	OpenFile(key, deadline, size);

	return {
		.size = size,
		.content_type = std::string{GuessContentType(key)},
	};
}

std::unique_ptr<BlobReader>
FileBlobStore::Open(std::string_view key, Deadline deadline)
{
	uint64_t size;
	auto fd = OpenFile(key, deadline, size);
	return std::make_unique<FileBlobReader>(std::move(fd), size);
}

} // namespace Media
