// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "BlobStore.hxx"
#include "io/UniqueFileDescriptor.hxx"

#include <filesystem>

namespace Media {

/**
 * A #BlobStore which maps each object key to a regular file below a
 * base directory.  Keys cannot escape the base directory (see
 * TryOpenReadOnlyBeneath()).  The content type is guessed from the
 * file name suffix.
 *
 * Readers implement BlobReader::Skip() with lseek().
 */
class FileBlobStore final : public BlobStore {
	const UniqueFileDescriptor directory;

public:
	/**
	 * Throws if the directory cannot be opened.
	 */
	explicit FileBlobStore(const std::filesystem::path &path);

	/* virtual methods from class BlobStore */
	BlobMetadata GetMetadata(std::string_view key,
				 Deadline deadline) override;
	std::unique_ptr<BlobReader> Open(std::string_view key,
					 Deadline deadline) override;

private:
	UniqueFileDescriptor OpenFile(std::string_view key, Deadline deadline,
				      uint64_t &size_r) const;
};

} // namespace Media
