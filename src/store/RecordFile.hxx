// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include "io/config/ConfigParser.hxx"

#include <filesystem>

namespace Media {

class MemoryRecordStore;

/**
 * Parses a records file consisting of "media" blocks:
 *
 *     media "abc" {
 *       key "2024/abc.mp4"
 *       name "clip.mp4"
 *       type "video/mp4"
 *       size "1000"
 *       created "2024-05-01T12:00:00Z"
 *     }
 *
 * Each completed block is inserted into the #MemoryRecordStore.
 */
class RecordFileParser final : public NestedConfigParser {
	MemoryRecordStore &store;

	class MediaBlock;

public:
	explicit RecordFileParser(MemoryRecordStore &_store) noexcept
		:store(_store) {}

protected:
	/* virtual methods from class NestedConfigParser */
	void ParseLine2(FileLineParser &line) override;
	void FinishChild(std::unique_ptr<ConfigParser> &&child) override;
};

/**
 * Load a records file (with comments and "@include" support) into
 * the given store.
 *
 * Throws on error.
 */
void
LoadRecordFile(const std::filesystem::path &path, MemoryRecordStore &store);

} // namespace Media
