// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "CommandLine.hxx"
#include "Config.hxx"
#include "delivery/Handler.hxx"
#include "store/FileBlobStore.hxx"
#include "store/MemoryRecordStore.hxx"
#include "store/PgRecordStore.hxx"
#include "store/RecordFile.hxx"
#include "net/Listener.hxx"
#include "io/Logger.hxx"
#include "util/PrintException.hxx"

#include <memory>

#include <stdlib.h>

static std::unique_ptr<Media::RecordStore>
MakeRecordStore(const Config &config)
{
	if (!config.pg_conninfo.empty())
		return std::make_unique<Media::PgRecordStore>(config.pg_conninfo,
							      config.pg_schema,
							      config.workers);

	auto store = std::make_unique<Media::MemoryRecordStore>();
	Media::LoadRecordFile(config.record_file, *store);

	LogFmt(3, "media-delivery", "Loaded {} records from {}",
	       store->size(), config.record_file.native());
	return store;
}

int
main(int argc, char **argv) noexcept
try {
	const auto cmdline = ParseCommandLine(argc, argv);
	SetLogLevel(cmdline.verbose);

	Config config;
	LoadConfigFile(config, cmdline.config_path);
	config.Check();

	const auto records = MakeRecordStore(config);
	Media::FileBlobStore blobs{config.blob_directory};

	Media::DeliveryHandler handler{
		*records, blobs,
		{
			.cache_max_age = config.cache_max_age,
			.storage_timeout = config.storage_timeout,
		},
	};

	Listener listener{
		{
			.address = config.listen,
			.workers = config.workers,
			.idle_timeout = config.idle_timeout,
		},
		handler,
	};

	listener.Run();

	return EXIT_SUCCESS;
} catch (...) {
	PrintException(std::current_exception());
	return EXIT_FAILURE;
}
