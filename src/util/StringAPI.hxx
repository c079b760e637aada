// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <string.h>

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqual(const char *a, const char *b) noexcept
{
	return strcmp(a, b) == 0;
}

[[gnu::pure]] [[gnu::nonnull]]
static inline bool
StringIsEqualIgnoreCase(const char *a, const char *b) noexcept
{
	return strcasecmp(a, b) == 0;
}
