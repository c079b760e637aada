// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <stdexcept>

namespace Media {

/**
 * The backing store which holds the object bytes has failed (object
 * missing, I/O error, unreachable).  This maps to "502 Bad Gateway".
 */
class BackingStoreError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

/**
 * A backing store operation did not complete before the request's
 * deadline.
 */
class BackingStoreTimeout : public BackingStoreError {
public:
	using BackingStoreError::BackingStoreError;
};

/**
 * The record store could not be queried.  This maps to "500
 * Internal Server Error".
 */
class RecordStoreError : public std::runtime_error {
public:
	using std::runtime_error::runtime_error;
};

class RecordStoreTimeout : public RecordStoreError {
public:
	using RecordStoreError::RecordStoreError;
};

} // namespace Media
