// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <fmt/core.h>

#include <string>
#include <string_view>
#include <utility>

/*
 * Log levels used in this project:
 *
 * 1 = errors which need attention
 * 2 = problems caused by clients or by inconsistent data
 * 3 = one line per request (access log) and startup messages
 * 4 = connection-level details
 */

namespace LoggerDetail {

extern unsigned max_level;

inline bool
CheckLevel(unsigned level) noexcept
{
	return level <= max_level;
}

/**
 * Format and write one log line to stderr.  The line is submitted
 * with a single write() call, so lines from concurrent worker
 * threads do not get interleaved.
 */
void
Fmt(unsigned level, std::string_view domain,
    fmt::string_view format_str, fmt::format_args args) noexcept;

} /* namespace LoggerDetail */

inline void
SetLogLevel(unsigned level) noexcept
{
	LoggerDetail::max_level = level;
}

template<typename S, typename... Args>
void
LogFmt(unsigned level, std::string_view domain,
       const S &format_str, Args&&... args) noexcept
{
	LoggerDetail::Fmt(level, domain, format_str,
			  fmt::make_format_args(args...));
}

template<typename Domain>
class BasicLogger : public Domain {
public:
	BasicLogger() = default;

	template<typename D>
	explicit BasicLogger(D &&_domain)
		:Domain(std::forward<D>(_domain)) {}

	template<typename S, typename... Args>
	void Fmt(unsigned level, const S &format_str,
		 Args&&... args) const noexcept {
		if (LoggerDetail::CheckLevel(level))
			LoggerDetail::Fmt(level, Domain::GetDomain(),
					  format_str,
					  fmt::make_format_args(args...));
	}
};

/**
 * A logger domain which is a string literal (or another string
 * which outlives the logger).
 */
class LiteralLoggerDomain {
	std::string_view domain;

public:
	constexpr explicit LiteralLoggerDomain(std::string_view _domain={}) noexcept
		:domain(_domain) {}

	constexpr std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * The logger of a component, e.g. "listener" or "delivery".
 */
class LLogger : public BasicLogger<LiteralLoggerDomain> {
public:
	LLogger() = default;

	template<typename D>
	explicit LLogger(D &&_domain) noexcept
		:BasicLogger(std::forward<D>(_domain)) {}
};

class ChildLoggerDomain {
	std::string domain;

public:
	ChildLoggerDomain(std::string_view parent, std::string_view name);

	std::string_view GetDomain() const noexcept {
		return domain;
	}
};

/**
 * A logger whose domain is "PARENT/NAME".  This is used to derive a
 * per-request logger (NAME being the correlation id) from a
 * component's logger.
 */
class ChildLogger : public BasicLogger<ChildLoggerDomain> {
public:
	template<typename P>
	ChildLogger(const P &parent, std::string_view _name)
		:BasicLogger(ChildLoggerDomain(parent.GetDomain(), _name)) {}
};
