// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Logger.hxx"

#include <fmt/format.h>

#include <unistd.h>

unsigned LoggerDetail::max_level = 1;

static void
WriteLine(std::string_view line) noexcept
{
	/* stderr may be a pipe; a short write loses the rest of the
	   line, which is acceptable for a log */
	ssize_t nbytes = write(STDERR_FILENO, line.data(), line.size());
	(void)nbytes;
}

void
LoggerDetail::Fmt(unsigned level, std::string_view domain,
		  fmt::string_view format_str, fmt::format_args args) noexcept
try {
	if (!CheckLevel(level))
		return;

	fmt::memory_buffer buffer;
	if (!domain.empty())
		fmt::format_to(std::back_inserter(buffer), "[{}] ", domain);

	fmt::vformat_to(std::back_inserter(buffer), format_str, args);
	buffer.push_back('\n');

	WriteLine({buffer.data(), buffer.size()});
} catch (...) {
	/* formatting failed (probably std::bad_alloc); log the raw
	   format string instead */
	WriteLine({format_str.data(), format_str.size()});
	WriteLine("\n");
}

ChildLoggerDomain::ChildLoggerDomain(std::string_view parent,
				     std::string_view name)
{
	if (parent.empty()) {
		domain = name;
		return;
	}

	domain.reserve(parent.size() + 1 + name.size());
	domain.append(parent);
	domain.push_back('/');
	domain.append(name);
}
