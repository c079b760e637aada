// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Route.hxx"
#include "uri/Unescape.hxx"
#include "util/StringCompare.hxx"

using std::string_view_literals::operator""sv;

Route
ParseRoute(std::string_view target)
{
	if (const auto q = target.find('?'); q != target.npos)
		target = target.substr(0, q);

	if (target == "/health"sv)
		return {RouteType::HEALTH, {}};

	if (!SkipPrefix(target, "/media/"sv) ||
	    target.empty() || target.find('/') != target.npos)
		return {};

	auto id = UriUnescape(target);
	if (!id || id->empty())
		return {};

	return {RouteType::MEDIA, std::move(*id)};
}
