// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#include "Sink.hxx"
#include "Response.hxx"
#include "util/SpanCast.hxx"

namespace Media {

void
SendResponse(ResponseSink &sink, const DeliveryResponse &response, bool head)
{
	sink.Commit(response);

	if (!head && !response.body.empty())
		sink.Write(AsBytes(response.body));

	sink.End();
}

} // namespace Media
