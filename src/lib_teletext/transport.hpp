#pragma once

#include "page_id.hpp"
#include <memory>
#include <string>

namespace Teletext {

// Fetches the raw payload of one page. Implementations must be callable from
// several threads at once, for different pages.
struct ITransport {
	virtual ~ITransport() = default;
	// throws Error(Network | Timeout | NotFound | ServerError | MalformedEncoding)
	virtual std::string fetch(PageId id) = 0;
};

struct TransportConfig {
	std::string urlTemplate = "https://yle.fi/aihe/yle-ttv/json?P={page}_{subpage}";
	std::string userAgent = "ttv/1.0";
	int requestTimeoutMs = 5000;
	int retryCount = 2; // additional attempts after a transient failure
	ITransport* source = nullptr; // if null, use the internal HTTP transport
};

// "{page}" gives "200", "{subpage}" gives "0002".
// Throws std::runtime_error on unknown or unterminated variables.
std::string expandUrl(std::string const& urlTemplate, PageId id);

// single attempt over HTTP(S), also handles file:// URLs
std::unique_ptr<ITransport> createHttpTransport(TransportConfig const& cfg);

// Retries transient failures (Network, Timeout) on top of 'cfg.source', or of
// an HTTP transport when no source is given.
std::unique_ptr<ITransport> createTransport(TransportConfig const& cfg);

}
