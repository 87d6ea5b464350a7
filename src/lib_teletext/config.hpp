#pragma once

#include <string>

namespace Teletext {

struct Config {
	// "{page}" is replaced by the 3-digit page number, "{subpage}" by the
	// subpage padded to 4 digits.
	std::string urlTemplate = "https://yle.fi/aihe/yle-ttv/json?P={page}_{subpage}";
	std::string userAgent = "ttv/1.0";
	int requestTimeoutMs = 5000;
	int retryCount = 2;
	int fetchThreads = 2;

	int cacheTtlSeconds = 300;
	int maxCachedPages = 64;

	int rows = 24;
	int cols = 40;

	int startPage = 100;
	std::string logLevel = "warning";
};

// Overrides the fields present in a JSON object ("request_timeout_ms", ...).
// Throws std::runtime_error on syntax errors, unknown keys or mistyped values.
void applyConfigJson(Config& cfg, std::string const& jsonText);

void loadConfigFile(Config& cfg, std::string const& path);

// throws std::runtime_error on the first invalid field
void validate(Config const& cfg);

}
