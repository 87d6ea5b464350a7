#include "tests/tests.hpp"
#include "lib_teletext/config.hpp"
#include <cstdio>
#include <fstream>

using namespace Tests;
using namespace Teletext;

namespace {

unittest("Config: defaults are valid") {
	Config cfg;
	validate(cfg);
	ASSERT_EQUALS(5000, cfg.requestTimeoutMs);
	ASSERT_EQUALS(2, cfg.retryCount);
	ASSERT_EQUALS(300, cfg.cacheTtlSeconds);
	ASSERT_EQUALS(64, cfg.maxCachedPages);
	ASSERT_EQUALS(24, cfg.rows);
	ASSERT_EQUALS(40, cfg.cols);
}

unittest("Config: JSON overrides only the given keys") {
	Config cfg;
	applyConfigJson(cfg, R"({ "request_timeout_ms": 250, "url_template": "http://localhost/{page}", "rows": 25 })");
	ASSERT_EQUALS(250, cfg.requestTimeoutMs);
	ASSERT_EQUALS("http://localhost/{page}", cfg.urlTemplate);
	ASSERT_EQUALS(25, cfg.rows);
	ASSERT_EQUALS(40, cfg.cols);
	validate(cfg);
}

unittest("Config: unknown keys and mistyped values are rejected") {
	Config cfg;
	ASSERT_THROWN(applyConfigJson(cfg, R"({ "request_timeout": 250 })"));
	ASSERT_THROWN(applyConfigJson(cfg, R"({ "rows": "24" })"));
	ASSERT_THROWN(applyConfigJson(cfg, R"({ "user_agent": 1 })"));
	ASSERT_THROWN(applyConfigJson(cfg, "{ rows: 24 }"));
}

unittest("Config: validation") {
	auto invalid = [](void (*change)(Config&)) {
		Config cfg;
		change(cfg);
		try {
			validate(cfg);
		} catch(std::runtime_error const&) {
			return true;
		}
		return false;
	};
	ASSERT(invalid([](Config& c) { c.requestTimeoutMs = 0; }));
	ASSERT(invalid([](Config& c) { c.retryCount = -1; }));
	ASSERT(invalid([](Config& c) { c.cacheTtlSeconds = -5; }));
	ASSERT(invalid([](Config& c) { c.maxCachedPages = 0; }));
	ASSERT(invalid([](Config& c) { c.rows = 0; }));
	ASSERT(invalid([](Config& c) { c.cols = -40; }));
	ASSERT(invalid([](Config& c) { c.startPage = 1000; }));
	ASSERT(invalid([](Config& c) { c.fetchThreads = 0; }));
	ASSERT(invalid([](Config& c) { c.urlTemplate = "http://no-page/"; }));
	ASSERT(invalid([](Config& c) { c.logLevel = "loud"; }));
	ASSERT(!invalid([](Config& c) { c.cacheTtlSeconds = 0; }));
	ASSERT(!invalid([](Config& c) { c.logLevel = "quiet"; }));
}

unittest("Config: file loading") {
	auto const path = std::string("/tmp/ttv_config_test.json");
	{
		std::ofstream file(path);
		file << "{ \"max_cached_pages\": 8, \"log_level\": \"debug\" }";
	}
	Config cfg;
	loadConfigFile(cfg, path);
	ASSERT_EQUALS(8, cfg.maxCachedPages);
	ASSERT_EQUALS("debug", cfg.logLevel);
	std::remove(path.c_str());

	ASSERT_THROWN(loadConfigFile(cfg, "/nonexistent/ttv.json"));
}

}
