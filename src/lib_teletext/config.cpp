#include "config.hpp"
#include "page_id.hpp"
#include "lib_utils/format.hpp"
#include "lib_utils/json.hpp"
#include "lib_utils/log.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace Teletext {

namespace {
void readInt(json::Value const& v, const char* key, int& dst) {
	if(v.type != json::Value::Type::Integer)
		throw std::runtime_error(format("config: '%s' must be an integer", key));
	dst = v.intValue;
}

void readString(json::Value const& v, const char* key, std::string& dst) {
	if(v.type != json::Value::Type::String)
		throw std::runtime_error(format("config: '%s' must be a string", key));
	dst = v.stringValue;
}
}

void applyConfigJson(Config& cfg, std::string const& jsonText) {
	auto const root = json::parse(jsonText);

	struct IntField {
		const char* key;
		int* dst;
	};
	IntField const intFields[] = {
		{ "request_timeout_ms", &cfg.requestTimeoutMs },
		{ "retry_count", &cfg.retryCount },
		{ "fetch_threads", &cfg.fetchThreads },
		{ "cache_ttl_seconds", &cfg.cacheTtlSeconds },
		{ "max_cached_pages", &cfg.maxCachedPages },
		{ "rows", &cfg.rows },
		{ "cols", &cfg.cols },
		{ "start_page", &cfg.startPage },
	};

	struct StringField {
		const char* key;
		std::string* dst;
	};
	StringField const stringFields[] = {
		{ "url_template", &cfg.urlTemplate },
		{ "user_agent", &cfg.userAgent },
		{ "log_level", &cfg.logLevel },
	};

	for(auto& pair : root.objectValue) {
		bool known = false;
		for(auto& f : intFields) {
			if(pair.key == f.key) {
				readInt(pair.value, f.key, *f.dst);
				known = true;
			}
		}
		for(auto& f : stringFields) {
			if(pair.key == f.key) {
				readString(pair.value, f.key, *f.dst);
				known = true;
			}
		}
		if(!known)
			throw std::runtime_error(format("config: unknown key '%s'", pair.key));
	}
}

void loadConfigFile(Config& cfg, std::string const& path) {
	std::ifstream file(path);
	if(!file.is_open())
		throw std::runtime_error(format("config: can't open '%s'", path));

	std::stringstream ss;
	ss << file.rdbuf();
	applyConfigJson(cfg, ss.str());
	logMsg(Info, "Config", "loaded '%s'", path);
}

void validate(Config const& cfg) {
	auto check = [](bool cond, std::string const& msg) {
		if(!cond)
			throw std::runtime_error("config: " + msg);
	};

	check(cfg.urlTemplate.find("{page}") != std::string::npos, "url_template must contain '{page}'");
	check(cfg.requestTimeoutMs > 0, format("request_timeout_ms must be positive (got %s)", cfg.requestTimeoutMs));
	check(cfg.retryCount >= 0, format("retry_count can't be negative (got %s)", cfg.retryCount));
	check(cfg.fetchThreads >= 1, format("fetch_threads must be at least 1 (got %s)", cfg.fetchThreads));
	check(cfg.cacheTtlSeconds >= 0, format("cache_ttl_seconds can't be negative (got %s)", cfg.cacheTtlSeconds));
	check(cfg.maxCachedPages >= 1, format("max_cached_pages must be at least 1 (got %s)", cfg.maxCachedPages));
	check(cfg.rows >= 1, format("rows must be positive (got %s)", cfg.rows));
	check(cfg.cols >= 1, format("cols must be positive (got %s)", cfg.cols));
	check(isValidPageNumber(cfg.startPage), format("start_page must be in [%s, %s] (got %s)", MinPageNumber, MaxPageNumber, cfg.startPage));

	try {
		parseLogLevel(cfg.logLevel.c_str());
	} catch(std::runtime_error const&) {
		check(false, format("unknown log_level '%s'", cfg.logLevel));
	}
}

}
