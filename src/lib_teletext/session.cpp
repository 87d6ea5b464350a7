#include "session.hpp"
#include "lib_utils/log.hpp"

namespace Teletext {

namespace {
TransportConfig transportConfig(Config const& cfg, ITransport* source) {
	TransportConfig r;
	r.urlTemplate = cfg.urlTemplate;
	r.userAgent = cfg.userAgent;
	r.requestTimeoutMs = cfg.requestTimeoutMs;
	r.retryCount = cfg.retryCount;
	r.source = source;
	return r;
}
}

Session::Session(Config const& cfg, IExecutor& completion, ITransport* transport, std::shared_ptr<IClock> clock)
	: m_config(cfg) {
	validate(cfg);

	m_transport = createTransport(transportConfig(cfg, transport));
	m_parser = std::make_unique<PageParser>(cfg.rows, cfg.cols, clock);
	m_loader = std::make_unique<PageLoader>(*m_transport, *m_parser);
	m_background = std::make_unique<ExecutorThread>("PageFetch", cfg.fetchThreads);

	PageStoreConfig storeCfg;
	storeCfg.ttl = Fraction(cfg.cacheTtlSeconds, 1);
	storeCfg.maxEntries = cfg.maxCachedPages;
	storeCfg.clock = clock;

	m_cache = std::make_unique<PageCache>(createPageStore(storeCfg), createInflightTable(), *m_loader, *m_background, completion);
	m_navigator = std::make_unique<Navigator>(*m_cache);

	logMsg(Info, "Session", "%sx%s grid, %s cached pages, TTL %ss, source %s", cfg.rows, cfg.cols, cfg.maxCachedPages,
	    cfg.cacheTtlSeconds, transport ? std::string("custom") : cfg.urlTemplate);
}

Session::~Session() {
	// the fetch threads use everything below them, stop them first
	m_navigator.reset();
	m_background.reset();
}

}
