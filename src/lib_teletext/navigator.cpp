#include "navigator.hpp"
#include "lib_utils/log.hpp"

namespace Teletext {

const char* toString(NavState state) {
	switch(state) {
	case NavState::Idle: return "Idle";
	case NavState::Loading: return "Loading";
	case NavState::Displaying: return "Displaying";
	case NavState::Failed: return "Failed";
	}
	return "Unknown";
}

const char* toString(Nav nav) {
	switch(nav) {
	case Nav::Ok: return "Ok";
	case Nav::Unchanged: return "Unchanged";
	case Nav::NoHistory: return "NoHistory";
	}
	return "Unknown";
}

Navigator::Navigator(IPageSource& source)
	: m_source(source), m_self(std::make_shared<Navigator*>(this)) {
}

Navigator::~Navigator() {
	*m_self = nullptr;
}

Nav Navigator::goTo(PageId id) {
	if(m_pending && m_request.target == id)
		return Nav::Unchanged;
	if(!m_pending && m_view.state == NavState::Displaying && m_view.page->id == id)
		return Nav::Unchanged;

	start({ id, Effect::Visit, -1 }, false);
	return Nav::Ok;
}

Nav Navigator::follow(Link const& link) {
	return goTo(link.target);
}

Nav Navigator::back() {
	if(m_cursor <= 0)
		return Nav::NoHistory;
	start({ m_history[m_cursor - 1], Effect::Move, m_cursor - 1 }, false);
	return Nav::Ok;
}

Nav Navigator::forward() {
	if(m_cursor < 0 || m_cursor + 1 >= (int)m_history.size())
		return Nav::NoHistory;
	start({ m_history[m_cursor + 1], Effect::Move, m_cursor + 1 }, false);
	return Nav::Ok;
}

Nav Navigator::stepSubpage(int delta) {
	if(!m_view.page)
		return Nav::NoHistory;
	auto const& current = m_view.page->id;
	auto const count = m_view.page->subpageCount;
	if(count <= 1)
		return Nav::Unchanged;

	auto const index = ((current.subpage() - 1 + delta) % count + count) % count;
	start({ PageId(current.number(), index + 1), Effect::InPlace, -1 }, false);
	return Nav::Ok;
}

Nav Navigator::nextSubpage() {
	return stepSubpage(+1);
}

Nav Navigator::prevSubpage() {
	return stepSubpage(-1);
}

Nav Navigator::stepPage(int delta) {
	if(!m_view.page)
		return Nav::NoHistory;
	auto const range = MaxPageNumber - MinPageNumber + 1;
	auto const offset = ((m_view.page->id.number() - MinPageNumber + delta) % range + range) % range;
	return goTo(PageId(MinPageNumber + offset, 1));
}

Nav Navigator::nextPage() {
	return stepPage(+1);
}

Nav Navigator::prevPage() {
	return stepPage(-1);
}

Nav Navigator::reload() {
	if(m_view.state == NavState::Idle)
		return Nav::NoHistory;

	// Loading and Failed restart the pending request, keeping its history effect
	auto request = m_request;
	if(m_view.state == NavState::Displaying)
		request = { m_view.page->id, Effect::InPlace, -1 };

	m_source.invalidate(request.target);
	start(request, true);
	return Nav::Ok;
}

Nav Navigator::refresh() {
	if(m_view.state != NavState::Displaying)
		return Nav::NoHistory;
	start({ m_view.page->id, Effect::InPlace, -1 }, false);
	return Nav::Ok;
}

void Navigator::start(Request const& request, bool bypassCache) {
	m_request = request;
	m_pending = true;
	m_view.state = NavState::Loading;
	m_view.target = request.target;
	logMsg(Debug, "Navigator", "loading %s", toString(request.target));
	notify();

	std::weak_ptr<Navigator*> self = m_self;
	auto const target = request.target;
	m_source.request(target, bypassCache, [self, target](FetchResult const& result) {
		auto alive = self.lock();
		if(alive && *alive)
			(*alive)->onFetched(target, result);
	});
}

void Navigator::onFetched(PageId target, FetchResult const& result) {
	// a later navigation superseded this one
	if(!m_pending || m_request.target != target) {
		logMsg(Debug, "Navigator", "dropping stale result for %s", toString(target));
		return;
	}
	m_pending = false;

	if(result.ok()) {
		commit(m_request);
		m_view.state = NavState::Displaying;
		m_view.page = result.page;
		m_view.stale = result.stale;
		m_view.error = ErrorInfo();
		logMsg(Info, "Navigator", "displaying %s%s", toString(target), result.stale ? " (stale)" : "");
	} else {
		m_view.state = NavState::Failed;
		m_view.error = result.error;
		logMsg(Info, "Navigator", "%s failed: %s", toString(target), result.error.message);
	}
	notify();
}

void Navigator::commit(Request const& request) {
	switch(request.effect) {
	case Effect::Visit:
		if(m_cursor >= 0 && m_history[m_cursor] == request.target)
			break;
		m_history.resize(m_cursor + 1);
		m_history.push_back(request.target);
		m_cursor = (int)m_history.size() - 1;
		break;
	case Effect::Move:
		m_cursor = request.historyIndex;
		break;
	case Effect::InPlace:
		break;
	}
}

void Navigator::notify() {
	if(m_listener)
		m_listener(m_view);
}

}
