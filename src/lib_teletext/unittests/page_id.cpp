#include "tests/tests.hpp"
#include "lib_teletext/error.hpp"
#include "lib_teletext/page_id.hpp"
#include <functional>

using namespace Tests;
using namespace Teletext;

namespace {

ErrorKind errorOf(std::function<void()> f) {
	try {
		f();
	} catch(Error const& e) {
		return e.kind();
	}
	throw std::runtime_error("no error was raised");
}

unittest("PageId: range is validated on construction") {
	ASSERT_EQUALS(100, PageId(100).number());
	ASSERT_EQUALS(1, PageId(100).subpage());
	ASSERT_EQUALS(999, PageId(999, 12).number());
	ASSERT_THROWN(PageId(99));
	ASSERT_THROWN(PageId(1000));
	ASSERT_THROWN(PageId(200, 0));
	ASSERT_THROWN(PageId(200, 10000));
	ASSERT(errorOf([]() { PageId(42); }) == ErrorKind::InvalidPage);
}

unittest("PageId: ordering and equality") {
	ASSERT(PageId(100, 2) == PageId(100, 2));
	ASSERT(PageId(100, 2) != PageId(100, 1));
	ASSERT(PageId(100, 2) < PageId(101, 1));
	ASSERT(PageId(100, 1) < PageId(100, 2));
	ASSERT_EQUALS("200/3", toString(PageId(200, 3)));
}

unittest("PageId: parsing") {
	ASSERT_EQUALS(PageId(200), parsePageId("200"));
	ASSERT_EQUALS(PageId(200), parsePageId("P200"));
	ASSERT_EQUALS(PageId(200, 2), parsePageId("200/2"));
	ASSERT_EQUALS(PageId(200, 2), parsePageId("200_0002"));
	ASSERT_EQUALS(PageId(871, 3), parsePageId("871#3"));

	ASSERT_THROWN(parsePageId(""));
	ASSERT_THROWN(parsePageId("20"));
	ASSERT_THROWN(parsePageId("2000"));
	ASSERT_THROWN(parsePageId("099"));
	ASSERT_THROWN(parsePageId("200/"));
	ASSERT_THROWN(parsePageId("200/0"));
	ASSERT_THROWN(parsePageId("200/12345"));
	ASSERT_THROWN(parsePageId("200x"));
	ASSERT(errorOf([]() { parsePageId("abc"); }) == ErrorKind::InvalidPage);
}

unittest("Error: message carries the kind and the HTTP status") {
	Error e(ErrorKind::ServerError, "boom", 503);
	ASSERT_EQUALS(503, e.status());
	ASSERT_EQUALS("[ServerError(503)] boom", std::string(e.what()));
	ASSERT(!e.isTransient());
	ASSERT(Error(ErrorKind::Timeout, "").isTransient());
	ASSERT(Error(ErrorKind::Network, "").isTransient());
	ASSERT(!Error(ErrorKind::NotFound, "").isTransient());

	auto const info = e.info();
	ASSERT(info.kind == ErrorKind::ServerError);
	ASSERT_EQUALS(503, info.status);
}

}
