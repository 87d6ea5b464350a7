#pragma once

#include "markup_decoder.hpp"
#include "page.hpp"
#include "lib_utils/clock.hpp"
#include <memory>

namespace Teletext {

// Lays a decoded stream out on a fixed size grid and collects its links.
// Every page built by one parser has the same dimensions.
class PageParser {
	public:
		PageParser(int rows, int cols, std::shared_ptr<IClock> clock = g_SystemClock);

		// Throws Error(LayoutOverflow) when the text doesn't fit,
		// Error(NoContent) when the stream carries no text at all.
		PagePtr parse(DecodedStream const& stream, PageId id) const;

		int rows() const {
			return m_rows;
		}
		int cols() const {
			return m_cols;
		}

	private:
		int const m_rows, m_cols;
		std::shared_ptr<IClock> const m_clock;
};

}
