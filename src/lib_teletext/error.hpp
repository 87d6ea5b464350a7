#pragma once

#include <stdexcept>
#include <string>

namespace Teletext {

enum class ErrorKind {
	InvalidPage,       // page number/subpage out of range, rejected before any fetch
	Network,
	Timeout,
	NotFound,
	ServerError,       // any non-success HTTP status but 404, see Error::status()
	MalformedEncoding,
	LayoutOverflow,
	NoContent,
};

const char* toString(ErrorKind kind);

// Plain copy of an Error, used to carry a failure across threads.
struct ErrorInfo {
	ErrorKind kind = ErrorKind::Network;
	int status = 0;
	std::string message;
};

class Error : public std::runtime_error {
	public:
		Error(ErrorKind kind, std::string const& msg, int status = 0);

		ErrorKind kind() const {
			return m_kind;
		}

		int status() const {
			return m_status;
		}

		// worth another attempt from the transport
		bool isTransient() const {
			return m_kind == ErrorKind::Network || m_kind == ErrorKind::Timeout;
		}

		ErrorInfo info() const;

	private:
		ErrorKind m_kind;
		int m_status;
};

}
