#pragma once

#include "fraction.hpp"
#include <chrono>
#include <memory>

struct IClock {
	virtual ~IClock() = default;
	virtual Fraction now() const = 0;
	virtual void sleep(Fraction time) const = 0;
};

// monotonic, starts at zero on construction
class SystemClock : public IClock {
	public:
		SystemClock();
		Fraction now() const override;
		void sleep(Fraction time) const override;

	private:
		std::chrono::time_point<std::chrono::steady_clock> const timeStart;
};

extern const std::shared_ptr<IClock> g_SystemClock;
