#include "clock.hpp"
#include <thread>

using namespace std::chrono;

SystemClock::SystemClock()
	: timeStart(steady_clock::now()) {
}

Fraction SystemClock::now() const {
	auto const timeElapsed = steady_clock::now() - timeStart;
	auto const timeNowInMs = duration_cast<milliseconds>(timeElapsed);
	return fromMs(timeNowInMs.count());
}

void SystemClock::sleep(Fraction time) const {
	if (time > Fraction(0))
		std::this_thread::sleep_for(milliseconds(time.num * 1000 / time.den));
}

extern const std::shared_ptr<IClock> g_SystemClock(new SystemClock);
