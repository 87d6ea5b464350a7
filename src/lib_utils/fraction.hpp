#pragma once

#include <cstdint>

inline
int64_t pgcd(int64_t a, int64_t b) {
	return b ? pgcd(b, a%b) : a;
}

template<typename T>
static void simplifyFraction(T& num, T& den) {
	bool positive = true;
	if(num < 0) {
		num = -num;
		positive = !positive;
	}
	if(den < 0) {
		den = -den;
		positive = !positive;
	}

	auto const gcd = pgcd(num, den);
	if(gcd) {
		num /= gcd;
		den /= gcd;
	}

	if(!positive)
		num = -num;
}

// exact time value in seconds
struct Fraction {
	Fraction(int64_t num = 0, int64_t den = 1) : num(num), den(den) {
		if(!den)
			return; // invalid value
		simplifyFraction(this->num, this->den);
	}
	template<typename T>
	inline explicit operator T() const {
		return (T)num / (T)den;
	}
	inline Fraction operator+(const Fraction &frac) const {
		return Fraction(num * frac.den + frac.num * den, den * frac.den);
	}
	inline Fraction operator-(const Fraction &frac) const {
		return Fraction(num * frac.den - frac.num * den, den * frac.den);
	}
	inline bool operator==(const Fraction& rhs) const {
		return num * rhs.den == rhs.num * den;
	}
	inline bool operator!=(const Fraction& rhs) const {
		return !(rhs == *this);
	}
	inline bool operator<(const Fraction& rhs) const  {
		return num * rhs.den < rhs.num * den;
	}
	inline bool operator>(const Fraction& rhs) const {
		return num * rhs.den > rhs.num * den;
	}
	inline bool operator<=(const Fraction& rhs) const {
		return !(*this > rhs);
	}
	inline bool operator>=(const Fraction& rhs) const {
		return !(*this < rhs);
	}

	int64_t num; // holds the sign
	int64_t den; // should always be kept positive
};

inline Fraction fromMs(int64_t ms) {
	return Fraction(ms, 1000);
}
