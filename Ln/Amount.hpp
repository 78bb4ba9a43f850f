#ifndef LN_AMOUNT_HPP
#define LN_AMOUNT_HPP

#include<cstdint>
#include<iostream>
#include<string>

namespace Jsmn { class Object; }

namespace Ln {

/** class Ln::Amount
 *
 * @brief represents some amount of Bitcoins, with
 * millisatoshi precision.
 *
 * @desc Arithmetic saturates instead of wrapping,
 * so subtracting a larger amount yields zero.
 */
class Amount {
private:
	/* In millisatoshi.  */
	std::uint64_t v;

public:
	Amount() : v(0) { }
	Amount(Amount const&) =default;
	Amount& operator=(Amount const&) =default;
	~Amount() =default;

	explicit
	Amount(std::string const&);
	explicit
	operator std::string() const;
	/* Return false if Amount() would throw given this
	 * string.  */
	static
	bool valid_string(std::string const&);

	/* Eclair reports amounts as plain JSON numbers
	 * in millisatoshi.  */
	static
	bool valid_object(Jsmn::Object const&);
	static
	Amount object(Jsmn::Object const&);
	static
	Amount sat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v * 1000;
		return ret;
	}
	static
	Amount msat(std::uint64_t v) {
		auto ret = Amount();
		ret.v = v;
		return ret;
	}

	std::uint64_t to_msat() const { return v; }
	std::uint64_t to_sat() const { return v / 1000; }

	/* Saturates.  */
	Amount& operator+=(Amount const& i) {
		v += i.v;
		if (v < i.v)
			v = UINT64_MAX;
		return *this;
	}
	Amount operator+(Amount const& i) const {
		return Amount(*this) += i;
	}
	Amount& operator-=(Amount const& i) {
		if (i.v > v)
			v = 0;
		else
			v -= i.v;
		return *this;
	}
	Amount operator-(Amount const& i) const {
		return Amount(*this) -= i;
	}
	Amount& operator*=(double i) {
		auto r = double(v) * i;
		if (r <= 0)
			v = 0;
		else if (r >= 18446744073709551615.0)
			v = UINT64_MAX;
		else
			v = std::uint64_t(r);
		return *this;
	}
	Amount operator*(double i) const {
		return Amount(*this) *= i;
	}
	Amount& operator/=(double i) {
		return (*this) *= (1.0 / i);
	}
	Amount operator/(double i) const {
		return Amount(*this) /= i;
	}

	/* Ratio of two amounts.  */
	double operator/(Amount const& o) const {
		return double(v) / double(o.v);
	}

	bool operator<(Amount const& o) const {
		return v < o.v;
	}
	bool operator>(Amount const& o) const {
		return o < (*this);
	}
	bool operator<=(Amount const& o) const {
		return !(*this > o);
	}
	bool operator>=(Amount const& o) const {
		return o <= (*this);
	}
	bool operator==(Amount const& o) const {
		return v == o.v;
	}
	bool operator!=(Amount const& o) const {
		return !(*this == o);
	}
};

inline
Amount operator*(double i, Amount v) {
	return v * i;
}

inline
std::ostream& operator<<(std::ostream& os, Amount const& v) {
	return os << std::string(v);
}
inline
std::istream& operator>>(std::istream& is, Amount& v) {
	auto s = std::string();
	is >> s;
	v = Amount(s);
	return is;
}

}

#endif /* !defined(LN_AMOUNT_HPP) */
