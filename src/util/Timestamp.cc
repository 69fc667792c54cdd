/*
	Copyright © 2018 Wan Wai Ho <me@nestal.net>
    
	This file is subject to the terms and conditions of the GNU General Public
	License.  See the file COPYING in the main directory of the pixoo_relay
	distribution for more details.
*/

//
// Created by nestal on 5/27/18.
//

#include "Timestamp.hh"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pxr {

using namespace std::chrono;

void to_json(nlohmann::json& json, const Timestamp& input)
{
	json = input.iso8601();
}

void from_json(const nlohmann::json& json, Timestamp& output)
{
	if (json.is_number())
		output = Timestamp{Timestamp::duration{json.get<Timestamp::duration::rep>()}};
	else
		output = Timestamp::from_iso8601(json.get<std::string>()).value_or(Timestamp{});
}

std::ostream& operator<<(std::ostream& os, Timestamp tp)
{
	return os << tp.iso8601();
}

Timestamp Timestamp::now()
{
	return time_point_cast<Timestamp::duration>(Timestamp::clock::now());
}

std::string Timestamp::iso8601() const
{
	auto tt = system_clock::to_time_t(*this);
	auto ms = time_since_epoch().count() % 1000;
	if (ms < 0)
		ms += 1000;

	std::tm tm_{};
	if (!::gmtime_r(&tt, &tm_))
		return {};

	std::ostringstream ss;
	ss << std::put_time(&tm_, "%Y-%m-%dT%H:%M:%S")
		<< '.' << std::setw(3) << std::setfill('0') << ms << 'Z';
	return ss.str();
}

// Accepts "YYYY-MM-DDTHH:MM:SS" followed by optional fractional seconds and
// an optional "Z" or "+hh:mm" offset.
std::optional<Timestamp> Timestamp::from_iso8601(std::string_view str)
{
	std::tm tm_{};
	std::istringstream ss{std::string{str}};
	ss >> std::get_time(&tm_, "%Y-%m-%dT%H:%M:%S");
	if (ss.fail())
		return std::nullopt;

	milliseconds frac{};
	if (ss.peek() == '.')
	{
		ss.get();
		std::string digits;
		while (std::isdigit(ss.peek()))
			digits.push_back(static_cast<char>(ss.get()));
		digits.resize(3, '0');
		frac = milliseconds{std::stoi(digits)};
	}

	seconds offset{};
	if (auto sign = ss.peek(); sign == '+' || sign == '-')
	{
		ss.get();
		int hh{}, mm{};
		char colon{};
		ss >> hh >> colon >> mm;
		if (ss.fail() || colon != ':')
			return std::nullopt;
		offset = hours{hh} + minutes{mm};
		if (sign == '-')
			offset = -offset;
	}

	auto tt = ::timegm(&tm_);
	return Timestamp{time_point_cast<milliseconds>(system_clock::from_time_t(tt)) + frac - offset};
}

} // end of namespace pxr
