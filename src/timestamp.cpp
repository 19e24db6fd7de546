/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <cctype>
#include <cstdio>
#include <ctime>

#include <malformedresponseexception.hpp>
#include <timestamp.hpp>

using std::string;
using std::chrono::microseconds;
using std::chrono::seconds;
using std::chrono::system_clock;

using namespace au;

/**
  * Reads exactly count digits starting at pos
 **/
static bool readDigits(const string &str, std::size_t &pos, std::size_t count, int &out)
{
	if(pos + count > str.length())return false;

	out = 0;
	for(std::size_t i = 0; i < count; ++i, ++pos)
	{
		if(!isdigit((unsigned char)str[pos]))return false;
		out = out * 10 + (str[pos] - '0');
	}
	return true;
}

static bool expect(const string &str, std::size_t &pos, const char *chars)
{
	if(pos >= str.length())return false;
	for(const char *c = chars; *c; ++c)
	{
		if(str[pos] == *c)
		{
			pos++;
			return true;
		}
	}
	return false;
}

Timestamp au::makeUtcTimestamp(int year, int month, int day, int hour, int minute, int second)
{
	struct tm t = {};
	t.tm_year = year - 1900;
	t.tm_mon = month - 1;
	t.tm_mday = day;
	t.tm_hour = hour;
	t.tm_min = minute;
	t.tm_sec = second;

	return system_clock::from_time_t(timegm(&t));
}

Timestamp au::parseRfc3339(const string &str)
{
	int year, month, day, hour, minute, second;
	std::size_t pos = 0;

	if(!readDigits(str, pos, 4, year) || !expect(str, pos, "-") ||
		!readDigits(str, pos, 2, month) || !expect(str, pos, "-") ||
		!readDigits(str, pos, 2, day) || !expect(str, pos, "Tt ") ||
		!readDigits(str, pos, 2, hour) || !expect(str, pos, ":") ||
		!readDigits(str, pos, 2, minute) || !expect(str, pos, ":") ||
		!readDigits(str, pos, 2, second))
		throw MalformedResponseException("Invalid RFC-3339 timestamp \"", str, "\"");

	if(month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || minute > 59 || second > 60)
		throw MalformedResponseException("RFC-3339 timestamp \"", str, "\" is out of range");

	long long fraction = 0;
	if(expect(str, pos, "."))
	{
		long long scale = 100000;
		std::size_t digits = 0;
		for(; pos < str.length() && isdigit((unsigned char)str[pos]); ++pos, ++digits)
		{
			fraction += (str[pos] - '0') * scale;
			scale /= 10;
		}
		if(digits == 0)throw MalformedResponseException("Invalid fraction in RFC-3339 timestamp \"", str, "\"");
	}

	long offset = 0;
	if(!expect(str, pos, "Zz"))
	{
		const bool negative = (pos < str.length() && str[pos] == '-');
		int offsetHour, offsetMinute;

		if(!expect(str, pos, "+-") ||
			!readDigits(str, pos, 2, offsetHour) || !expect(str, pos, ":") ||
			!readDigits(str, pos, 2, offsetMinute))
			throw MalformedResponseException("Invalid time zone in RFC-3339 timestamp \"", str, "\"");

		offset = (offsetHour * 60L + offsetMinute) * 60L;
		if(negative)offset = -offset;
	}

	if(pos != str.length())
		throw MalformedResponseException("Trailing characters in RFC-3339 timestamp \"", str, "\"");

	return makeUtcTimestamp(year, month, day, hour, minute, second) - seconds(offset) + microseconds(fraction);
}

string au::formatRfc3339(const Timestamp &timestamp)
{
	const long long micros = std::chrono::duration_cast<microseconds>(timestamp.time_since_epoch()).count();

	long long wholeSeconds = micros / 1000000;
	long long fraction = micros % 1000000;
	if(fraction < 0)
	{
		fraction += 1000000;
		wholeSeconds--;
	}

	const time_t t = (time_t)wholeSeconds;
	struct tm utc;
	gmtime_r(&t, &utc);

	char buffer[64];
	strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

	string result(buffer);
	if(fraction != 0)
	{
		char digits[16];
		snprintf(digits, sizeof(digits), ".%06lld", fraction);

		string f(digits);
		while(f.back() == '0')f.pop_back();
		result += f;
	}

	return result + "Z";
}
