/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef TIMESTAMP_HPP
#define TIMESTAMP_HPP

#include <chrono>
#include <string>

namespace au
{

/**
  * The point in time type used for timestamps of the service
 **/
typedef std::chrono::system_clock::time_point Timestamp;

/**
  * Parses an RFC-3339 timestamp such as "2022-02-19T16:30:44Z" or
  * "2022-02-19T17:30:44.125+01:00". Throws a MalformedResponseException
  * if the string is not a valid timestamp
 **/
Timestamp parseRfc3339(const std::string &str);

/**
  * Formats the given timestamp as RFC-3339 in UTC. Fractional
  * seconds are only written if there are any
 **/
std::string formatRfc3339(const Timestamp &timestamp);

/**
  * Creates a timestamp from calendar values in UTC
 **/
Timestamp makeUtcTimestamp(int year, int month, int day, int hour, int minute, int second);

} //end namespace au

#endif //TIMESTAMP_HPP
