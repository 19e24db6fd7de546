/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CURLDEFINITIONS_HPP
#define CURLDEFINITIONS_HPP

#include <curl/curl.h>
#include <map>
#include <string>

#include <ci_string.hpp>
#include <utils.hpp>

namespace au
{

/**
  * This function should be called by the main
  * thread to initialize cURL.
 **/
inline void initCurl()
{
	curl_global_init(CURL_GLOBAL_ALL);
}

/**
  * This function should be called by the main thread
  * to clean up cURL
 **/
inline void cleanupCurl()
{
	curl_global_cleanup();
}

/**
  * A cURL callback to write the data to the memory
 **/
inline size_t writeMemoryCallback(void *contents, size_t size, size_t nmemb, void *userp)
{
	std::string &str = (*(std::string*)userp);
	const char *chars = static_cast<char*>(contents);
	str.append(chars, size*nmemb);
	return size*nmemb;
}

/**
  * A cURL callback which collects the response headers.
  * When a new status line is received (e.g. after a
  * redirect) the previous headers are dropped
 **/
inline size_t headerCallback(char *buffer, size_t size, size_t nitems, void *userp)
{
	std::map<utils::ci_string, std::string> &headers = (*(std::map<utils::ci_string, std::string>*)userp);
	const std::string line(buffer, size*nitems);

	if(utils::startsWith(line, "HTTP/"))
	{
		headers.clear();
		return size*nitems;
	}

	const std::size_t colon = line.find(':');
	if(colon != std::string::npos)
	{
		const std::string name = utils::trim(line.substr(0, colon));
		headers[utils::ci_string(name.c_str())] = utils::trim(line.substr(colon + 1));
	}

	return size*nitems;
}

} //end namespace au

#endif // CURLDEFINITIONS_HPP
