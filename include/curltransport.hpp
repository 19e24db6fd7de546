/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CURLTRANSPORT_HPP
#define CURLTRANSPORT_HPP

#include <string>

#include <transport.hpp>

namespace au
{

/**
  * A Transport which uses libcurl. Every request uses its
  * own easy handle, so one CurlTransport can be shared by
  * concurrent sessions. initCurl() must have been called
  * by the main thread before.
 **/
class CurlTransport : public Transport
{

public:
	CurlTransport(const std::string &userAgent="assetupload", bool verbose=false);

	virtual HttpResponse send(const HttpRequest &request, const Deadline &deadline, const CancellationToken &cancellation);

private:
	std::string userAgent;
	bool verbose;

}; //end class CurlTransport

} //end namespace au

#endif //CURLTRANSPORT_HPP
