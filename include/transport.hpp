/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef TRANSPORT_HPP
#define TRANSPORT_HPP

#include <cancellationtoken.hpp>
#include <deadline.hpp>
#include <http.hpp>

namespace au
{

/**
  * A Transport performs exactly one HTTP request. Connection
  * handling, TLS and retries are up to the implementation,
  * the uploader never retries a request itself.
  * Implementations must be usable from several threads at
  * the same time, each session calls send() sequentially.
 **/
class Transport
{

public:
	virtual ~Transport() {}

	/**
	  * Sends the request and returns the response, regardless
	  * of the HTTP status code. Throws a DeadlineExceededException
	  * if the deadline elapses, a CancelledException if the token
	  * is cancelled and a TransportException for network errors
	 **/
	virtual HttpResponse send(const HttpRequest &request, const Deadline &deadline, const CancellationToken &cancellation) = 0;

}; //end class Transport

} //end namespace au

#endif //TRANSPORT_HPP
