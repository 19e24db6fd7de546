/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef TRANSPORTEXCEPTION_HPP
#define TRANSPORTEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * A TransportException is thrown whenever a request failed on
  * the network or HTTP layer. In case of a HTTP error the status
  * code is stored, for network errors it is 0
 **/
struct TransportException : public UploadException
{

	/**
	  * Constructs a TransportException for the given HTTP status code
	  * using an arbitrary amount of arguments which are put together
	 **/
	template <class ...T>
	TransportException(long l_statusCode, const T& ...t) :
		UploadException(t...),
		statusCode(l_statusCode)
	{}

	/**
	  * The HTTP status code or 0 if no response was received
	 **/
	long statusCode;

}; //end struct TransportException

} //end namespace au

#endif //TRANSPORTEXCEPTION_HPP
