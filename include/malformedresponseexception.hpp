/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef MALFORMEDRESPONSEEXCEPTION_HPP
#define MALFORMEDRESPONSEEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * A MalformedResponseException is thrown whenever a
  * response body of the service can't be decoded
 **/
struct MalformedResponseException : public UploadException
{

	/**
	  * Constructs a MalformedResponseException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	MalformedResponseException(const T& ...t) :
		UploadException(t...)
	{}

}; //end struct MalformedResponseException

} //end namespace au

#endif //MALFORMEDRESPONSEEXCEPTION_HPP
