/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UNKNOWNLENGTHEXCEPTION_HPP
#define UNKNOWNLENGTHEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * An UnknownLengthException is thrown when the size of
  * a source can't be determined before the first request
 **/
struct UnknownLengthException : public UploadException
{

	/**
	  * Constructs a UnknownLengthException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	UnknownLengthException(const T& ...t) :
		UploadException(t...)
	{}

}; //end struct UnknownLengthException

} //end namespace au

#endif //UNKNOWNLENGTHEXCEPTION_HPP
