/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CANCELLEDEXCEPTION_HPP
#define CANCELLEDEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * A CancelledException is thrown when an upload session
  * was cancelled using its CancellationToken
 **/
struct CancelledException : public UploadException
{

	/**
	  * Constructs a CancelledException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	CancelledException(const T& ...t) :
		UploadException(t...)
	{}

}; //end struct CancelledException

} //end namespace au

#endif //CANCELLEDEXCEPTION_HPP
