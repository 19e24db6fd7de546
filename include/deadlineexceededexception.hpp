/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef DEADLINEEXCEEDEDEXCEPTION_HPP
#define DEADLINEEXCEEDEDEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * A DeadlineExceededException is thrown when the deadline
  * of an upload session elapsed before or while a request
  * was performed
 **/
struct DeadlineExceededException : public UploadException
{

	/**
	  * Constructs a DeadlineExceededException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	DeadlineExceededException(const T& ...t) :
		UploadException(t...)
	{}

}; //end struct DeadlineExceededException

} //end namespace au

#endif //DEADLINEEXCEEDEDEXCEPTION_HPP
