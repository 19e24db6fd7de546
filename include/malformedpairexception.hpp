/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef MALFORMEDPAIREXCEPTION_HPP
#define MALFORMEDPAIREXCEPTION_HPP

#include <malformedresponseexception.hpp>

namespace au
{

/**
  * A MalformedPairException is thrown when a [label, weight]
  * json array has the wrong arity or element types
 **/
struct MalformedPairException : public MalformedResponseException
{

	/**
	  * Constructs a MalformedPairException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	MalformedPairException(const T& ...t) :
		MalformedResponseException(t...)
	{}

}; //end struct MalformedPairException

} //end namespace au

#endif //MALFORMEDPAIREXCEPTION_HPP
