/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CONFIGEXCEPTION_HPP
#define CONFIGEXCEPTION_HPP

#include <uploadexception.hpp>

namespace au
{

/**
  * A ConfigException is thrown whenever an error
  * occured when dealing with options or config files
 **/
struct ConfigException : public UploadException
{

	/**
	  * Constructs a ConfigException using an arbitrary
	  * amount of arguments which are put together
	 **/
	template <class ...T>
	ConfigException(const T& ...t) :
		UploadException(t...)
	{}

}; //end struct ConfigException

} //end namespace au

#endif //CONFIGEXCEPTION_HPP
