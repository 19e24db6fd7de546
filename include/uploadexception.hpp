/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UPLOADEXCEPTION_HPP
#define UPLOADEXCEPTION_HPP

#include <exception>
#include <string>

#include <utils.hpp>

namespace au
{

/**
  * Is thrown whenever an upload related error happened.
  * All other exceptions of the client derive from it, so
  * catching an UploadException catches every failure of
  * an upload session
 **/
struct UploadException : public std::exception
{

	/**
	  * Constructs an UploadException using any number of arguments
	 **/
	template <class ...T>
	UploadException(const T& ...t) :
		msg(utils::concat(t...))
	{}

	/**
	  * Returns the error string of the exception
	 **/
	virtual const char* what() const throw()
	{
		return msg.c_str();
	}

	/**
	  * The reason for the error
	 **/
	std::string msg;

}; //end struct UploadException

} //end namespace au

#endif //UPLOADEXCEPTION_HPP
