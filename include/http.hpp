/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef HTTP_HPP
#define HTTP_HPP

#include <map>
#include <string>
#include <vector>

#include <ci_string.hpp>

namespace au
{

/**
  * One part of a multipart/form-data request body
 **/
struct FormField
{

	FormField(const std::string &str_name, const std::string &str_value) :
		name(str_name),
		value(str_value),
		isFile(false),
		filename()
	{}

	FormField(const std::string &str_name, const std::string &str_value, const std::string &str_filename) :
		name(str_name),
		value(str_value),
		isFile(true),
		filename(str_filename)
	{}

	std::string name;

	//The field value, for files the content
	std::string value;

	//Whether the field is sent as a file part
	bool isFile;

	std::string filename;

}; //end struct FormField

/**
  * A HTTP request as it is passed to a Transport
 **/
struct HttpRequest
{

	HttpRequest(const std::string &str_method, const std::string &str_url) :
		method(str_method),
		url(str_url),
		headers(),
		fields()
	{}

	/**
	  * Adds a header in the form "Name: value"
	 **/
	void addHeader(const std::string &name, const std::string &value)
	{
		headers.push_back(name + ": " + value);
	}

	/**
	  * Returns true if a header with the given
	  * (case insensitive) name was added
	 **/
	bool hasHeader(const utils::ci_string &name) const;

	/**
	  * Returns the value of the given header or an empty string
	 **/
	std::string getHeader(const utils::ci_string &name) const;

	/**
	  * Returns the form field with the given name or nullptr
	 **/
	const FormField* getField(const std::string &name) const;

	std::string method;

	std::string url;

	//Headers in the form "Name: value"
	std::vector<std::string> headers;

	//The multipart body
	std::vector<FormField> fields;

}; //end struct HttpRequest

/**
  * A HTTP response as it is returned by a Transport
 **/
struct HttpResponse
{

	HttpResponse() :
		code(),
		contentType(),
		headers(),
		body()
	{}

	HttpResponse(long l_code, const std::string &str_body) :
		code(l_code),
		contentType("application/json"),
		headers(),
		body(str_body)
	{}

	/**
	  * Returns the value of the given header or an empty string
	 **/
	std::string getHeader(const utils::ci_string &name) const
	{
		const auto found = headers.find(name);
		return (found == headers.end()) ? std::string() : found->second;
	}

	//The HTTP status code
	long code;

	std::string contentType;

	std::map<utils::ci_string, std::string> headers;

	std::string body;

}; //end struct HttpResponse

} //end namespace au

#endif //HTTP_HPP
