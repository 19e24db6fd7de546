/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef JSONUTILS_HPP
#define JSONUTILS_HPP

#include <cstdint>
#include <json/json.h>
#include <string>

#include <malformedresponseexception.hpp>

namespace au
{

	/**
	  * Returns true if the given value is a json number,
	  * regardless whether it was written as integer or decimal
	 **/
	inline bool isJsonNumber(const Json::Value &v)
	{
		return v.type() == Json::intValue || v.type() == Json::uintValue || v.type() == Json::realValue;
	}

	/**
	  * Converts the given json value into out. Every overload
	  * checks the json type and throws a MalformedResponseException
	  * if it doesn't match
	 **/
	inline void fromJson(std::string &out, const Json::Value &v, const std::string &name)
	{
		if(v.type() != Json::stringValue)throw MalformedResponseException("Json value \"", name, "\" is not a string");
		out = v.asString();
	}

	inline void fromJson(bool &out, const Json::Value &v, const std::string &name)
	{
		if(v.type() != Json::booleanValue)throw MalformedResponseException("Json value \"", name, "\" is not a bool");
		out = v.asBool();
	}

	inline void fromJson(double &out, const Json::Value &v, const std::string &name)
	{
		if(!isJsonNumber(v))throw MalformedResponseException("Json value \"", name, "\" is not a number");
		out = v.asDouble();
	}

	inline void fromJson(int &out, const Json::Value &v, const std::string &name)
	{
		if(!isJsonNumber(v) || !v.isInt())throw MalformedResponseException("Json value \"", name, "\" is not an int");
		out = v.asInt();
	}

	inline void fromJson(long long &out, const Json::Value &v, const std::string &name)
	{
		if(!isJsonNumber(v) || !v.isInt64())throw MalformedResponseException("Json value \"", name, "\" is not an int64");
		out = v.asInt64();
	}

	inline void fromJson(unsigned long long &out, const Json::Value &v, const std::string &name)
	{
		if(!isJsonNumber(v) || !v.isUInt64())throw MalformedResponseException("Json value \"", name, "\" is not an uint64");
		out = v.asUInt64();
	}

	/**
	  * Extracts the member with the given name from v. The member
	  * must exist and must not be null
	 **/
	template <class T>
	inline void extractJson(T &out, const Json::Value &v, const std::string &value)
	{
		if(v.type() != Json::objectValue)throw MalformedResponseException("Can't extract Json value \"",value,"\" from a non-object");
		if(!v.isMember(value) || v[value].isNull())throw MalformedResponseException("Can't extract Json value \"",value,"\"");
		fromJson(out, v[value], value);
	}

	/**
	  * Extracts a nested member, e.g.
	  * extractJson(out, root, "error", "message")
	 **/
	template <class T, class ...V>
	inline void extractJson(T &out, const Json::Value &v, const std::string &value, const V& ...values)
	{
		if(v.type() != Json::objectValue)throw MalformedResponseException("Can't extract Json value \"",value,"\" from a non-object");
		if(!v.isMember(value) || v[value].isNull())throw MalformedResponseException("Can't extract Json value \"",value,"\"");
		extractJson(out, v[value], values...);
	}

	/**
	  * Extracts the member with the given name from v if it exists.
	  * Returns false if the member (or v itself) is absent or null,
	  * out is left untouched in this case. A member of the wrong
	  * type is still an error
	 **/
	template <class T>
	inline bool extractJsonOptional(T &out, const Json::Value &v, const std::string &value)
	{
		if(v.type() != Json::objectValue)return false;
		if(!v.isMember(value) || v[value].isNull())return false;
		fromJson(out, v[value], value);
		return true;
	}

	/**
	  * Extracts an optional nested member
	 **/
	template <class T, class ...V>
	inline bool extractJsonOptional(T &out, const Json::Value &v, const std::string &value, const V& ...values)
	{
		if(v.type() != Json::objectValue)return false;
		if(!v.isMember(value) || v[value].isNull())return false;
		return extractJsonOptional(out, v[value], values...);
	}

	/**
	  * Parses the given string into root. Throws a
	  * MalformedResponseException if it isn't valid json
	 **/
	void parseJson(const std::string &str, Json::Value &root);

	/**
	  * Writes the given json value compact or indented with
	  * tabs. Every decimal number is written in the shortest
	  * form which restores the exact value
	 **/
	std::string writeJson(const Json::Value &root, bool pretty=false);

} //end namespace au

#endif //JSONUTILS_HPP
