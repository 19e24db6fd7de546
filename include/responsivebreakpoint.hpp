/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef RESPONSIVEBREAKPOINT_HPP
#define RESPONSIVEBREAKPOINT_HPP

#include <json/json.h>
#include <string>
#include <vector>

#include <jsonutils.hpp>

namespace au
{

/**
  * One generated image width of a responsive breakpoints request
 **/
struct Breakpoint
{

	Breakpoint() :
		width(),
		height(),
		bytes(),
		url(),
		secureUrl()
	{}

	explicit Breakpoint(const Json::Value &root) :
		width(),
		height(),
		bytes(),
		url(),
		secureUrl()
	{
		if(root.type() != Json::objectValue)
			throw MalformedResponseException("Breakpoint is not an object");

		extractJsonOptional(width, root, "width");
		extractJsonOptional(height, root, "height");
		extractJsonOptional(bytes, root, "bytes");
		extractJsonOptional(url, root, "url");
		extractJsonOptional(secureUrl, root, "secure_url");
	}

	Json::Value toJson() const
	{
		Json::Value v(Json::objectValue);
		v["width"] = width;
		v["height"] = height;
		v["bytes"] = Json::Value((Json::UInt64)bytes);
		v["url"] = url;
		v["secure_url"] = secureUrl;
		return v;
	}

	bool operator== (const Breakpoint &other) const
	{
		return width == other.width && height == other.height && bytes == other.bytes &&
			url == other.url && secureUrl == other.secureUrl;
	}

	int width;
	int height;
	unsigned long long bytes;
	std::string url;
	std::string secureUrl;

}; //end struct Breakpoint

/**
  * The breakpoints which were generated for one requested
  * transformation
 **/
struct ResponsiveBreakpoint
{

	ResponsiveBreakpoint() :
		transformation(),
		breakpoints()
	{}

	explicit ResponsiveBreakpoint(const Json::Value &root) :
		transformation(),
		breakpoints()
	{
		if(root.type() != Json::objectValue)
			throw MalformedResponseException("Responsive breakpoint is not an object");

		extractJsonOptional(transformation, root, "transformation");

		const Json::Value &list = root["breakpoints"];
		if(list.type() == Json::arrayValue)
			for(const Json::Value &breakpoint : list)
				breakpoints.emplace_back(breakpoint);
		else if(!list.isNull())
			throw MalformedResponseException("Json value \"breakpoints\" is not an array");
	}

	Json::Value toJson() const
	{
		Json::Value v(Json::objectValue);
		v["transformation"] = transformation;
		v["breakpoints"] = Json::Value(Json::arrayValue);
		for(const Breakpoint &breakpoint : breakpoints)
			v["breakpoints"].append(breakpoint.toJson());
		return v;
	}

	bool operator== (const ResponsiveBreakpoint &other) const
	{
		return transformation == other.transformation && breakpoints == other.breakpoints;
	}

	//The transformation which was applied before scaling, e.g. "a_90"
	std::string transformation;

	std::vector<Breakpoint> breakpoints;

}; //end struct ResponsiveBreakpoint

} //end namespace au

#endif //RESPONSIVEBREAKPOINT_HPP
