/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UPLOADPARAMS_HPP
#define UPLOADPARAMS_HPP

#include <json/json.h>
#include <map>
#include <string>
#include <vector>

#include <signer.hpp>

namespace au
{

/**
  * A boolean option which is only sent if it was set
 **/
enum class Toggle
{
	unset,
	on,
	off
}; //end enum class Toggle

/**
  * Requests the service to create responsive breakpoints
  * for the uploaded image
 **/
struct BreakpointsRequest
{

	BreakpointsRequest(const std::string &str_transformation="", bool b_createDerived=false) :
		createDerived(b_createDerived),
		transformation(str_transformation),
		maxWidth(),
		minWidth(),
		bytesStep(),
		maxImages()
	{}

	/**
	  * Encodes the request as json object, all
	  * limits which are 0 are left out
	 **/
	Json::Value toJson() const;

	//Whether the breakpoint images are created eagerly
	bool createDerived;

	//The transformation which is applied before scaling
	std::string transformation;

	int maxWidth;
	int minWidth;
	int bytesStep;
	int maxImages;

}; //end struct BreakpointsRequest

/**
  * The per asset options of an upload. Empty values
  * and unset toggles are not sent to the service
 **/
struct UploadParams
{

	UploadParams() :
		publicId(),
		folder(),
		overwrite(Toggle::unset),
		uniqueFilename(Toggle::unset),
		resourceType("auto"),
		type(),
		tags(),
		context(),
		responsiveBreakpoints(),
		colors(false),
		phash(false),
		qualityAnalysis(false),
		accessibilityAnalysis(false),
		cinemagraphAnalysis(false),
		eager(),
		notificationUrl()
	{}

	/**
	  * Converts the parameters into form fields. resource_type
	  * is not contained because it is part of the URL
	 **/
	Params toParams() const;

	std::string publicId;

	std::string folder;

	Toggle overwrite;

	Toggle uniqueFilename;

	//"image", "video", "raw" or "auto"
	std::string resourceType;

	//The delivery type, e.g. "upload", "authenticated" or "private"
	std::string type;

	std::vector<std::string> tags;

	std::map<std::string, std::string> context;

	std::vector<BreakpointsRequest> responsiveBreakpoints;

	bool colors;

	bool phash;

	bool qualityAnalysis;

	bool accessibilityAnalysis;

	bool cinemagraphAnalysis;

	//Eager transformations, e.g. "c_fill,w_200|c_crop,h_50"
	std::string eager;

	std::string notificationUrl;

}; //end struct UploadParams

/**
  * Encodes contextual metadata as "key1=value1|key2=value2".
  * '=' and '|' inside keys and values are escaped with a backslash
 **/
std::string encodeContext(const std::map<std::string, std::string> &context);

} //end namespace au

#endif //UPLOADPARAMS_HPP
