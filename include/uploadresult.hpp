/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UPLOADRESULT_HPP
#define UPLOADRESULT_HPP

#include <json/json.h>
#include <map>
#include <ostream>
#include <string>
#include <vector>

#include <colorweight.hpp>
#include <responsivebreakpoint.hpp>
#include <timestamp.hpp>

namespace au
{

/**
  * The result of a successful upload as returned by the service.
  * Every field which is not contained in the response keeps its
  * zero value, only public_id is mandatory.
 **/
struct UploadResult
{

	/**
	  * Default constructor
	 **/
	UploadResult();

	/**
	  * Decodes the upload result from the given json object.
	  * Unknown fields are ignored. Throws a MalformedResponseException
	  * if public_id is missing or a known field has the wrong type
	 **/
	explicit UploadResult(const Json::Value &root);

	/**
	  * Encodes the result back into its json form
	 **/
	Json::Value toJson() const;

	bool operator== (const UploadResult &other) const;

	bool operator!= (const UploadResult &other) const
	{
		return !(*this == other);
	}

	//The immutable id of the asset
	std::string assetId;

	//The public id which is used in delivery URLs
	std::string publicId;

	//The version of the asset, a unix timestamp of the upload
	long long version;

	std::string versionId;

	//The signature of the response which can be verified using the api secret
	std::string signature;

	int width;

	int height;

	//The file format, e.g. "png"
	std::string format;

	//"image", "video" or "raw"
	std::string resourceType;

	Timestamp createdAt;

	std::vector<std::string> tags;

	//The number of pages of multi page documents such as PDFs or animated GIFs
	int pages;

	//The size of the stored asset in bytes
	unsigned long long bytes;

	//The delivery type, e.g. "upload" or "authenticated"
	std::string type;

	std::string etag;

	//True if a placeholder was stored instead of the real asset
	bool placeholder;

	std::string url;

	std::string secureUrl;

	std::string accessMode;

	//Contextual metadata, e.g. { "custom": { "alt": "A photo" } }
	std::map<std::string, Json::Value> context;

	//Only returned if colors were requested
	ColorWeights colors;

	//Only returned if colors were requested
	PredominantColors predominant;

	//Perceptual hash of the image, only returned if requested
	std::string phash;

	std::string originalFilename;

	std::vector<ResponsiveBreakpoint> responsiveBreakpoints;

	//An error message the service reported alongside the result
	std::string errorMessage;

}; //end struct UploadResult

/**
  * Parses the given response body and decodes it into an
  * UploadResult. Every error is reported as MalformedResponseException
 **/
UploadResult decodeUploadResult(const std::string &body);

/**
  * Writes the result as formatted json
 **/
std::ostream& operator<< (std::ostream &out, const UploadResult &result);

} //end namespace au

#endif //UPLOADRESULT_HPP
