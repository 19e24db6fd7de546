/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef FIXTURES_HPP
#define FIXTURES_HPP

#include <string>

#include <uploadresult.hpp>
#include <utils.hpp>

namespace au
{

namespace fixtures
{

/**
  * A complete response of an image upload with color analysis
 **/
const std::string imageUploadResponse = R"json(
{
	"asset_id": "c3f435bff0410515f8fdadb2a5037881",
	"public_id": "testimage",
	"version": 1645288244,
	"version_id": "ecc1001803c67e03780bb2e43a71314e",
	"signature": "910e43e4e41490d1bac6cc5309dde599c7edb933",
	"width": 600,
	"height": 600,
	"format": "png",
	"resource_type": "image",
	"created_at": "2022-02-19T16:30:44Z",
	"pages": 1,
	"bytes": 31543,
	"type": "upload",
	"etag": "a1e0cf45cf40c6a5e919ac6785d92d5b",
	"url": "http://foo.com/image/upload/v1645288244/testimage.png",
	"secure_url": "https://foo.com/image/upload/v1645288244/testimage.png",
	"colors": [["#E4E4A8", 71], ["#2F2F2F", 8.7], ["#7A6241", 7.8], ["#DEC39C", 7.4]],
	"predominant": {
		"cloudinary": [["yellow", 71], ["black", 8.7], ["brown", 7.8], ["orange", 7.4]],
		"google": [["yellow", 71], ["black", 8.7], ["brown", 7.8], ["orange", 7.4]]
	},
	"phash": "31845b631e659ee9",
	"original_filename": "file"
}
)json";

/**
  * The result which is contained in imageUploadResponse
 **/
inline UploadResult imageUploadResult()
{
	UploadResult result;
	result.assetId = "c3f435bff0410515f8fdadb2a5037881";
	result.publicId = "testimage";
	result.version = 1645288244;
	result.versionId = "ecc1001803c67e03780bb2e43a71314e";
	result.signature = "910e43e4e41490d1bac6cc5309dde599c7edb933";
	result.width = 600;
	result.height = 600;
	result.format = "png";
	result.resourceType = "image";
	result.createdAt = makeUtcTimestamp(2022, 2, 19, 16, 30, 44);
	result.pages = 1;
	result.bytes = 31543;
	result.type = "upload";
	result.etag = "a1e0cf45cf40c6a5e919ac6785d92d5b";
	result.url = "http://foo.com/image/upload/v1645288244/testimage.png";
	result.secureUrl = "https://foo.com/image/upload/v1645288244/testimage.png";
	result.colors = {
		ColorWeight("#E4E4A8", 71), ColorWeight("#2F2F2F", 8.7),
		ColorWeight("#7A6241", 7.8), ColorWeight("#DEC39C", 7.4)
	};

	const ColorWeights predominant = {
		ColorWeight("yellow", 71), ColorWeight("black", 8.7),
		ColorWeight("brown", 7.8), ColorWeight("orange", 7.4)
	};
	result.predominant["cloudinary"] = predominant;
	result.predominant["google"] = predominant;

	result.phash = "31845b631e659ee9";
	result.originalFilename = "file";
	return result;
}

/**
  * A minimal final response
 **/
inline std::string finalResponse(const std::string &publicId, unsigned long long bytes)
{
	return utils::concat("{\"public_id\":\"", publicId, "\",\"bytes\":", bytes, ",\"resource_type\":\"raw\"}");
}

} //end namespace fixtures

} //end namespace au

#endif //FIXTURES_HPP
