/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CHUNKACKNOWLEDGEMENT_HPP
#define CHUNKACKNOWLEDGEMENT_HPP

#include <json/json.h>
#include <string>

#include <http.hpp>
#include <jsonutils.hpp>

namespace au
{

/**
  * The answer of the service to a chunk which is
  * not the last one of an upload
 **/
struct ChunkAcknowledgement
{

	ChunkAcknowledgement() :
		upload_id(),
		bytes(),
		hasBytes(false)
	{}

	/**
	  * Decodes the acknowledgement from the given response. The
	  * continuation id is taken from the body field "upload_id"
	  * and if it is absent from the X-Unique-Upload-Id header
	 **/
	explicit ChunkAcknowledgement(const HttpResponse &response) :
		upload_id(),
		bytes(),
		hasBytes(false)
	{
		Json::Value root;
		if(!response.body.empty())parseJson(response.body, root);

		if(!root.isNull())
		{
			if(!root.isObject())throw MalformedResponseException("Chunk response is not an object");
			extractJsonOptional(upload_id, root, "upload_id");
			hasBytes = extractJsonOptional(bytes, root, "bytes");
		}

		if(upload_id.empty())upload_id = response.getHeader("X-Unique-Upload-Id");
	}

	std::string upload_id;

	//The number of bytes the service received so far
	unsigned long long bytes;

	bool hasBytes;

}; //end struct ChunkAcknowledgement

} //end namespace au

#endif //CHUNKACKNOWLEDGEMENT_HPP
