/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <jsonutils.hpp>
#include <malformedpairexception.hpp>
#include <uploadresult.hpp>

using std::string;
using std::vector;

using namespace au;

UploadResult::UploadResult() :
	assetId(),
	publicId(),
	version(),
	versionId(),
	signature(),
	width(),
	height(),
	format(),
	resourceType(),
	createdAt(),
	tags(),
	pages(),
	bytes(),
	type(),
	etag(),
	placeholder(),
	url(),
	secureUrl(),
	accessMode(),
	context(),
	colors(),
	predominant(),
	phash(),
	originalFilename(),
	responsiveBreakpoints(),
	errorMessage()
{}

UploadResult::UploadResult(const Json::Value &root) :
	UploadResult()
{
	if(root.type() != Json::objectValue)
		throw MalformedResponseException("Upload result is not a json object");

	extractJson(publicId, root, "public_id");

	extractJsonOptional(assetId, root, "asset_id");
	extractJsonOptional(version, root, "version");
	extractJsonOptional(versionId, root, "version_id");
	extractJsonOptional(signature, root, "signature");
	extractJsonOptional(width, root, "width");
	extractJsonOptional(height, root, "height");
	extractJsonOptional(format, root, "format");
	extractJsonOptional(resourceType, root, "resource_type");
	extractJsonOptional(pages, root, "pages");
	extractJsonOptional(bytes, root, "bytes");
	extractJsonOptional(type, root, "type");
	extractJsonOptional(etag, root, "etag");
	extractJsonOptional(placeholder, root, "placeholder");
	extractJsonOptional(url, root, "url");
	extractJsonOptional(secureUrl, root, "secure_url");
	extractJsonOptional(accessMode, root, "access_mode");
	extractJsonOptional(phash, root, "phash");
	extractJsonOptional(originalFilename, root, "original_filename");
	extractJsonOptional(errorMessage, root, "error", "message");

	string created;
	if(extractJsonOptional(created, root, "created_at"))
		createdAt = parseRfc3339(created);

	const Json::Value &tagList = root["tags"];
	if(tagList.type() == Json::arrayValue)
	{
		for(const Json::Value &tag : tagList)
		{
			string t;
			fromJson(t, tag, "tags");
			tags.push_back(t);
		}
	}
	else if(!tagList.isNull())
		throw MalformedResponseException("Json value \"tags\" is not an array");

	const Json::Value &contextObject = root["context"];
	if(contextObject.type() == Json::objectValue)
	{
		for(const string &key : contextObject.getMemberNames())
			context[key] = contextObject[key];
	}
	else if(!contextObject.isNull())
		throw MalformedResponseException("Json value \"context\" is not an object");

	colors = decodeColorWeights(root["colors"], "colors");
	predominant = decodePredominantColors(root["predominant"], "predominant");

	const Json::Value &breakpoints = root["responsive_breakpoints"];
	if(breakpoints.type() == Json::arrayValue)
		for(const Json::Value &breakpoint : breakpoints)
			responsiveBreakpoints.emplace_back(breakpoint);
	else if(!breakpoints.isNull())
		throw MalformedResponseException("Json value \"responsive_breakpoints\" is not an array");
}

Json::Value UploadResult::toJson() const
{
	Json::Value root(Json::objectValue);

	root["asset_id"] = assetId;
	root["public_id"] = publicId;
	root["version"] = Json::Value((Json::Int64)version);
	root["version_id"] = versionId;
	root["signature"] = signature;
	root["width"] = width;
	root["height"] = height;
	root["format"] = format;
	root["resource_type"] = resourceType;
	if(createdAt != Timestamp())root["created_at"] = formatRfc3339(createdAt);
	root["pages"] = pages;
	root["bytes"] = Json::Value((Json::UInt64)bytes);
	root["type"] = type;
	root["etag"] = etag;
	root["placeholder"] = placeholder;
	root["url"] = url;
	root["secure_url"] = secureUrl;
	if(!accessMode.empty())root["access_mode"] = accessMode;
	if(!phash.empty())root["phash"] = phash;
	root["original_filename"] = originalFilename;

	if(!tags.empty())
	{
		root["tags"] = Json::Value(Json::arrayValue);
		for(const string &tag : tags)
			root["tags"].append(tag);
	}

	if(!context.empty())
	{
		root["context"] = Json::Value(Json::objectValue);
		for(const auto &entry : context)
			root["context"][entry.first] = entry.second;
	}

	if(!colors.empty())root["colors"] = au::toJson(colors);
	if(!predominant.empty())root["predominant"] = au::toJson(predominant);

	if(!responsiveBreakpoints.empty())
	{
		root["responsive_breakpoints"] = Json::Value(Json::arrayValue);
		for(const ResponsiveBreakpoint &breakpoint : responsiveBreakpoints)
			root["responsive_breakpoints"].append(breakpoint.toJson());
	}

	if(!errorMessage.empty())root["error"]["message"] = errorMessage;

	return root;
}

bool UploadResult::operator== (const UploadResult &other) const
{
	return
		assetId == other.assetId &&
		publicId == other.publicId &&
		version == other.version &&
		versionId == other.versionId &&
		signature == other.signature &&
		width == other.width &&
		height == other.height &&
		format == other.format &&
		resourceType == other.resourceType &&
		createdAt == other.createdAt &&
		tags == other.tags &&
		pages == other.pages &&
		bytes == other.bytes &&
		type == other.type &&
		etag == other.etag &&
		placeholder == other.placeholder &&
		url == other.url &&
		secureUrl == other.secureUrl &&
		accessMode == other.accessMode &&
		context == other.context &&
		colors == other.colors &&
		predominant == other.predominant &&
		phash == other.phash &&
		originalFilename == other.originalFilename &&
		responsiveBreakpoints == other.responsiveBreakpoints &&
		errorMessage == other.errorMessage;
}

UploadResult au::decodeUploadResult(const string &body)
{
	try {
		Json::Value root;
		parseJson(body, root);

		UploadResult result(root);
		return result;
	} catch(const MalformedPairException &e) {
		throw MalformedPairException("Unable to decode upload result: ", e.what());
	} catch(const MalformedResponseException &e) {
		throw MalformedResponseException("Unable to decode upload result: ", e.what());
	}
}

std::ostream& au::operator<< (std::ostream &out, const UploadResult &result)
{
	out<<writeJson(result.toJson(), true);
	return out;
}
