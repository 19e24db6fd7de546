/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <jsonutils.hpp>
#include <uploadparams.hpp>
#include <utils.hpp>

using std::map;
using std::string;
using std::vector;

using namespace au;

static inline void addToggle(Params &params, const string &name, Toggle toggle)
{
	switch(toggle)
	{
	case Toggle::on: params[name] = "true"; break;
	case Toggle::off: params[name] = "false"; break;
	case Toggle::unset: break;
	}
}

static inline void addFlag(Params &params, const string &name, bool flag)
{
	if(flag)params[name] = "true";
}

static inline void addString(Params &params, const string &name, const string &value)
{
	if(!value.empty())params[name] = value;
}

static inline string escapeContextValue(const string &value)
{
	return utils::replaceAll(utils::replaceAll(value, "=", "\\="), "|", "\\|");
}

Json::Value BreakpointsRequest::toJson() const
{
	Json::Value v(Json::objectValue);
	v["create_derived"] = createDerived;
	if(!transformation.empty())v["transformation"] = transformation;
	if(maxWidth != 0)v["max_width"] = maxWidth;
	if(minWidth != 0)v["min_width"] = minWidth;
	if(bytesStep != 0)v["bytes_step"] = bytesStep;
	if(maxImages != 0)v["max_images"] = maxImages;
	return v;
}

string au::encodeContext(const map<string, string> &context)
{
	vector<string> parts;
	for(const auto &entry : context)
		parts.push_back(escapeContextValue(entry.first) + "=" + escapeContextValue(entry.second));

	return utils::join(parts, "|");
}

Params UploadParams::toParams() const
{
	Params params;

	addString(params, "public_id", publicId);
	addString(params, "folder", folder);
	addToggle(params, "overwrite", overwrite);
	addToggle(params, "unique_filename", uniqueFilename);
	addString(params, "type", type);
	addString(params, "tags", utils::join(tags, ","));
	addString(params, "context", encodeContext(context));
	addFlag(params, "colors", colors);
	addFlag(params, "phash", phash);
	addFlag(params, "quality_analysis", qualityAnalysis);
	addFlag(params, "accessibility_analysis", accessibilityAnalysis);
	addFlag(params, "cinemagraph_analysis", cinemagraphAnalysis);
	addString(params, "eager", eager);
	addString(params, "notification_url", notificationUrl);

	if(!responsiveBreakpoints.empty())
	{
		Json::Value breakpoints(Json::arrayValue);
		for(const BreakpointsRequest &request : responsiveBreakpoints)
			breakpoints.append(request.toJson());
		params["responsive_breakpoints"] = writeJson(breakpoints);
	}

	return params;
}
