/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <cstdlib>
#include <fstream>
#include <sstream>

#include <configexception.hpp>
#include <configuration.hpp>
#include <utils.hpp>

using std::getline;
using std::string;
using std::stringstream;

using namespace au;


const unsigned long long defaultChunkSize = 20000000;
const long long defaultTimeout = 60;

Configuration::Configuration() :
	cloudName(),
	apiKey(),
	apiSecret(),
	uploadPrefix("https://api.cloudinary.com"),
	chunkSize(defaultChunkSize),
	hasTimeout(true),
	timeout(defaultTimeout),
	userAgent("assetupload")
{}

Configuration::Configuration(const Options &options) :
	Configuration()
{
	cloudName = options.getStringOptionValue("cloud-name");
	apiKey = options.getStringOptionValue("api-key");
	apiSecret = options.getStringOptionValue("api-secret");
	uploadPrefix = options.getStringOptionValue("upload-prefix");
	userAgent = options.getStringOptionValue("user-agent");

	chunkSize = options.getOptionUnsignedValue("chunk-size");
	if(chunkSize == 0)throw ConfigException("chunk-size must be greater than 0");

	if(options.getStringOptionValue("timeout").empty())
	{
		hasTimeout = false;
	}
	else
	{
		hasTimeout = true;
		timeout = std::chrono::seconds((long long)options.getOptionUnsignedValue("timeout"));
	}

	if(uploadPrefix.empty())throw ConfigException("upload-prefix must not be empty");
	while(!uploadPrefix.empty() && uploadPrefix.back() == '/')uploadPrefix.pop_back();
}

Options Configuration::defaultOptions()
{
	return Options({
		Option("cloud-name", "The name of the cloud the assets are uploaded to"),
		Option("api-key", "The API key which is used to sign requests"),
		Option("api-secret", "The API secret which is used to sign requests"),
		Option("upload-prefix", "The base URL of the upload service", "https://api.cloudinary.com"),
		Option("chunk-size",
			"The maximum number of bytes which are sent with one request.\n"
			"Larger assets are uploaded in several chunks", utils::concat(defaultChunkSize).c_str()),
		Option("timeout",
			"The time in seconds a whole upload may take. An empty value\n"
			"disables the deadline", utils::concat(defaultTimeout).c_str()),
		Option("user-agent", "The user agent which is sent with every request", "assetupload"),
		Option("log-level", "The minimum level of log messages", "info", { "debug", "info", "warn", "error", "none" })
	});
}

void Configuration::loadFile(const string &file, Options &options)
{
	std::ifstream in(file.c_str());
	if(!in)throw ConfigException("Unable to open config file ", file);

	stringstream ss;
	ss<<in.rdbuf();

	try {
		process(ss.str(), options);
	} catch(const ConfigException &e) {
		throw ConfigException("Error in config file ", file, ": ", e.what());
	}
}

void Configuration::process(const string &content, Options &options)
{
	stringstream ss(content);
	string line;
	unsigned int lineNumber = 0;

	while(getline(ss, line))
	{
		lineNumber++;

		line = utils::trim(line);
		if(line.empty() || line[0] == '#')continue;

		const std::size_t colon = line.find(':');
		if(colon == string::npos)throw ConfigException("Didn't find a colon in line ", lineNumber);

		const string name = utils::trim(line.substr(0, colon));
		string value = utils::trim(line.substr(colon + 1));

		if(value.length() >= 2 && (value[0] == '"' || value[0] == '\'') && value.back() == value[0])
			value = value.substr(1, value.length() - 2);

		if(name == "url")applyUrl(value, options);
		else options.setOptionValue(name.c_str(), value.c_str());
	}
}

void Configuration::applyUrl(const string &url, Options &options)
{
	const string scheme = "cloudinary://";
	if(!utils::startsWith(url, scheme))throw ConfigException("Invalid URL \"", url, "\", it must start with ", scheme);

	const string rest = url.substr(scheme.length());
	const std::size_t at = rest.rfind('@');
	if(at == string::npos)throw ConfigException("Invalid URL \"", url, "\", the cloud name is missing");

	const string credentials = rest.substr(0, at);
	string cloud = rest.substr(at + 1);

	const std::size_t query = cloud.find_first_of("?/");
	if(query != string::npos)cloud = cloud.substr(0, query);

	const std::size_t colon = credentials.find(':');
	if(colon == string::npos || cloud.empty())throw ConfigException("Invalid URL \"", url, "\"");

	options.setOptionValue("api-key", credentials.substr(0, colon).c_str());
	options.setOptionValue("api-secret", credentials.substr(colon + 1).c_str());
	options.setOptionValue("cloud-name", cloud.c_str());
}

void Configuration::applyEnvironment(Options &options)
{
	const char *url = getenv("CLOUDINARY_URL");
	if(url && *url)applyUrl(url, options);
}

string Configuration::uploadUrl(const string &resourceType) const
{
	if(cloudName.empty())throw ConfigException("cloud-name is not configured");

	return utils::concat(uploadPrefix, "/v1_1/", cloudName, "/", resourceType.empty() ? "auto" : resourceType, "/upload");
}

Deadline Configuration::sessionDeadline() const
{
	if(!hasTimeout)return Deadline::none();
	return Deadline::after(timeout);
}
