/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <ctime>
#include <openssl/sha.h>
#include <vector>

#include <configexception.hpp>
#include <signer.hpp>
#include <uploadexception.hpp>
#include <utils.hpp>

using std::string;
using std::vector;

using namespace au;

/**
  * Parameters which are never part of the signature
 **/
static bool isUnsigned(const string &name)
{
	return name == "file" || name == "api_key" || name == "resource_type" || name == "cloud_name";
}

ApiSecretSigner::ApiSecretSigner(const string &str_apiKey, const string &str_apiSecret) :
	apiKey(str_apiKey),
	apiSecret(str_apiSecret)
{}

string ApiSecretSigner::stringToSign(const Params &params)
{
	vector<string> parts;
	for(const auto &param : params)
	{
		if(isUnsigned(param.first) || param.second.empty())continue;
		parts.push_back(param.first + "=" + param.second);
	}

	return utils::join(parts, "&");
}

string ApiSecretSigner::sha1Hex(const string &str)
{
	unsigned char digest[SHA_DIGEST_LENGTH];
	SHA_CTX sha1;

	if(SHA1_Init(&sha1) != 1 ||
		SHA1_Update(&sha1, str.c_str(), str.length()) != 1 ||
		SHA1_Final(digest, &sha1) != 1)
		throw UploadException("Unable to compute SHA-1");

	return utils::toHex(digest, sizeof(digest));
}

Params ApiSecretSigner::sign(const Params &params) const
{
	if(apiKey.empty() || apiSecret.empty())
		throw ConfigException("api_key and api_secret must be configured to sign requests");

	Params toSign(params);
	if(toSign["timestamp"].empty())toSign["timestamp"] = utils::concat((long long)time(nullptr));

	Params auth;
	auth["timestamp"] = toSign["timestamp"];
	auth["signature"] = sha1Hex(stringToSign(toSign) + apiSecret);
	auth["api_key"] = apiKey;
	return auth;
}
