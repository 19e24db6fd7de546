/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef SIGNER_HPP
#define SIGNER_HPP

#include <map>
#include <string>

namespace au
{

/**
  * Form parameters of a request, sorted by name
 **/
typedef std::map<std::string, std::string> Params;

/**
  * A Signer creates the authentication fields of a request.
  * It is called once per request with all upload parameters
  * and must be usable from several threads at the same time
 **/
class Signer
{

public:
	virtual ~Signer() {}

	/**
	  * Returns the fields which are added to the request,
	  * usually signature, timestamp and api_key
	 **/
	virtual Params sign(const Params &params) const = 0;

}; //end class Signer

/**
  * The default Signer. The signature is the hex encoded SHA-1 of
  * all signed parameters ("name=value" joined by "&", sorted by
  * name) followed by the api secret
 **/
class ApiSecretSigner : public Signer
{

public:
	ApiSecretSigner(const std::string &apiKey, const std::string &apiSecret);

	virtual Params sign(const Params &params) const;

	/**
	  * Returns the string which is hashed for the given
	  * parameters, without the api secret
	 **/
	static std::string stringToSign(const Params &params);

	/**
	  * Returns the hex encoded SHA-1 of the given string
	 **/
	static std::string sha1Hex(const std::string &str);

private:
	std::string apiKey;
	std::string apiSecret;

}; //end class ApiSecretSigner

} //end namespace au

#endif //SIGNER_HPP
