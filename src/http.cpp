/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <http.hpp>
#include <utils.hpp>

using std::string;

using namespace au;

using utils::ci_string;

/**
  * Splits a header line "Name: value" into its name and value
 **/
static bool splitHeader(const string &header, ci_string &name, string &value)
{
	const std::size_t colon = header.find(':');
	if(colon == string::npos)return false;

	const string n = utils::trim(header.substr(0, colon));
	name = ci_string(n.c_str());
	value = utils::trim(header.substr(colon + 1));
	return true;
}

bool HttpRequest::hasHeader(const ci_string &name) const
{
	for(const string &header : headers)
	{
		ci_string n;
		string v;
		if(splitHeader(header, n, v) && n == name)return true;
	}

	return false;
}

string HttpRequest::getHeader(const ci_string &name) const
{
	for(const string &header : headers)
	{
		ci_string n;
		string v;
		if(splitHeader(header, n, v) && n == name)return v;
	}

	return "";
}

const FormField* HttpRequest::getField(const string &name) const
{
	for(const FormField &field : fields)
	{
		if(field.name == name)return &field;
	}

	return nullptr;
}
