/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <cstdio>
#include <cstdlib>
#include <memory>
#include <sstream>

#include <jsonutils.hpp>

using std::string;
using std::unique_ptr;

using namespace au;

/**
  * Returns the minimum number of significant digits
  * which are needed to restore the exact double
 **/
static unsigned int requiredPrecision(double d)
{
	char buffer[64];
	for(unsigned int precision = 1; precision < 17; ++precision)
	{
		snprintf(buffer, sizeof(buffer), "%.*g", (int)precision, d);
		if(strtod(buffer, nullptr) == d)return precision;
	}
	return 17;
}

/**
  * Writes a single json value. Every decimal number gets
  * its own shortest precision, so a very precise number
  * doesn't change how the others are written
 **/
static void writeValue(std::ostream &out, const Json::Value &v, bool pretty, const string &indentation)
{
	const string inner = pretty ? indentation + "\t" : indentation;
	const char *newline = pretty ? "\n" : "";
	const char *colon = pretty ? " : " : ":";

	switch(v.type())
	{
	case Json::nullValue:
		out<<"null";
		break;
	case Json::intValue:
		out<<Json::valueToString(v.asLargestInt());
		break;
	case Json::uintValue:
		out<<Json::valueToString(v.asLargestUInt());
		break;
	case Json::realValue:
		out<<Json::valueToString(v.asDouble(), requiredPrecision(v.asDouble()));
		break;
	case Json::stringValue:
		out<<Json::valueToQuotedString(v.asCString());
		break;
	case Json::booleanValue:
		out<<Json::valueToString(v.asBool());
		break;
	case Json::arrayValue:
		if(v.empty())
		{
			out<<"[]";
			break;
		}
		out<<'['<<newline;
		for(Json::ArrayIndex i = 0; i < v.size(); ++i)
		{
			if(i > 0)out<<','<<newline;
			out<<(pretty ? inner : "");
			writeValue(out, v[i], pretty, inner);
		}
		out<<newline<<(pretty ? indentation : "")<<']';
		break;
	case Json::objectValue:
		if(v.empty())
		{
			out<<"{}";
			break;
		}
		out<<'{'<<newline;
		bool first = true;
		for(const string &name : v.getMemberNames())
		{
			if(!first)out<<','<<newline;
			first = false;
			out<<(pretty ? inner : "")<<Json::valueToQuotedString(name.c_str())<<colon;
			writeValue(out, v[name], pretty, inner);
		}
		out<<newline<<(pretty ? indentation : "")<<'}';
		break;
	}
}

void au::parseJson(const string &str, Json::Value &root)
{
	Json::CharReaderBuilder builder;
	unique_ptr<Json::CharReader> reader(builder.newCharReader());

	string errors;
	if(!reader->parse(str.c_str(), str.c_str() + str.length(), &root, &errors))
		throw MalformedResponseException("Invalid json: ", errors);
}

string au::writeJson(const Json::Value &root, bool pretty)
{
	std::ostringstream ss;
	writeValue(ss, root, pretty, "");
	return ss.str();
}
