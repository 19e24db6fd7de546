/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <cmath>

#include <colorweight.hpp>
#include <jsonutils.hpp>
#include <malformedpairexception.hpp>

using std::string;

using namespace au;

ColorWeight::ColorWeight(const Json::Value &v) :
	color(),
	weight()
{
	if(v.type() != Json::arrayValue)
		throw MalformedPairException("Color weight is not an array");

	if(v.size() != 2)
		throw MalformedPairException("Color weight array has ", v.size(), " elements instead of 2");

	const Json::Value &label = v[0u];
	const Json::Value &number = v[1u];

	if(label.type() != Json::stringValue)
		throw MalformedPairException("First element of a color weight is not a string");

	if(!isJsonNumber(number))
		throw MalformedPairException("Second element of color weight \"", label.asString(), "\" is not a number");

	color = label.asString();
	weight = number.asDouble();
}

Json::Value ColorWeight::toJson() const
{
	Json::Value v(Json::arrayValue);
	v.append(color);

	//Integers up to 2^53 are exact in a double
	if(std::floor(weight) == weight && std::fabs(weight) < 9007199254740992.0)
		v.append(Json::Value((Json::Int64)weight));
	else
		v.append(weight);

	return v;
}

ColorWeights au::decodeColorWeights(const Json::Value &v, const string &name)
{
	ColorWeights colors;
	if(v.isNull())return colors;

	if(v.type() != Json::arrayValue)
		throw MalformedResponseException("Json value \"", name, "\" is not an array");

	for(Json::Value::ArrayIndex i = 0; i < v.size(); ++i)
	{
		try {
			colors.emplace_back(v[i]);
		} catch(const MalformedPairException &e) {
			throw MalformedPairException("Invalid entry ", i, " of \"", name, "\": ", e.what());
		}
	}

	return colors;
}

PredominantColors au::decodePredominantColors(const Json::Value &v, const string &name)
{
	PredominantColors predominant;
	if(v.isNull())return predominant;

	if(v.type() != Json::objectValue)
		throw MalformedResponseException("Json value \"", name, "\" is not an object");

	for(const string &provider : v.getMemberNames())
		predominant[provider] = decodeColorWeights(v[provider], name + "." + provider);

	return predominant;
}

Json::Value au::toJson(const ColorWeights &colors)
{
	Json::Value v(Json::arrayValue);
	for(const ColorWeight &cw : colors)
		v.append(cw.toJson());
	return v;
}

Json::Value au::toJson(const PredominantColors &predominant)
{
	Json::Value v(Json::objectValue);
	for(const auto &provider : predominant)
		v[provider.first] = toJson(provider.second);
	return v;
}

std::ostream& au::operator<< (std::ostream &out, const ColorWeight &cw)
{
	out<<writeJson(cw.toJson());
	return out;
}
