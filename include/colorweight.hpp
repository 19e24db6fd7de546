/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef COLORWEIGHT_HPP
#define COLORWEIGHT_HPP

#include <json/json.h>
#include <map>
#include <ostream>
#include <string>
#include <vector>

namespace au
{

/**
  * A color (a hex code such as "#E4E4A8" or a color name such as
  * "brown") together with its share of the image in percent.
  * On the wire it is a two element array [color, weight]
 **/
struct ColorWeight
{

	/**
	  * Default constructor
	 **/
	ColorWeight() :
		color(),
		weight()
	{}

	/**
	  * Constructs a ColorWeight using the given values
	 **/
	ColorWeight(const std::string &str_color, double d_weight) :
		color(str_color),
		weight(d_weight)
	{}

	/**
	  * Decodes a ColorWeight from its json form. Throws a
	  * MalformedPairException if it isn't an array of
	  * exactly one string followed by one number
	 **/
	explicit ColorWeight(const Json::Value &v);

	/**
	  * Encodes the ColorWeight as a two element json array.
	  * Whole weights are stored as integers so that 71 is
	  * written as 71 and not as 71.0
	 **/
	Json::Value toJson() const;

	bool operator== (const ColorWeight &other) const
	{
		return color == other.color && weight == other.weight;
	}

	bool operator!= (const ColorWeight &other) const
	{
		return !(*this == other);
	}

	/**
	  * The color label
	 **/
	std::string color;

	/**
	  * The share of the color
	 **/
	double weight;

}; //end struct ColorWeight

/**
  * A flat list of colors as returned in "colors"
 **/
typedef std::vector<ColorWeight> ColorWeights;

/**
  * The predominant colors per analysis provider
  * (e.g. "cloudinary", "google")
 **/
typedef std::map<std::string, ColorWeights> PredominantColors;

/**
  * Decodes an array of ColorWeights
 **/
ColorWeights decodeColorWeights(const Json::Value &v, const std::string &name);

/**
  * Decodes an object which maps a provider to an array of ColorWeights
 **/
PredominantColors decodePredominantColors(const Json::Value &v, const std::string &name);

Json::Value toJson(const ColorWeights &colors);

Json::Value toJson(const PredominantColors &predominant);

/**
  * Writes the ColorWeight in its compact json form
 **/
std::ostream& operator<< (std::ostream &out, const ColorWeight &cw);

} //end namespace au

#endif //COLORWEIGHT_HPP
