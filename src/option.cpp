/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <cerrno>
#include <cstdlib>

#include <configexception.hpp>
#include <option.hpp>

using std::string;
using std::vector;

using namespace au;

using utils::ci_string;

Option::Option(const ci_string &str_name, const string &str_description, const ci_string &str_defaultValue, const vector<ci_string> &v_values) :
	name(str_name),
	description(str_description),
	values(v_values),
	value(str_defaultValue)
{
	if(value.empty() && !values.empty())value = values[0];
}

unsigned long long Option::getUnsignedValue() const
{
	if(value.empty() || value[0] == '-')throw ConfigException("Invalid number \"", value, "\" for option ", name);

	char *end;
	errno = 0;
	const unsigned long long v = strtoull(value.c_str(), &end, 10);
	if(errno != 0 || end != value.c_str() + value.length())
		throw ConfigException("Invalid number \"", value, "\" for option ", name);

	return v;
}

bool Option::getBoolValue() const
{
	if(value == "yes")return true;
	if(value == "no")return false;
	if(value == "true")return true;
	if(value == "false")return false;

	try {
		return (getUnsignedValue() != 0);
	} catch(const ConfigException &e) {
		throw ConfigException("Invalid bool \"", value, "\" for option ", name);
	}
}

void Option::setValue(const ci_string &str_value)
{
	if(hasPredefinedValues())
	{
		bool valueFound = false;
		for(const ci_string &v : values)
		{
			if(v == str_value)
			{
				valueFound = true;
				break;
			}
		}

		if(!valueFound)
			throw ConfigException("Invalid value \"", str_value ,"\" for option ", name);
	}
	value = str_value;
}
