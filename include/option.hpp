/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef OPTION_HPP
#define OPTION_HPP

#include <string>
#include <vector>

#include <ci_string.hpp>
#include <utils.hpp>

namespace au
{

/**
  * An option is one named setting of the client such as the
  * chunk size. An option needs to have a name and a description.
  * It can also have a default value and a set of predefined values.
 **/
class Option
{

public:

	/**
	  * Constructs an option using a name, a description, a default
	  * value and an optional vector of predefined values.
	 **/
	Option(const utils::ci_string &name, const std::string &description, const utils::ci_string &defaultValue="", const std::vector<utils::ci_string> &values=std::vector<utils::ci_string>());

	/**
	  * Gets the name of the option
	 **/
	const utils::ci_string& getName() const
	{
		return name;
	}

	/**
	  * Gets the description of the option
	 **/
	const std::string& getDescription() const
	{
		return description;
	}

	/**
	  * Sets the current option value using any data type
	 **/
	template <class T>
	void setValue(const T &t)
	{
		setValue(utils::ci_string(utils::concat(t).c_str()));
	}

	/**
	  * Sets the current option value. Throws a ConfigException
	  * if the option has predefined values and the value is
	  * not one of them
	 **/
	void setValue(const utils::ci_string &value);

	/**
	  * Gets the value of the option in the form of a string
	 **/
	const utils::ci_string& getStringValue() const
	{
		return value;
	}

	/**
	  * Returns whether the option has predefined values set
	 **/
	bool hasPredefinedValues() const
	{
		return !values.empty();
	}

	/**
	  * Returns the predefined values
	 **/
	const std::vector<utils::ci_string>& getPredefinedValues() const
	{
		return values;
	}

	/**
	  * Returns the value of the option as an unsigned number.
	  * Throws a ConfigException if it isn't a number
	 **/
	unsigned long long getUnsignedValue() const;

	/**
	  * Returns the value of the option as bool. "yes", "true"
	  * and numbers other than 0 are true
	 **/
	bool getBoolValue() const;

private:

	/**
	  * The name of the option
	 **/
	utils::ci_string name;

	/**
	  * The description of the option
	 **/
	std::string description;

	/**
	  * Predefined values
	 **/
	std::vector<utils::ci_string> values;

	/**
	  * The current value of the option
	 **/
	utils::ci_string value;

}; //end class Option

} //end namespace au

#endif //OPTION_HPP
