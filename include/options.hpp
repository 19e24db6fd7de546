/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef OPTIONS_HPP
#define OPTIONS_HPP

#include <string>
#include <vector>

#include <option.hpp>

namespace au
{

/**
  * The class Options manages a given set of individual options
  * au::Option.
 **/
class Options
{

public:

	/**
	  * Default constructor
	 **/
	Options() :
		options()
	{}

	/**
	  * Constructs an object using a given predefined set of options
	  * @param v_options The predefined set of options
	 **/
	Options(const std::vector<Option> &v_options);

	/**
	  * Adds the given option. An existing option with
	  * the same name is replaced
	  * @param option The option to be managed
	 **/
	void addOption(const Option &option);

	/**
	  * Checks whether the option exists
	  * @param name The name of the option to check
	  * @returns true if it exists
	 **/
	bool optionExists(const utils::ci_string &name) const;

	/**
	  * Gets the option with the given name. Throws a ConfigException
	  * if the option does not exist.
	  * @param name The name of the option to get
	  * @returns The option that matches the given name
	 **/
	Option& getOption(const utils::ci_string &name);

	/**
	  * Gets the option with the given name. Throws a ConfigException
	  * if the option does not exist.
	  * @param name The name of the option to get
	  * @returns The option that matches the given name
	 **/
	const Option& getOption(const utils::ci_string &name) const;

	/**
	  * Returns the current string value of the option with the given name
	 **/
	std::string getStringOptionValue(const utils::ci_string &name) const
	{
		return getOption(name).getStringValue().c_str();
	}

	/**
	  * Returns the current bool value of the option with the given name
	 **/
	bool getOptionBoolValue(const utils::ci_string &name) const
	{
		return getOption(name).getBoolValue();
	}

	/**
	  * Returns the current numeric value of the option with the given name
	 **/
	unsigned long long getOptionUnsignedValue(const utils::ci_string &name) const
	{
		return getOption(name).getUnsignedValue();
	}

	/**
	  * Sets the value of the option with the given name
	  * @param name The name of the option
	  * @param value The value to set
	 **/
	void setOptionValue(const utils::ci_string &name, const utils::ci_string &value)
	{
		getOption(name).setValue(value);
	}

	/**
	  * Gets all options
	 **/
	const std::vector<Option>& getAllOptions() const
	{
		return options;
	}

private:

	/**
	  * The internal vector where all options are stored
	 **/
	std::vector<Option> options;

}; //end class Options

} //end namespace au

#endif //OPTIONS_HPP
