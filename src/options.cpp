/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <algorithm>

#include <configexception.hpp>
#include <options.hpp>

using std::find_if;
using std::vector;

using namespace au;

using utils::ci_string;

/**
  * Returns the position of the option with the given
  * name or options.end() if it isn't managed
 **/
template <class It>
static It findOption(It begin, It end, const ci_string &name)
{
	return find_if(begin, end, [&name](const Option &option) {
		return option.getName() == name;
	});
}

Options::Options(const vector<Option> &v_options) :
	options()
{
	for(const Option &o : v_options)
		addOption(o);
}

void Options::addOption(const Option &option)
{
	auto found = findOption(options.begin(), options.end(), option.getName());
	if(found != options.end())*found = option;
	else options.push_back(option);
}

bool Options::optionExists(const ci_string &name) const
{
	return findOption(options.cbegin(), options.cend(), name) != options.cend();
}

Option& Options::getOption(const ci_string &name)
{
	auto found = findOption(options.begin(), options.end(), name);
	if(found == options.end())throw ConfigException("Unknown option \"", name, "\"");
	return *found;
}

const Option& Options::getOption(const ci_string &name) const
{
	auto found = findOption(options.cbegin(), options.cend(), name);
	if(found == options.cend())throw ConfigException("Unknown option \"", name, "\"");
	return *found;
}
