/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace au
{

	namespace utils
	{

		/**
		  * Helper function to concat variables
		 **/
		template <class S>
		inline void concat(std::stringstream &ss, const S &s)
		{
			ss<<s;
		}

		/**
		  * Helper function to concat variables
		 **/
		template <class T>
		inline void concat(std::stringstream &ss, const std::vector<T> &v)
		{
			for(const T &t : v)
				concat(ss, t);
		}

		/**
		  * Helper function to concat variables
		 **/
		template <class S, class ...T>
		inline void concat(std::stringstream &ss, const S &s, const T& ...t)
		{
			concat(ss, s);
			concat(ss, t...);
		}

		/**
		  * Cancats any kind of data into a single string
		 **/
		template <class ...T>
		inline std::string concat(const T& ...t)
		{
			std::stringstream ss;
			concat(ss, t...);
			return ss.str();
		}

		/**
		  * Joins the given strings using the given separator
		 **/
		inline std::string join(const std::vector<std::string> &v, const std::string &separator)
		{
			std::string result;
			for(std::size_t i = 0; i < v.size(); ++i)
			{
				if(i != 0)result += separator;
				result += v[i];
			}
			return result;
		}

		/**
		  * Returns the filename of the given path
		 **/
		inline std::string filenameOf(const std::string& fname)
		{
			std::size_t pos = fname.find_last_of("\\/");
			return (std::string::npos == pos) ? fname : fname.substr(pos+1);
		}

		/**
		  * Checks whether the given file exists
		 **/
		inline bool fileExists(const std::string& name)
		{
			std::ifstream f(name.c_str());
			return f.good();
		}

		/**
		  * Returns true if str starts with the given prefix
		 **/
		inline bool startsWith(const std::string &str, const std::string &prefix)
		{
			return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
		}

		/**
		  * Removes leading and trailing whitespaces
		 **/
		inline std::string trim(const std::string &str)
		{
			std::size_t first = 0;
			std::size_t last = str.length();
			while(first < last && isspace((unsigned char)str[first]))first++;
			while(last > first && isspace((unsigned char)str[last-1]))last--;
			return str.substr(first, last-first);
		}

		/**
		  * Replaces all occurrences of search with replace in str
		 **/
		inline std::string replaceAll(const std::string &str, const std::string &search, const std::string &replace)
		{
			std::string result;
			std::size_t last = 0;
			std::size_t pos = 0;

			while((pos=str.find(search, pos)) != std::string::npos)
			{
				result += str.substr(last, pos-last);
				result += replace;
				pos += search.length();
				last = pos;
			}
			result += str.substr(last);

			return result;
		}

		/**
		  * Splits the string using the given delimiter
		  * and stores the result in out
		 **/
		template <class Container>
		void split(const std::string &toSplit, char delimiter, Container &out, bool useEmpty=true)
		{
			std::stringstream ss(toSplit);
			std::string item;

			while(std::getline(ss, item, delimiter))
				if(useEmpty || !item.empty())out.push_back(item);
		}

		/**
		  * Converts the given bytes into a lowercase hex string
		 **/
		inline std::string toHex(const unsigned char *data, std::size_t length)
		{
			static const char digits[] = "0123456789abcdef";

			std::string result;
			result.reserve(length * 2);
			for(std::size_t i = 0; i < length; ++i)
			{
				result += digits[data[i] >> 4];
				result += digits[data[i] & 0x0F];
			}
			return result;
		}

	} //end namespace utils

} //end namespace au

#endif //UTILS_HPP
