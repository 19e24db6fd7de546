/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CI_STRING_HPP
#define CI_STRING_HPP

#include <cctype>
#include <ostream>
#include <string>

namespace au
{

	namespace utils
	{

		/**
		  * The char traits struct which is used to build
		  * case insensitive strings. HTTP header names and
		  * option names are compared using these traits.
		 **/
		struct ci_char_traits : public std::char_traits<char>
		{

			static bool eq(char c1, char c2)
			{
				return toupper((unsigned char)c1) == toupper((unsigned char)c2);
			}

			static bool ne(char c1, char c2)
			{
				return toupper((unsigned char)c1) != toupper((unsigned char)c2);
			}

			static bool lt(char c1, char c2)
			{
				return toupper((unsigned char)c1) < toupper((unsigned char)c2);
			}

			/**
			  * Compares two given strings.
			  * @return 0 when they are equal, -1 when the first string is
			  * lesser, 1 when the second string is lesser
			 **/
			static int compare(const char* s1, const char* s2, size_t n)
			{
				while(n-- != 0)
				{
					if(lt(*s1, *s2))return -1;
					if(lt(*s2, *s1))return 1;
					++s1; ++s2;
				}
				return 0;
			}

			/**
			  * Finds the given character in the given string.
			  * Returns nullptr if it is not contained
			 **/
			static const char* find(const char* s, size_t n, char a)
			{
				for(; n > 0; --n, ++s)
				{
					if(eq(*s, a))return s;
				}
				return nullptr;
			}
		};

		/**
		  * A case insensitive string
		 **/
		typedef std::basic_string<char, ci_char_traits> ci_string;

		/**
		  * Writes a ci_string to an std::ostream
		 **/
		inline std::ostream& operator<<(std::ostream &out, const ci_string &str)
		{
			out<<str.c_str();
			return out;
		}

	} //end namespace utils

} //end namespace au

#endif //CI_STRING_HPP
