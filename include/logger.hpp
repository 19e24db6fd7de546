/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <iostream>
#include <mutex>

#include <utils.hpp>

namespace au
{

	/**
	  * This macro should be the main function for logging.
	  * it calls doLog with the correct filename and line number
	 **/
	#define LOG(level, ...) au::doLog(__FILE__, __LINE__, level, __VA_ARGS__)

	/**
	  * This enum defines the different log levels
	 **/
	enum class LogLevel : int
	{
		debug = 1,
		info = 2,
		warn = 3,
		error = 4,
		none = 5
	}; // end enum class LogLevel

	/**
	  * Gets the current log level
	 **/
	inline LogLevel& logLevel()
	{
		static LogLevel level = LogLevel::info;
		return level;
	}

	/**
	  * Sets the current log level. This should be done
	  * before any upload is started
	 **/
	inline void setLogLevel(LogLevel level)
	{
		logLevel() = level;
	}

	/**
	  * Gets the string representation of the given loglevel
	 **/
	inline const char* logLevelString(LogLevel level)
	{
		switch(level)
		{
			case LogLevel::debug: return "DEBUG";
			case LogLevel::info: return "INFO";
			case LogLevel::warn: return "WARN";
			case LogLevel::error: return "ERROR";
			case LogLevel::none: return "NONE";
		}

		return "";
	}

	/**
	  * Serializes log lines of concurrent upload sessions
	 **/
	inline std::mutex& logMutex()
	{
		static std::mutex mutex;
		return mutex;
	}

	/**
	  * This variadic function does the actual logging to std::cerr
	 **/
	template <class ...T>
	inline void doLog(const char *file, int line, LogLevel level, const T& ...t)
	{
		if(level < logLevel())return;

		const std::string message = utils::concat(t...);

		std::lock_guard<std::mutex> lock(logMutex());
		std::cerr<<utils::filenameOf(file)<<"("<<line<<") "<<logLevelString(level)<<": "<<message<<std::endl;
	}

} //end namespace au

#endif //LOGGER_HPP
