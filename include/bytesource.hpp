/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef BYTESOURCE_HPP
#define BYTESOURCE_HPP

#include <fstream>
#include <istream>
#include <string>

namespace au
{

/**
  * A ByteSource is the data of an asset which is uploaded.
  * Its length must be known before the first request is
  * sent, the chunks are then read in ascending order.
 **/
class ByteSource
{

public:

	/**
	  * The value which is returned by length() if the
	  * length of the source can't be determined
	 **/
	static const long long unknownLength = -1;

	virtual ~ByteSource() {}

	/**
	  * Returns the total length of the source in bytes
	  * or unknownLength
	 **/
	virtual long long length() = 0;

	/**
	  * Reads length bytes starting at offset. Throws an
	  * UploadException if the data can't be read completely
	 **/
	virtual std::string readRange(unsigned long long offset, unsigned long long length) = 0;

	/**
	  * The filename which is sent to the service
	 **/
	virtual std::string filename() const
	{
		return "file";
	}

}; //end class ByteSource

/**
  * A ByteSource for data which is already in memory
 **/
class MemoryByteSource : public ByteSource
{

public:
	MemoryByteSource(const std::string &str_data, const std::string &str_filename="file") :
		data(str_data),
		name(str_filename)
	{}

	virtual long long length()
	{
		return (long long)data.length();
	}

	virtual std::string readRange(unsigned long long offset, unsigned long long length);

	virtual std::string filename() const
	{
		return name;
	}

private:
	std::string data;
	std::string name;

}; //end class MemoryByteSource

/**
  * A ByteSource which reads from an std::istream. The length
  * is only known if the stream is seekable, pipes and sockets
  * are rejected by the uploader.
 **/
class StreamByteSource : public ByteSource
{

public:
	StreamByteSource(std::istream &is_in, const std::string &str_filename="file") :
		in(is_in),
		name(str_filename)
	{}

	virtual long long length();

	virtual std::string readRange(unsigned long long offset, unsigned long long length);

	virtual std::string filename() const
	{
		return name;
	}

private:
	std::istream &in;
	std::string name;

}; //end class StreamByteSource

/**
  * A ByteSource which reads a local file. The filename
  * which is sent to the service is taken from the path
 **/
class FileByteSource : public ByteSource
{

public:

	/**
	  * Opens the given file. Throws an UploadException if
	  * it can't be opened
	 **/
	FileByteSource(const std::string &path);

	virtual long long length()
	{
		return stream.length();
	}

	virtual std::string readRange(unsigned long long offset, unsigned long long length)
	{
		return stream.readRange(offset, length);
	}

	virtual std::string filename() const
	{
		return stream.filename();
	}

private:
	std::ifstream file;
	StreamByteSource stream;

}; //end class FileByteSource

} //end namespace au

#endif //BYTESOURCE_HPP
