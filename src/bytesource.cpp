/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <bytesource.hpp>
#include <uploadexception.hpp>
#include <utils.hpp>

using std::string;

using namespace au;

const long long ByteSource::unknownLength;

string MemoryByteSource::readRange(unsigned long long offset, unsigned long long length)
{
	if(offset > data.length() || length > data.length() - offset)
		throw UploadException("Range ", offset, "-", offset+length, " is outside of the data (", data.length(), " bytes)");

	return data.substr((std::size_t)offset, (std::size_t)length);
}

long long StreamByteSource::length()
{
	if(!in)return unknownLength;

	const std::istream::pos_type current = in.tellg();
	if(current == std::istream::pos_type(-1))return unknownLength;

	in.seekg(0, std::ios_base::end);
	const std::istream::pos_type end = in.tellg();
	in.seekg(current);

	if(end == std::istream::pos_type(-1) || !in)
	{
		in.clear();
		return unknownLength;
	}

	return (long long)end;
}

string StreamByteSource::readRange(unsigned long long offset, unsigned long long length)
{
	string buffer((std::size_t)length, '\0');
	if(length == 0)return buffer;

	in.clear();
	in.seekg((std::streamoff)offset);
	in.read(&buffer[0], (std::streamsize)length);

	if((unsigned long long)in.gcount() != length)
		throw UploadException("Unable to read ", length, " bytes at offset ", offset, " from ", name, " (got ", in.gcount(), ")");

	return buffer;
}

FileByteSource::FileByteSource(const string &path) :
	file(path.c_str(), std::ios_base::in | std::ios_base::binary),
	stream(file, utils::filenameOf(path))
{
	if(!file)throw UploadException("Unable to open file ", path);
}
