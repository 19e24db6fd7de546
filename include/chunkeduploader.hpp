/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CHUNKEDUPLOADER_HPP
#define CHUNKEDUPLOADER_HPP

#include <string>

#include <bytesource.hpp>
#include <cancellationtoken.hpp>
#include <configuration.hpp>
#include <deadline.hpp>
#include <signer.hpp>
#include <transport.hpp>
#include <uploadparams.hpp>
#include <uploadresult.hpp>

namespace au
{

/**
  * The ChunkedUploader sends assets to the upload service.
  * Sources which are larger than the configured chunk size
  * are split into several sequential requests which are tied
  * together by the continuation id the service assigns.
  *
  * The uploader itself holds no per upload state, so several
  * uploads can run concurrently on one instance as long as
  * the Transport and the Signer allow this.
 **/
class ChunkedUploader
{

public:

	/**
	  * Creates an uploader. The configuration is copied,
	  * the transport and the signer must outlive the uploader
	 **/
	ChunkedUploader(Configuration c_config, Transport &t_transport, const Signer &s_signer);

	/**
	  * Uploads the given source. Either the decoded result of the
	  * service is returned or exactly one exception is thrown:
	  *  - UnknownLengthException if the length of the source is unknown
	  *  - DeadlineExceededException if the deadline expires
	  *  - CancelledException if the upload is cancelled
	  *  - TransportException on network or HTTP errors
	  *  - MalformedResponseException if a response can't be decoded
	  * Nothing is sent if the deadline is already expired or the
	  * cancellation token is already raised. Chunks which were sent
	  * before a failure stay on the service.
	 **/
	UploadResult upload(ByteSource &source, const UploadParams &params, const Deadline &deadline, const CancellationToken &cancellation=CancellationToken());

	/**
	  * Uploads the given source using the configured timeout
	 **/
	UploadResult upload(ByteSource &source, const UploadParams &params)
	{
		return upload(source, params, config.sessionDeadline());
	}

	/**
	  * Lets the service fetch the asset from the given remote
	  * URL or data URI. This is always a single request
	 **/
	UploadResult uploadRemote(const std::string &file, const UploadParams &params, const Deadline &deadline, const CancellationToken &cancellation=CancellationToken());

	/**
	  * Returns true if file is a URL the service can fetch
	  * itself or a base64 data URI
	 **/
	static bool isRemote(const std::string &file);

	/**
	  * Throws a TransportException if code is not a successful
	  * HTTP status. The error message of the service is taken
	  * from the response if it contains one
	 **/
	static void handleError(long code, const std::string &response);

	const Configuration& getConfiguration() const
	{
		return config;
	}

private:

	/**
	  * Returns the upload parameters together with the signature fields
	 **/
	Params signedFields(const UploadParams &params) const;

	/**
	  * Creates a request which contains the given fields
	 **/
	HttpRequest createRequest(const std::string &url, const Params &fields) const;

	/**
	  * Sends the request and checks the HTTP status
	 **/
	HttpResponse send(const HttpRequest &request, const Deadline &deadline, const CancellationToken &cancellation);

	/**
	  * Decodes the response of the last request of an upload
	 **/
	static UploadResult decodeResult(const HttpResponse &response);

private:

	const Configuration config;

	Transport &transport;

	const Signer &signer;

}; //end class ChunkedUploader

} //end namespace au

#endif //CHUNKEDUPLOADER_HPP
