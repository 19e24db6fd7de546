/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <json/json.h>

#include <cancelledexception.hpp>
#include <chunkacknowledgement.hpp>
#include <chunkeduploader.hpp>
#include <chunkplanner.hpp>
#include <deadlineexceededexception.hpp>
#include <jsonutils.hpp>
#include <logger.hpp>
#include <transportexception.hpp>
#include <unknownlengthexception.hpp>
#include <uploadsession.hpp>

using std::string;

using namespace au;

/**
  * Throws if the upload must not go on
 **/
static void checkAlive(const Deadline &deadline, const CancellationToken &cancellation)
{
	if(cancellation.isCancelled())throw CancelledException("Upload was cancelled");
	if(deadline.expired())throw DeadlineExceededException("Deadline exceeded");
}

/**
  * Returns the message of a response of the form
  * {"error":{"message":"..."}} or an empty string
 **/
static string serviceErrorMessage(const string &response)
{
	Json::Value root;
	string message;

	try {
		parseJson(response, root);
		extractJsonOptional(message, root, "error", "message");
	} catch(const MalformedResponseException &e) {
		LOG(LogLevel::debug, "Error response is not a service error: ", e.what());
		return string();
	}

	return message;
}

/**
  * Throws a TransportException if a successful response
  * still carries a service error
 **/
static void checkServiceError(const HttpResponse &response)
{
	if(response.body.empty())return;

	const string message = serviceErrorMessage(response.body);
	if(!message.empty())throw TransportException(response.code, "Upload failed: ", message);
}

ChunkedUploader::ChunkedUploader(Configuration c_config, Transport &t_transport, const Signer &s_signer) :
	config(std::move(c_config)),
	transport(t_transport),
	signer(s_signer)
{}

UploadResult ChunkedUploader::upload(ByteSource &source, const UploadParams &params, const Deadline &deadline, const CancellationToken &cancellation)
{
	const long long length = source.length();
	if(length < 0)throw UnknownLengthException("Unable to determine the length of ", source.filename());

	checkAlive(deadline, cancellation);

	const ChunkPlanner planner(length, config.chunkSize);
	const string url = config.uploadUrl(params.resourceType);
	const Params fields = signedFields(params);

	UploadSession session(length, config.chunkSize);
	session.start();

	LOG(LogLevel::info, "Uploading ", source.filename(), " (", length, " bytes) in ", planner.count(), " request(s) to ", url);

	try {
		HttpResponse response;

		for(const ChunkRange &range : planner)
		{
			checkAlive(deadline, cancellation);

			HttpRequest request = createRequest(url, fields);
			request.fields.push_back(FormField("file", source.readRange(range.offset, range.length), source.filename()));

			if(!planner.isSingleRange())
			{
				request.addHeader("Content-Range", range.contentRange(length));
				if(!session.getContinuationId().empty())
					request.addHeader("X-Unique-Upload-Id", session.getContinuationId());
			}

			LOG(LogLevel::debug, "Sending chunk ", range, " of ", source.filename());
			response = send(request, deadline, cancellation);

			if(range.end() < (unsigned long long)length)
			{
				checkServiceError(response);
				const ChunkAcknowledgement ack(response);

				if(session.getContinuationId().empty() && !ack.upload_id.empty())
					LOG(LogLevel::debug, "Continuing upload of ", source.filename(), " as ", ack.upload_id);

				if(ack.hasBytes && ack.bytes != range.end())
					LOG(LogLevel::warn, "Service acknowledged ", ack.bytes, " bytes but ", range.end(), " were sent");

				session.acknowledge(range, ack.upload_id);
			}
			else
			{
				session.acknowledge(range, string());
			}
		}

		UploadResult result = decodeResult(response);
		session.complete();

		LOG(LogLevel::info, "Uploaded ", source.filename(), " as ", result.publicId);
		return result;
	} catch(const UploadException &e) {
		session.abort(e.what());
		LOG(LogLevel::warn, "Aborted upload of ", source.filename(), " after ", session.getBytesSent(), " of ", length, " bytes: ", e.what());
		throw;
	}
}

UploadResult ChunkedUploader::uploadRemote(const string &file, const UploadParams &params, const Deadline &deadline, const CancellationToken &cancellation)
{
	if(!isRemote(file))throw UploadException("\"", file.substr(0, 64), "\" is not a remote URL");

	checkAlive(deadline, cancellation);

	const string url = config.uploadUrl(params.resourceType);
	HttpRequest request = createRequest(url, signedFields(params));
	request.fields.push_back(FormField("file", file));

	LOG(LogLevel::info, "Uploading remote file ", file.substr(0, 64), " to ", url);

	try {
		const HttpResponse response = send(request, deadline, cancellation);
		UploadResult result = decodeResult(response);

		LOG(LogLevel::info, "Uploaded remote file as ", result.publicId);
		return result;
	} catch(const UploadException &e) {
		LOG(LogLevel::warn, "Aborted remote upload: ", e.what());
		throw;
	}
}

bool ChunkedUploader::isRemote(const string &file)
{
	static const char *prefixes[] = { "http://", "https://", "ftp://", "s3://", "gs://" };

	for(const char *prefix : prefixes)
		if(utils::startsWith(file, prefix))return true;

	return utils::startsWith(file, "data:") && file.find(";base64,") != string::npos;
}

void ChunkedUploader::handleError(long code, const string &response)
{
	if(code >= 200 && code < 300)return;	//Everything is fine...

	string message = serviceErrorMessage(response);
	if(message.empty())message = response;

	switch(code)
	{
	case 400: throw TransportException(code, "Bad request: ", message);
	case 401: throw TransportException(code, "Invalid credentials: ", message);
	case 403: throw TransportException(code, "Not allowed: ", message);
	case 404: throw TransportException(code, "Not found: ", message);
	case 409: throw TransportException(code, "Already exists: ", message);
	case 413: throw TransportException(code, "Request too large: ", message);
	case 420: throw TransportException(code, "Rate limited: ", message);
	case 429: throw TransportException(code, "Rate limited: ", message);
	case 500: throw TransportException(code, "Internal server error: ", message);
	case 502: throw TransportException(code, "Bad gateway: ", message);
	case 503: throw TransportException(code, "Service unavailable: ", message);
	case 504: throw TransportException(code, "Gateway timeout: ", message);
	default: throw TransportException(code, "Unexpected HTTP status (", code, "): ", message);
	}
}

Params ChunkedUploader::signedFields(const UploadParams &params) const
{
	Params fields = params.toParams();

	for(const auto &field : signer.sign(fields))
		fields[field.first] = field.second;

	return fields;
}

HttpRequest ChunkedUploader::createRequest(const string &url, const Params &fields) const
{
	HttpRequest request("POST", url);

	for(const auto &field : fields)
		request.fields.push_back(FormField(field.first, field.second));

	return request;
}

HttpResponse ChunkedUploader::send(const HttpRequest &request, const Deadline &deadline, const CancellationToken &cancellation)
{
	HttpResponse response = transport.send(request, deadline, cancellation);
	handleError(response.code, response.body);
	return response;
}

UploadResult ChunkedUploader::decodeResult(const HttpResponse &response)
{
	checkServiceError(response);
	return decodeUploadResult(response.body);
}
