/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <curldefinitions.hpp>
#include <cancelledexception.hpp>
#include <curltransport.hpp>
#include <deadlineexceededexception.hpp>
#include <logger.hpp>
#include <transportexception.hpp>

using std::string;

using namespace au;

/**
  * Owns the cURL resources of one request
 **/
struct CurlRequest
{
	CurlRequest() :
		handle(curl_easy_init()),
		headers(nullptr),
		mime(nullptr)
	{}

	~CurlRequest()
	{
		if(mime)curl_mime_free(mime);
		if(headers)curl_slist_free_all(headers);
		if(handle)curl_easy_cleanup(handle);
	}

	CurlRequest(const CurlRequest&) = delete;
	CurlRequest& operator= (const CurlRequest&) = delete;

	CURL *handle;
	curl_slist *headers;
	curl_mime *mime;
};

/**
  * cURL progress callback, a non zero return value
  * aborts the transfer
 **/
static int progressCallback(void *clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t)
{
	const CancellationToken *cancellation = static_cast<const CancellationToken*>(clientp);
	return cancellation->isCancelled() ? 1 : 0;
}

CurlTransport::CurlTransport(const string &str_userAgent, bool b_verbose) :
	userAgent(str_userAgent),
	verbose(b_verbose)
{}

HttpResponse CurlTransport::send(const HttpRequest &request, const Deadline &deadline, const CancellationToken &cancellation)
{
	if(cancellation.isCancelled())throw CancelledException("Request to ", request.url, " was cancelled");
	if(deadline.expired())throw DeadlineExceededException("Deadline exceeded before sending request to ", request.url);

	CurlRequest curl;
	if(!curl.handle)throw TransportException(0, "Unable to initialize cURL");

	HttpResponse response;

	//Prepare and add headers
	for(const string &header : request.headers)
		curl.headers = curl_slist_append(curl.headers, header.c_str());
	if(curl.headers)curl_easy_setopt(curl.handle, CURLOPT_HTTPHEADER, curl.headers);

	//Multipart body
	if(!request.fields.empty())
	{
		curl.mime = curl_mime_init(curl.handle);
		for(const FormField &field : request.fields)
		{
			curl_mimepart *part = curl_mime_addpart(curl.mime);
			curl_mime_name(part, field.name.c_str());
			curl_mime_data(part, field.value.data(), field.value.size());

			if(field.isFile)
			{
				curl_mime_filename(part, field.filename.c_str());
				curl_mime_type(part, "application/octet-stream");
			}
		}
		curl_easy_setopt(curl.handle, CURLOPT_MIMEPOST, curl.mime);
	}

	if(request.method == "GET")
		curl_easy_setopt(curl.handle, CURLOPT_HTTPGET, 1L);
	else if(request.method == "POST" && request.fields.empty())
		curl_easy_setopt(curl.handle, CURLOPT_POSTFIELDS, "");
	else if(request.method != "POST")
		curl_easy_setopt(curl.handle, CURLOPT_CUSTOMREQUEST, request.method.c_str());

	//URL
	curl_easy_setopt(curl.handle, CURLOPT_URL, request.url.c_str());

	//Write memory function
	curl_easy_setopt(curl.handle, CURLOPT_WRITEFUNCTION, &writeMemoryCallback);
	curl_easy_setopt(curl.handle, CURLOPT_WRITEDATA, (void*)&response.body);

	//Response headers
	curl_easy_setopt(curl.handle, CURLOPT_HEADERFUNCTION, &headerCallback);
	curl_easy_setopt(curl.handle, CURLOPT_HEADERDATA, (void*)&response.headers);

	//Cancellation
	curl_easy_setopt(curl.handle, CURLOPT_NOPROGRESS, 0L);
	curl_easy_setopt(curl.handle, CURLOPT_XFERINFOFUNCTION, &progressCallback);
	curl_easy_setopt(curl.handle, CURLOPT_XFERINFODATA, (void*)&cancellation);

	//User agent
	curl_easy_setopt(curl.handle, CURLOPT_USERAGENT, userAgent.c_str());

	curl_easy_setopt(curl.handle, CURLOPT_FOLLOWLOCATION, 1L);		//Redirections
	curl_easy_setopt(curl.handle, CURLOPT_MAXREDIRS, 10L);			//Avoid looping redirections
	curl_easy_setopt(curl.handle, CURLOPT_NOSIGNAL, 1L);
	if(verbose)curl_easy_setopt(curl.handle, CURLOPT_VERBOSE, 1L);

	//The whole request must finish before the deadline.
	//0 would disable the timeout in cURL
	if(deadline.isSet())
	{
		long long remaining = deadline.remainingMilliseconds();
		if(remaining < 1)remaining = 1;
		curl_easy_setopt(curl.handle, CURLOPT_TIMEOUT_MS, (long)remaining);
	}

	//If the speed is below 100 byte/sec for more than 20 seconds
	//then the connection is closed
	curl_easy_setopt(curl.handle, CURLOPT_LOW_SPEED_LIMIT, 100L);
	curl_easy_setopt(curl.handle, CURLOPT_LOW_SPEED_TIME, 20L);

	const CURLcode res = curl_easy_perform(curl.handle);
	switch(res)
	{
	case CURLE_OK:
		break;
	case CURLE_OPERATION_TIMEDOUT:
		if(deadline.expired())throw DeadlineExceededException("Deadline exceeded during request to ", request.url);
		throw TransportException(0, "Request to ", request.url, " timed out: ", curl_easy_strerror(res));
	case CURLE_ABORTED_BY_CALLBACK:
		throw CancelledException("Request to ", request.url, " was cancelled");
	default:
		throw TransportException(0, "Request to ", request.url, " failed: ", curl_easy_strerror(res));
	}

	//Response code
	curl_easy_getinfo(curl.handle, CURLINFO_RESPONSE_CODE, &response.code);

	//Get content type
	char *ct = nullptr;
	curl_easy_getinfo(curl.handle, CURLINFO_CONTENT_TYPE, &ct);
	if(ct != nullptr)response.contentType = ct;

	LOG(LogLevel::debug, request.method, " ", request.url, " -> ", response.code, " (", response.body.length(), " bytes)");

	return response;
}
