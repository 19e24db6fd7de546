/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#include <malformedresponseexception.hpp>
#include <uploadexception.hpp>
#include <uploadsession.hpp>

using std::string;

using namespace au;

const char* au::stateString(UploadSession::State state)
{
	switch(state)
	{
		case UploadSession::State::notStarted: return "not started";
		case UploadSession::State::inProgress: return "in progress";
		case UploadSession::State::completed: return "completed";
		case UploadSession::State::aborted: return "aborted";
	}
	return "unknown";
}

void UploadSession::expectState(State expected, const char *operation) const
{
	if(state != expected)
		throw UploadException("Can't ", operation, " a session which is ", state);
}

void UploadSession::start()
{
	expectState(State::notStarted, "start");
	state = State::inProgress;
}

void UploadSession::acknowledge(const ChunkRange &range, const string &str_continuationId)
{
	expectState(State::inProgress, "acknowledge a chunk of");

	if(range.offset != bytesSent)
		throw UploadException("Chunk ", range, " doesn't continue at byte ", bytesSent);

	if(range.end() > sourceSize)
		throw UploadException("Chunk ", range, " exceeds the source size ", sourceSize);

	if(!str_continuationId.empty())
	{
		if(continuationId.empty())continuationId = str_continuationId;
		else if(continuationId != str_continuationId)
			throw MalformedResponseException("Continuation id changed from \"", continuationId, "\" to \"", str_continuationId, "\"");
	}

	bytesSent = range.end();
}

void UploadSession::complete()
{
	expectState(State::inProgress, "complete");

	if(bytesSent != sourceSize)
		throw UploadException("Can't complete a session after ", bytesSent, " of ", sourceSize, " bytes");

	state = State::completed;
}

void UploadSession::abort(const string &reason)
{
	if(isTerminal())throw UploadException("Can't abort a session which is ", state);

	abortReason = reason;
	state = State::aborted;
}
