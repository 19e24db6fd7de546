/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef UPLOADSESSION_HPP
#define UPLOADSESSION_HPP

#include <ostream>
#include <string>

#include <chunkrange.hpp>

namespace au
{

/**
  * The state of a single upload. A session is created for
  * exactly one upload and can't be reused once it reached
  * one of the terminal states completed or aborted.
  *
  * notStarted -> inProgress -> completed
  *                          \-> aborted
 **/
class UploadSession
{

public:

	enum class State
	{
		notStarted,
		inProgress,
		completed,
		aborted
	}; //end enum class State

	/**
	  * Creates a session for a source of the given size
	  * which is sent in chunks of at most chunkSize bytes
	 **/
	UploadSession(unsigned long long ull_sourceSize, unsigned long long ull_chunkSize) :
		sourceSize(ull_sourceSize),
		chunkSize(ull_chunkSize),
		state(State::notStarted),
		bytesSent(0),
		continuationId(),
		abortReason()
	{}

	/**
	  * Moves the session from notStarted to inProgress.
	  * Throws an UploadException in any other state
	 **/
	void start();

	/**
	  * Records the successful transmission of the given range.
	  * The range must start where the previous one ended. If
	  * the service assigned a continuation id it is adopted the
	  * first time and must not change afterwards.
	 **/
	void acknowledge(const ChunkRange &range, const std::string &str_continuationId);

	/**
	  * Moves the session to completed. All bytes of the
	  * source must have been acknowledged
	 **/
	void complete();

	/**
	  * Moves the session to aborted. Throws an UploadException
	  * if the session is already completed or aborted
	 **/
	void abort(const std::string &reason);

	State getState() const
	{
		return state;
	}

	bool isTerminal() const
	{
		return state == State::completed || state == State::aborted;
	}

	unsigned long long getSourceSize() const
	{
		return sourceSize;
	}

	unsigned long long getChunkSize() const
	{
		return chunkSize;
	}

	unsigned long long getBytesSent() const
	{
		return bytesSent;
	}

	/**
	  * Returns the continuation id which was assigned by the
	  * service or an empty string if none was assigned yet
	 **/
	const std::string& getContinuationId() const
	{
		return continuationId;
	}

	const std::string& getAbortReason() const
	{
		return abortReason;
	}

private:

	/**
	  * Throws if the session is not in the expected state
	 **/
	void expectState(State expected, const char *operation) const;

private:

	unsigned long long sourceSize;

	unsigned long long chunkSize;

	State state;

	unsigned long long bytesSent;

	std::string continuationId;

	std::string abortReason;

}; //end class UploadSession

const char* stateString(UploadSession::State state);

inline std::ostream& operator<< (std::ostream &out, UploadSession::State state)
{
	out<<stateString(state);
	return out;
}

} //end namespace au

#endif //UPLOADSESSION_HPP
