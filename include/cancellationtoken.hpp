/**
  *
  * assetupload client
  * @author Thomas Sparber (2015-2016)
  *
 **/

#ifndef CANCELLATIONTOKEN_HPP
#define CANCELLATIONTOKEN_HPP

#include <atomic>
#include <memory>

namespace au
{

/**
  * A CancellationToken can be handed to an upload and cancelled
  * from any other thread. Copies share the same state, so the
  * caller keeps a copy and calls cancel() on it. The running
  * request is aborted and no further chunk is sent
 **/
class CancellationToken
{

public:
	CancellationToken() :
		cancelled(std::make_shared<std::atomic<bool>>(false))
	{}

	void cancel()
	{
		cancelled->store(true);
	}

	bool isCancelled() const
	{
		return cancelled->load();
	}

private:
	std::shared_ptr<std::atomic<bool>> cancelled;

}; //end class CancellationToken

} //end namespace au

#endif //CANCELLATIONTOKEN_HPP
