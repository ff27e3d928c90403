#pragma once

#include "core/gameListener.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace ftf {

//! Fans out accepted moves to the subscribed listeners.
//! Listeners are called on the publishing thread with the hub unlocked, so they may subscribe or unsubscribe
//! from within a callback. A listener removed during a fan-out is not called for the rest of it.
class EventHub {
	struct SignalSubscription {
		IGameSignalListener* listener;
		std::uint64_t signalMask; //!< Signals the listener cares about.
	};

public:
	void subscribe(IGameSignalListener* listener, std::uint64_t signalMask);
	void unsubscribe(IGameSignalListener* listener);

	void subscribe(IGameStateListener* listener);
	void unsubscribe(IGameStateListener* listener);

	//! Deliver one accepted move. Signal listeners get GS_BoardChange, then GS_PlayerChange or GS_StateChange.
	//! State listeners get the delta afterwards.
	void publish(const GameDelta& delta);

private:
	void deliver(GameSignal signal);

	//! Listeners subscribed for signal at the time of the call.
	std::vector<IGameSignalListener*> listenersFor(GameSignal signal) const;
	bool isSubscribed(const IGameSignalListener* listener, GameSignal signal) const;
	bool isSubscribed(const IGameStateListener* listener) const;

private:
	mutable std::mutex m_listenerMutex; //!< Guards the subscription lists only. Never held while calling out.
	std::vector<SignalSubscription> m_signalListeners;
	std::vector<IGameStateListener*> m_stateListeners;
};

} // namespace ftf
