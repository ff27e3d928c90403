#pragma once

#include "core/gameEvent.hpp"

namespace ftf {

//! Receives the signals it subscribed for.
//! \note Called without any engine lock held. The listener may query the engine, play further moves or
//!       unsubscribe from within the callback.
class IGameSignalListener {
public:
	virtual ~IGameSignalListener()              = default;
	virtual void onGameEvent(GameSignal signal) = 0;
};

//! Receives the full change of every accepted move, in move order.
//! \note Same calling rules as IGameSignalListener. A move played from within onGameDelta is delivered after the
//!       current delta reached every listener.
class IGameStateListener {
public:
	virtual ~IGameStateListener()                    = default;
	virtual void onGameDelta(const GameDelta& delta) = 0;
};

} // namespace ftf
