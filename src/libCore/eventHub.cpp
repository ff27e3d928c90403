#include "core/eventHub.hpp"

#include <algorithm>

namespace ftf {

void EventHub::subscribe(IGameSignalListener* listener, const std::uint64_t signalMask) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.push_back({listener, signalMask});
}

void EventHub::unsubscribe(IGameSignalListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_signalListeners.erase(
	        std::remove_if(m_signalListeners.begin(), m_signalListeners.end(), [&](const SignalSubscription& s) { return s.listener == listener; }),
	        m_signalListeners.end());
}

void EventHub::subscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.push_back(listener);
}

void EventHub::unsubscribe(IGameStateListener* listener) {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	m_stateListeners.erase(std::remove(m_stateListeners.begin(), m_stateListeners.end(), listener), m_stateListeners.end());
}

void EventHub::publish(const GameDelta& delta) {
	deliver(GS_BoardChange);
	deliver(delta.status == GameStatus::InProgress ? GS_PlayerChange : GS_StateChange);

	std::vector<IGameStateListener*> targets;
	{
		std::lock_guard<std::mutex> lock(m_listenerMutex);
		targets = m_stateListeners;
	}
	for (auto* listener: targets) {
		if (isSubscribed(listener)) {
			listener->onGameDelta(delta);
		}
	}
}

void EventHub::deliver(const GameSignal signal) {
	for (auto* listener: listenersFor(signal)) {
		if (isSubscribed(listener, signal)) {
			listener->onGameEvent(signal);
		}
	}
}

std::vector<IGameSignalListener*> EventHub::listenersFor(const GameSignal signal) const {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	std::vector<IGameSignalListener*> targets;
	for (const auto& [listener, signalMask]: m_signalListeners) {
		if (signalMask & signal) {
			targets.push_back(listener);
		}
	}
	return targets;
}

bool EventHub::isSubscribed(const IGameSignalListener* listener, const GameSignal signal) const {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	return std::any_of(m_signalListeners.begin(), m_signalListeners.end(),
	                   [&](const SignalSubscription& s) { return s.listener == listener && (s.signalMask & signal); });
}

bool EventHub::isSubscribed(const IGameStateListener* listener) const {
	std::lock_guard<std::mutex> lock(m_listenerMutex);

	return std::find(m_stateListeners.begin(), m_stateListeners.end(), listener) != m_stateListeners.end();
}

} // namespace ftf
