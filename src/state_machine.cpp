#include "state_machine.hpp"
#include <cstddef>
#include <utility>

const char *StateMachine::stateToString(State s)
{
	switch (s)
	{
	case Idle:
		return "Idle";
	case Playing:
		return "Playing";
	case Draining:
		return "Draining";
	case Stopped:
		return "Stopped";
	default:
		return "Unknown";
	}
}

void StateMachine::setState(State s)
{
	if (state_ == s)
	{
		return;
	}

	State prev = state_;
	for (auto &cb : exit_events_[static_cast<size_t>(prev)])
	{
		cb(prev, s);
	}
	state_ = s;
	for (auto &cb : entry_events_[static_cast<size_t>(state_)])
	{
		cb(prev, state_);
	}
}

StateMachine::State StateMachine::getState() const
{
	return state_;
}

bool StateMachine::isIdle() const
{
	return state_ == Idle;
}

bool StateMachine::isPlaying() const
{
	return state_ == Playing;
}

bool StateMachine::isDraining() const
{
	return state_ == Draining;
}

bool StateMachine::isStopped() const
{
	return state_ == Stopped;
}

bool StateMachine::isActive() const
{
	return state_ == Playing || state_ == Draining;
}

void StateMachine::addStateEntryEvent(State state, Callback cb)
{
	entry_events_[static_cast<size_t>(state)].push_back(std::move(cb));
}

void StateMachine::addStateExitEvent(State state, Callback cb)
{
	exit_events_[static_cast<size_t>(state)].push_back(std::move(cb));
}
