#pragma once

#include <deque>
#include <mutex>
#include <optional>

namespace monopoly {

//! Thread safe queue. Producers push from any thread, the game loop drains it without blocking.
template <class Entry>
class SafeQueue {
public:
	//! Push element onto the queue.
	void Push(const Entry& value);

	//! Take the oldest element. Returns empty if there is none.
	std::optional<Entry> TryPop();

	//! Drop all queued elements.
	void Clear();

protected:
	std::deque<Entry> m_queue;   //!< Stores the entries.
	std::mutex m_mutex;          //!< Manage access to the queue.
};


template <class Entry>
void SafeQueue<Entry>::Push(const Entry& value) {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_queue.push_back(value);
}

template <class Entry>
std::optional<Entry> SafeQueue<Entry>::TryPop() {
	std::lock_guard<std::mutex> lock(m_mutex);
	if (m_queue.empty()) {
		return {};
	}

	Entry element = m_queue.front();
	m_queue.pop_front();
	return element;
}

template <class Entry>
void SafeQueue<Entry>::Clear() {
	std::lock_guard<std::mutex> lock(m_mutex);
	m_queue.clear();
}

} // namespace monopoly
