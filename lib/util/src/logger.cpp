#include <fmt/chrono.h>
#include <tagged/util/logger.hpp>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tagged::logger {
namespace {
std::string timestamp() { return fmt::format("{:%H:%M:%S}", std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now())); }

std::FILE* stream(Pipe const pipe) { return pipe == Pipe::eStdErr ? stderr : stdout; }

///
/// \brief Small sequential ids, assigned to threads in order of their first log.
///
class ThreadIds {
  public:
	int get(std::thread::id const tid) {
		auto lock = std::scoped_lock{m_mutex};
		auto const [it, inserted] = m_ids.try_emplace(tid, m_next);
		if (inserted) { ++m_next; }
		return it->second;
	}

  private:
	std::unordered_map<std::thread::id, int> m_ids{};
	int m_next{};
	std::mutex m_mutex{};
};

///
/// \brief Entries recorded while an Instance is alive.
///
/// Grows to limit + extra, then drops the oldest entries back down to limit.
///
class Buffer {
  public:
	void open(std::size_t const limit, std::size_t const extra) {
		auto lock = std::scoped_lock{m_mutex};
		m_entries.clear();
		m_limit = limit;
		m_extra = extra;
		m_open = true;
	}

	void close() {
		auto lock = std::scoped_lock{m_mutex};
		m_entries.clear();
		m_open = false;
	}

	void push(Entry entry) {
		auto lock = std::scoped_lock{m_mutex};
		if (!m_open) { return; }
		m_entries.push_back(std::move(entry));
		if (m_entries.size() <= m_limit + m_extra) { return; }
		auto const excess = static_cast<std::ptrdiff_t>(m_entries.size() - m_limit);
		m_entries.erase(m_entries.begin(), m_entries.begin() + excess);
	}

	void read(Accessor& accessor) {
		auto lock = std::scoped_lock{m_mutex};
		accessor(m_entries);
	}

  private:
	std::vector<Entry> m_entries{};
	std::size_t m_limit{};
	std::size_t m_extra{};
	bool m_open{};
	std::mutex m_mutex{};
};

ThreadIds g_thread_ids{};
Buffer g_buffer{};
} // namespace

int thread_id() { return g_thread_ids.get(std::this_thread::get_id()); }

std::string format(Level const level, std::string_view const message) {
	auto const symbol = levels_v[static_cast<std::size_t>(level)];
	return fmt::format(fmt::runtime(g_format), fmt::arg("thread", thread_id()), fmt::arg("level", symbol), fmt::arg("message", message),
					   fmt::arg("timestamp", timestamp()));
}

void log_to(Pipe const pipe, Entry entry) {
	fmt::print(stream(pipe), "{}\n", entry.message);
	g_buffer.push(std::move(entry));
}

void access_buffer(Accessor& accessor) { g_buffer.read(accessor); }

Instance::Instance(std::size_t const buffer_limit, std::size_t const buffer_extra) { g_buffer.open(buffer_limit, buffer_extra); }

Instance::~Instance() { g_buffer.close(); }
} // namespace tagged::logger
