#pragma once
#include <libsandbox/capabilities.hpp>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <exception>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

/**
 * Inbound messages are pushed by the test, outbound messages and logs
 * are recorded. A receive that finds no message parks a promise which
 * the next push fulfils, so a test can hold the guest suspended.
**/
struct Channel
{
	void push(const std::string& text) {
		std::unique_lock<std::mutex> lock(mtx);
		std::vector<uint8_t> msg(text.begin(), text.end());
		if (!waiting.empty()) {
			auto p = std::move(waiting.front());
			waiting.pop_front();
			lock.unlock();
			p.set_value(std::move(msg));
			return;
		}
		inbound.push_back(std::move(msg));
	}

	/* Wait until the guest is suspended in a receive */
	bool wait_for_receiver(std::chrono::milliseconds tmo = std::chrono::seconds(10)) {
		std::unique_lock<std::mutex> lock(mtx);
		return cv.wait_for(lock, tmo, [this] { return !waiting.empty(); });
	}

	std::vector<std::string> sent() {
		std::lock_guard<std::mutex> lock(mtx);
		return outbound;
	}
	std::vector<std::string> logs() {
		std::lock_guard<std::mutex> lock(mtx);
		return log_lines;
	}

	std::mutex mtx;
	std::condition_variable cv;
	std::deque<std::vector<uint8_t>> inbound;
	std::deque<std::promise<std::vector<uint8_t>>> waiting;
	std::vector<std::string> outbound;
	std::vector<std::string> log_lines;
	bool ready = false;
	std::exception_ptr send_error = nullptr;
};

struct ScriptedCapabilities : public sandbox::Capabilities
{
	std::future<void> send_bytes(std::vector<uint8_t> message) override {
		std::promise<void> p;
		std::lock_guard<std::mutex> lock(ch->mtx);
		if (ch->send_error) {
			p.set_exception(ch->send_error);
		} else {
			ch->outbound.emplace_back(message.begin(), message.end());
			p.set_value();
		}
		return p.get_future();
	}
	std::future<std::vector<uint8_t>> recv_bytes() override {
		std::lock_guard<std::mutex> lock(ch->mtx);
		std::promise<std::vector<uint8_t>> p;
		auto fut = p.get_future();
		if (!ch->inbound.empty()) {
			p.set_value(std::move(ch->inbound.front()));
			ch->inbound.pop_front();
		} else {
			ch->waiting.push_back(std::move(p));
			ch->cv.notify_all();
		}
		return fut;
	}
	bool recv_ready() override {
		std::lock_guard<std::mutex> lock(ch->mtx);
		return ch->ready || !ch->inbound.empty();
	}
	void write_log(std::string_view text) override {
		std::lock_guard<std::mutex> lock(ch->mtx);
		ch->log_lines.emplace_back(text);
	}

	ScriptedCapabilities(std::shared_ptr<Channel> c) : ch(std::move(c)) {}
	std::shared_ptr<Channel> ch;
};
