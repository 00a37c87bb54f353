/*
 * PeerMesh
 * PeerJS broker client over WebSocket
 *
 * The worker thread owns the socket: it opens it, drains the send queue, emits the
 * broker heartbeat and reconnects with exponential backoff after an unexpected close.
 */

#include "peermesh-signaling.h"

#include <rtc/rtc.hpp>

#include <algorithm>
#include <chrono>
#include <variant>

#include "peermesh-utils.h"

namespace peermesh
{

SignalingClient::SignalingClient() = default;

SignalingClient::~SignalingClient()
{
	disconnect();
}

bool SignalingClient::connect(const std::string &url)
{
	if (shouldRun_) {
		logWarning("Signaling client already running");
		return false;
	}
	if (worker_.joinable()) {
		worker_.join();
	}

	url_ = url;
	shouldRun_ = true;
	socketClosed_ = false;
	reconnectAttempts_ = 0;
	worker_ = std::thread(&SignalingClient::workerFunc, this);
	return true;
}

void SignalingClient::disconnect()
{
	const bool wasRunning = shouldRun_.exchange(false);
	{
		std::lock_guard<std::mutex> lock(sendMutex_);
		std::queue<std::string> empty;
		sendQueue_.swap(empty);
		sendCv_.notify_all();
	}

	if (worker_.joinable()) {
		worker_.join();
	}
	connected_ = false;

	if (wasRunning) {
		logInfo("Disconnected from signaling server");
	}
}

void SignalingClient::send(const std::string &message)
{
	if (!shouldRun_) {
		logWarning("Cannot send signaling message - client not running");
		return;
	}

	std::lock_guard<std::mutex> lock(sendMutex_);
	sendQueue_.push(message);
	sendCv_.notify_one();
}

void SignalingClient::setOnConnected(OnConnectedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onConnected_ = std::move(callback);
}

void SignalingClient::setOnDisconnected(OnDisconnectedCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onDisconnected_ = std::move(callback);
}

void SignalingClient::setOnMessage(OnMessageCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onMessage_ = std::move(callback);
}

void SignalingClient::setOnError(OnErrorCallback callback)
{
	std::lock_guard<std::mutex> lock(callbackMutex_);
	onError_ = std::move(callback);
}

bool SignalingClient::openSocket()
{
	logInfo("Connecting to signaling server: %s", url_.c_str());
	socketClosed_ = false;

	try {
		auto ws = std::make_shared<rtc::WebSocket>();

		ws->onOpen([this]() {
			logInfo("WebSocket connected to signaling server");
			connected_ = true;
			reconnectAttempts_ = 0;
			OnConnectedCallback cb;
			{
				std::lock_guard<std::mutex> lock(callbackMutex_);
				cb = onConnected_;
			}
			if (cb) {
				cb();
			}
		});

		ws->onClosed([this]() {
			logInfo("WebSocket closed");
			connected_ = false;
			socketClosed_ = true;
			sendCv_.notify_all();
			OnDisconnectedCallback cb;
			{
				std::lock_guard<std::mutex> lock(callbackMutex_);
				cb = onDisconnected_;
			}
			if (cb && shouldRun_) {
				cb();
			}
		});

		ws->onError([this](const std::string &error) {
			logError("WebSocket error: %s", error.c_str());
			reportError(error);
		});

		ws->onMessage([this](auto data) {
			if (std::holds_alternative<std::string>(data)) {
				processMessage(std::get<std::string>(data));
			}
		});

		ws_ = ws;
		ws->open(url_);
		return true;
	} catch (const std::exception &e) {
		logError("Failed to open signaling socket: %s", e.what());
		socketClosed_ = true;
		reportError(e.what());
		return false;
	}
}

void SignalingClient::closeSocket()
{
	auto ws = std::move(ws_);
	if (!ws) {
		return;
	}

	try {
		ws->onOpen(nullptr);
		ws->onClosed(nullptr);
		ws->onError(nullptr);
		ws->onMessage(nullptr);
		ws->close();
	} catch (const std::exception &e) {
		logWarning("Error closing signaling socket: %s", e.what());
	}
	connected_ = false;
}

void SignalingClient::workerFunc()
{
	openSocket();
	auto lastHeartbeat = std::chrono::steady_clock::now();

	while (shouldRun_) {
		std::unique_lock<std::mutex> lock(sendMutex_);
		sendCv_.wait_for(lock, std::chrono::milliseconds(100), [this] {
			return (!sendQueue_.empty() && connected_) || socketClosed_ || !shouldRun_;
		});
		if (!shouldRun_) {
			break;
		}

		if (socketClosed_) {
			lock.unlock();
			closeSocket();

			if (!autoReconnect_) {
				break;
			}
			if (reconnectAttempts_ >= maxReconnectAttempts_) {
				logError("Max reconnection attempts reached");
				reportError("Max reconnection attempts reached");
				break;
			}

			reconnectAttempts_++;
			const int delay = std::min(1000 * (1 << reconnectAttempts_.load()), 30000); // Exponential backoff, max 30s
			logInfo("Reconnecting in %d ms (attempt %d/%d)", delay, reconnectAttempts_.load(),
			        maxReconnectAttempts_.load());

			lock.lock();
			sendCv_.wait_for(lock, std::chrono::milliseconds(delay), [this] { return !shouldRun_; });
			lock.unlock();
			if (shouldRun_) {
				openSocket();
				lastHeartbeat = std::chrono::steady_clock::now();
			}
			continue;
		}

		while (!sendQueue_.empty() && connected_) {
			std::string msg = sendQueue_.front();
			sendQueue_.pop();
			lock.unlock();

			try {
				ws_->send(msg);
				logDebug("Sent: %s", msg.c_str());
			} catch (const std::exception &e) {
				logError("Failed to send message: %s", e.what());
			}

			lock.lock();
		}
		lock.unlock();

		const auto now = std::chrono::steady_clock::now();
		const auto sinceHeartbeat = std::chrono::duration_cast<std::chrono::milliseconds>(now - lastHeartbeat);
		if (connected_ && sinceHeartbeat.count() >= heartbeatIntervalMs_) {
			lastHeartbeat = now;
			try {
				ws_->send(buildHeartbeatMessage());
			} catch (const std::exception &e) {
				logWarning("Failed to send heartbeat: %s", e.what());
			}
		}
	}

	closeSocket();
	shouldRun_ = false;
}

void SignalingClient::processMessage(const std::string &message)
{
	logDebug("Received: %s", message.c_str());

	ParsedSignalMessage parsed;
	std::string error;
	if (!parseSignalingMessage(message, parsed, &error)) {
		logError("Failed to parse signaling message: %s", error.c_str());
		return;
	}
	if (parsed.kind == SignalKind::Heartbeat) {
		return;
	}

	OnMessageCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onMessage_;
	}
	if (cb) {
		cb(parsed);
	}
}

void SignalingClient::reportError(const std::string &error)
{
	OnErrorCallback cb;
	{
		std::lock_guard<std::mutex> lock(callbackMutex_);
		cb = onError_;
	}
	if (cb) {
		cb(error);
	}
}

} // namespace peermesh
