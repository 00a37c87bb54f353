/*
 * PeerMesh
 * PeerJS broker client over WebSocket
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <string>
#include <thread>

#include "peermesh-signaling-protocol.h"

namespace rtc
{
class WebSocket;
}

namespace peermesh
{

// Callbacks run on libdatachannel or worker threads
class SignalingClient
{
public:
	using OnConnectedCallback = std::function<void()>;
	using OnDisconnectedCallback = std::function<void()>;
	using OnMessageCallback = std::function<void(const ParsedSignalMessage &message)>;
	using OnErrorCallback = std::function<void(const std::string &error)>;

	SignalingClient();
	~SignalingClient();

	SignalingClient(const SignalingClient &) = delete;
	SignalingClient &operator=(const SignalingClient &) = delete;

	// Starts the worker thread and opens the socket. Returns false if already running.
	bool connect(const std::string &url);
	void disconnect();
	bool isConnected() const { return connected_; }

	void send(const std::string &message);

	void setAutoReconnect(bool enable) { autoReconnect_ = enable; }
	void setMaxReconnectAttempts(int attempts) { maxReconnectAttempts_ = attempts; }
	void setHeartbeatInterval(int64_t ms) { heartbeatIntervalMs_ = ms; }

	void setOnConnected(OnConnectedCallback callback);
	void setOnDisconnected(OnDisconnectedCallback callback);
	void setOnMessage(OnMessageCallback callback);
	void setOnError(OnErrorCallback callback);

private:
	void workerFunc();
	bool openSocket();
	void closeSocket();
	void processMessage(const std::string &message);
	void reportError(const std::string &error);

	std::string url_;
	std::shared_ptr<rtc::WebSocket> ws_;
	std::thread worker_;

	std::mutex sendMutex_;
	std::condition_variable sendCv_;
	std::queue<std::string> sendQueue_;

	std::atomic<bool> shouldRun_{false};
	std::atomic<bool> connected_{false};
	std::atomic<bool> socketClosed_{false};
	std::atomic<bool> autoReconnect_{true};
	std::atomic<int> maxReconnectAttempts_{5};
	std::atomic<int64_t> heartbeatIntervalMs_{5000};
	std::atomic<int> reconnectAttempts_{0};

	std::mutex callbackMutex_;
	OnConnectedCallback onConnected_;
	OnDisconnectedCallback onDisconnected_;
	OnMessageCallback onMessage_;
	OnErrorCallback onError_;
};

} // namespace peermesh
