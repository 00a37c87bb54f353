/*
 * PeerMesh
 * Transport adapter boundary
 *
 * The orchestrator never touches ICE, SDP or media encoding. It asks the transport
 * for logical channels and reacts to their events. Implementations must deliver every
 * callback on the session's event loop.
 */

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <utility>

#include "peermesh-common.h"
#include "peermesh-media.h"

namespace peermesh
{

// Ordered, reliable channel carrying control messages to one peer
class ControlChannel
{
public:
	using OnOpenCallback = std::function<void()>;
	using OnMessageCallback = std::function<void(const std::string &message)>;
	using OnClosedCallback = std::function<void()>;
	using OnErrorCallback = std::function<void(const std::string &error)>;

	virtual ~ControlChannel() = default;

	virtual std::string peerId() const = 0;
	virtual bool isOpen() const = 0;
	virtual bool send(const std::string &message) = 0;
	virtual void close() = 0;

	void setOnOpen(OnOpenCallback callback) { onOpen_ = std::move(callback); }
	void setOnMessage(OnMessageCallback callback) { onMessage_ = std::move(callback); }
	void setOnClosed(OnClosedCallback callback) { onClosed_ = std::move(callback); }
	void setOnError(OnErrorCallback callback) { onError_ = std::move(callback); }

	void clearCallbacks()
	{
		onOpen_ = nullptr;
		onMessage_ = nullptr;
		onClosed_ = nullptr;
		onError_ = nullptr;
	}

protected:
	void notifyOpen()
	{
		auto cb = onOpen_;
		if (cb) {
			cb();
		}
	}
	void notifyMessage(const std::string &message)
	{
		auto cb = onMessage_;
		if (cb) {
			cb(message);
		}
	}
	void notifyClosed()
	{
		auto cb = onClosed_;
		if (cb) {
			cb();
		}
	}
	void notifyError(const std::string &error)
	{
		auto cb = onError_;
		if (cb) {
			cb(error);
		}
	}

private:
	OnOpenCallback onOpen_;
	OnMessageCallback onMessage_;
	OnClosedCallback onClosed_;
	OnErrorCallback onError_;
};

struct MediaChannelOptions {
	StreamType kind = StreamType::Camera;
	std::string username;
};

// One audio/video stream exchanged with one peer
class MediaChannel
{
public:
	using OnStreamCallback = std::function<void(std::shared_ptr<MediaStream> remoteStream)>;
	using OnClosedCallback = std::function<void()>;
	using OnErrorCallback = std::function<void(const std::string &error)>;

	virtual ~MediaChannel() = default;

	virtual std::string peerId() const = 0;
	// Kind announced by the caller when the channel was opened
	virtual StreamType kind() const = 0;
	virtual std::string remoteUsername() const = 0;
	virtual bool isOpen() const = 0;
	virtual void answer(std::shared_ptr<MediaStream> localStream) = 0;
	virtual std::shared_ptr<MediaStream> remoteStream() const = 0;
	virtual void close() = 0;

	void setOnStream(OnStreamCallback callback) { onStream_ = std::move(callback); }
	void setOnClosed(OnClosedCallback callback) { onClosed_ = std::move(callback); }
	void setOnError(OnErrorCallback callback) { onError_ = std::move(callback); }

	void clearCallbacks()
	{
		onStream_ = nullptr;
		onClosed_ = nullptr;
		onError_ = nullptr;
	}

protected:
	void notifyStream(std::shared_ptr<MediaStream> stream)
	{
		auto cb = onStream_;
		if (cb) {
			cb(std::move(stream));
		}
	}
	void notifyClosed()
	{
		auto cb = onClosed_;
		if (cb) {
			cb();
		}
	}
	void notifyError(const std::string &error)
	{
		auto cb = onError_;
		if (cb) {
			cb(error);
		}
	}

private:
	OnStreamCallback onStream_;
	OnClosedCallback onClosed_;
	OnErrorCallback onError_;
};

class Transport
{
public:
	using OnRegisteredCallback = std::function<void(const std::string &id)>;
	using OnIncomingControlCallback = std::function<void(std::shared_ptr<ControlChannel> channel)>;
	using OnIncomingMediaCallback = std::function<void(std::shared_ptr<MediaChannel> channel)>;
	using OnSessionErrorCallback =
	    std::function<void(TransportErrorKind kind, const std::string &peerId, const std::string &message)>;

	virtual ~Transport() = default;

	// Claim an id with the broker. Completion is reported through the registered callback.
	virtual bool registerSelf(const std::string &id) = 0;
	virtual void unregister() = 0;
	virtual bool isRegistered() const = 0;

	virtual std::shared_ptr<ControlChannel> openControlChannel(const std::string &peerId) = 0;
	virtual std::shared_ptr<MediaChannel> openMediaChannel(const std::string &peerId,
	                                                       std::shared_ptr<MediaStream> localStream,
	                                                       const MediaChannelOptions &options) = 0;

	// Restart connectivity with a peer. Its camera channels are closed; control and screen channels stay.
	// With forceRelay set, later channels to it use TURN only.
	virtual void restartSession(const std::string &peerId, bool forceRelay) = 0;

	void setOnRegistered(OnRegisteredCallback callback) { onRegistered_ = std::move(callback); }
	void setOnIncomingControlChannel(OnIncomingControlCallback callback) { onIncomingControl_ = std::move(callback); }
	void setOnIncomingMediaChannel(OnIncomingMediaCallback callback) { onIncomingMedia_ = std::move(callback); }
	void setOnSessionError(OnSessionErrorCallback callback) { onSessionError_ = std::move(callback); }

protected:
	OnRegisteredCallback onRegistered_;
	OnIncomingControlCallback onIncomingControl_;
	OnIncomingMediaCallback onIncomingMedia_;
	OnSessionErrorCallback onSessionError_;
};

} // namespace peermesh
