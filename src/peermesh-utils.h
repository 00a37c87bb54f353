/*
 * PeerMesh
 * Utility functions
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "peermesh-common.h"

namespace peermesh
{

// Peer ids
std::string generateSessionId();
std::string sanitizeRoomId(const std::string &roomId);
std::string creatorIdForRoom(const std::string &roomId);
std::string joinerIdForRoom(const std::string &roomId, int64_t epochMs);
bool isCreatorId(const std::string &peerId);

// JSON helpers (minimal implementation for signaling and control messages)
class JsonBuilder
{
public:
	JsonBuilder &add(const std::string &key, const std::string &value);
	JsonBuilder &add(const std::string &key, const char *value);
	JsonBuilder &add(const std::string &key, int value);
	JsonBuilder &add(const std::string &key, int64_t value);
	JsonBuilder &add(const std::string &key, bool value);
	JsonBuilder &add(const std::string &key, const std::vector<std::string> &values);
	JsonBuilder &addRaw(const std::string &key, const std::string &rawJson);
	std::string build() const;

private:
	std::vector<std::pair<std::string, std::string>> entries_;
};

class JsonParser
{
public:
	explicit JsonParser(const std::string &json);

	bool hasKey(const std::string &key) const;
	std::string getString(const std::string &key, const std::string &defaultValue = "") const;
	int getInt(const std::string &key, int defaultValue = 0) const;
	int64_t getInt64(const std::string &key, int64_t defaultValue = 0) const;
	bool getBool(const std::string &key, bool defaultValue = false) const;
	std::string getRaw(const std::string &key) const;
	std::string getObject(const std::string &key) const;
	std::vector<std::string> getArray(const std::string &key) const;
	std::vector<std::string> keys() const;

private:
	void parse();
	std::string extractValue(size_t &pos) const;

	std::string json_;
	std::map<std::string, std::string> values_;
};

std::string escapeJsonString(const std::string &value);

// String utilities
std::string trim(const std::string &str);
std::vector<std::string> split(const std::string &str, char delimiter);
std::string asciiLower(std::string value);

// Parse ICE servers from "url|user|pass", "url,user,pass" or "url user=... credential=..." entries
std::vector<IceServer> parseIceServers(const std::string &config);

// Time utilities
int64_t currentTimeMs();
std::string formatIsoTimestamp(int64_t ms);
std::string formatDuration(int64_t ms);

// Logging
enum class LogLevel { Debug, Info, Warning, Error };

void setLogLevel(LogLevel level);
void logInfo(const char *format, ...);
void logWarning(const char *format, ...);
void logError(const char *format, ...);
void logDebug(const char *format, ...);

} // namespace peermesh
