/*
 * PeerMesh
 * Utility function implementations
 */

#include "peermesh-utils.h"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <random>
#include <sstream>

namespace peermesh
{

namespace
{

bool startsWithInsensitive(const std::string &value, const char *prefix)
{
	size_t idx = 0;
	for (; prefix[idx] != '\0'; ++idx) {
		if (idx >= value.size()) {
			return false;
		}
		const char a = static_cast<char>(std::tolower(static_cast<unsigned char>(value[idx])));
		const char b = static_cast<char>(std::tolower(static_cast<unsigned char>(prefix[idx])));
		if (a != b) {
			return false;
		}
	}
	return true;
}

bool isIceUrl(const std::string &url)
{
	return startsWithInsensitive(url, "stun:") || startsWithInsensitive(url, "stuns:") ||
	       startsWithInsensitive(url, "turn:") || startsWithInsensitive(url, "turns:");
}

bool endsWith(const std::string &value, const std::string &suffix)
{
	return value.size() >= suffix.size() &&
	       value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

void logFormatted(spdlog::level::level_enum level, const char *format, va_list args)
{
	if (!spdlog::should_log(level)) {
		return;
	}
	char buffer[1024];
	vsnprintf(buffer, sizeof(buffer), format, args);
	spdlog::log(level, "{} {}", PEERMESH_LOG_PREFIX, buffer);
}

} // namespace

// Peer ids
std::string generateSessionId()
{
	static const char alphanum[] = "0123456789"
	                               "abcdefghijklmnopqrstuvwxyz";
	thread_local std::random_device rd;
	thread_local std::mt19937 gen(rd());
	thread_local std::uniform_int_distribution<> dis(0, sizeof(alphanum) - 2);

	std::string result;
	result.reserve(8);
	for (int i = 0; i < 8; i++) {
		result += alphanum[dis(gen)];
	}
	return result;
}

std::string sanitizeRoomId(const std::string &roomId)
{
	std::string result;
	result.reserve(roomId.size());

	// Keep case, replace each run of characters the broker rejects with '_'.
	std::string trimmed = trim(roomId);
	bool inInvalidRun = false;
	for (char c : trimmed) {
		if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-') {
			result += c;
			inInvalidRun = false;
		} else {
			if (!inInvalidRun) {
				result += '_';
				inInvalidRun = true;
			}
		}
	}

	if (result.size() > MAX_ROOM_ID_LENGTH) {
		result.resize(MAX_ROOM_ID_LENGTH);
	}

	return result;
}

std::string creatorIdForRoom(const std::string &roomId)
{
	return sanitizeRoomId(roomId) + CREATOR_SUFFIX;
}

std::string joinerIdForRoom(const std::string &roomId, int64_t epochMs)
{
	return sanitizeRoomId(roomId) + "-" + std::to_string(epochMs);
}

bool isCreatorId(const std::string &peerId)
{
	return endsWith(peerId, CREATOR_SUFFIX);
}

// JSON Builder implementation
std::string escapeJsonString(const std::string &value)
{
	std::string escaped;
	escaped.reserve(value.size() + 2);
	escaped += '"';
	for (char c : value) {
		switch (c) {
		case '"':
			escaped += "\\\"";
			break;
		case '\\':
			escaped += "\\\\";
			break;
		case '\b':
			escaped += "\\b";
			break;
		case '\f':
			escaped += "\\f";
			break;
		case '\n':
			escaped += "\\n";
			break;
		case '\r':
			escaped += "\\r";
			break;
		case '\t':
			escaped += "\\t";
			break;
		default:
			escaped += c;
			break;
		}
	}
	escaped += '"';
	return escaped;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const std::string &value)
{
	entries_.emplace_back(key, escapeJsonString(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const char *value)
{
	return add(key, std::string(value));
}

JsonBuilder &JsonBuilder::add(const std::string &key, int value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, int64_t value)
{
	entries_.emplace_back(key, std::to_string(value));
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, bool value)
{
	entries_.emplace_back(key, value ? "true" : "false");
	return *this;
}

JsonBuilder &JsonBuilder::add(const std::string &key, const std::vector<std::string> &values)
{
	std::string array = "[";
	for (size_t i = 0; i < values.size(); i++) {
		if (i > 0)
			array += ",";
		array += escapeJsonString(values[i]);
	}
	array += "]";
	entries_.emplace_back(key, array);
	return *this;
}

JsonBuilder &JsonBuilder::addRaw(const std::string &key, const std::string &rawJson)
{
	entries_.emplace_back(key, rawJson);
	return *this;
}

std::string JsonBuilder::build() const
{
	std::stringstream ss;
	ss << "{";
	for (size_t i = 0; i < entries_.size(); i++) {
		if (i > 0)
			ss << ",";
		ss << "\"" << entries_[i].first << "\":" << entries_[i].second;
	}
	ss << "}";
	return ss.str();
}

// JSON Parser implementation
JsonParser::JsonParser(const std::string &json) : json_(json)
{
	parse();
}

void JsonParser::parse()
{
	// Flat parser: top-level keys only, nested objects and arrays are kept raw
	size_t pos = 0;

	// Skip whitespace and opening brace
	while (pos < json_.size() && (std::isspace(static_cast<unsigned char>(json_[pos])) || json_[pos] == '{'))
		pos++;

	while (pos < json_.size() && json_[pos] != '}') {
		while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos])))
			pos++;

		if (pos >= json_.size() || json_[pos] != '"')
			break;
		pos++; // Skip opening quote

		std::string key;
		while (pos < json_.size() && json_[pos] != '"') {
			key += json_[pos++];
		}
		pos++; // Skip closing quote

		while (pos < json_.size() && json_[pos] != ':')
			pos++;
		pos++; // Skip colon

		while (pos < json_.size() && std::isspace(static_cast<unsigned char>(json_[pos])))
			pos++;

		if (pos >= json_.size())
			break;

		std::string value = extractValue(pos);
		values_[key] = value;

		// Skip comma and whitespace
		while (pos < json_.size() && (std::isspace(static_cast<unsigned char>(json_[pos])) || json_[pos] == ','))
			pos++;
	}
}

std::string JsonParser::extractValue(size_t &pos) const
{
	std::string value;

	if (json_[pos] == '"') {
		pos++; // Skip opening quote
		while (pos < json_.size() && json_[pos] != '"') {
			if (json_[pos] == '\\' && pos + 1 < json_.size()) {
				pos++;
				switch (json_[pos]) {
				case 'n':
					value += '\n';
					break;
				case 'r':
					value += '\r';
					break;
				case 't':
					value += '\t';
					break;
				case 'b':
					value += '\b';
					break;
				case 'f':
					value += '\f';
					break;
				case '"':
					value += '"';
					break;
				case '\\':
					value += '\\';
					break;
				default:
					value += json_[pos];
					break;
				}
			} else {
				value += json_[pos];
			}
			pos++;
		}
		pos++; // Skip closing quote
	} else if (json_[pos] == '{' || json_[pos] == '[') {
		// Object or array - capture the whole thing, ignoring brackets inside strings
		const char open = json_[pos];
		const char close = open == '{' ? '}' : ']';
		int depth = 1;
		bool inString = false;
		value += json_[pos++];
		while (pos < json_.size() && depth > 0) {
			const char c = json_[pos];
			if (inString) {
				if (c == '\\' && pos + 1 < json_.size()) {
					value += c;
					value += json_[++pos];
					pos++;
					continue;
				}
				if (c == '"')
					inString = false;
			} else if (c == '"') {
				inString = true;
			} else if (c == open) {
				depth++;
			} else if (c == close) {
				depth--;
			}
			value += c;
			pos++;
		}
	} else {
		// Number, boolean, or null
		while (pos < json_.size() && json_[pos] != ',' && json_[pos] != '}' &&
		       !std::isspace(static_cast<unsigned char>(json_[pos]))) {
			value += json_[pos++];
		}
	}

	return value;
}

bool JsonParser::hasKey(const std::string &key) const
{
	return values_.find(key) != values_.end();
}

std::string JsonParser::getString(const std::string &key, const std::string &defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second;
	}
	return defaultValue;
}

int JsonParser::getInt(const std::string &key, int defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		try {
			return std::stoi(it->second);
		} catch (const std::exception &) {
			return defaultValue;
		}
	}
	return defaultValue;
}

int64_t JsonParser::getInt64(const std::string &key, int64_t defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		try {
			return std::stoll(it->second);
		} catch (const std::exception &) {
			return defaultValue;
		}
	}
	return defaultValue;
}

bool JsonParser::getBool(const std::string &key, bool defaultValue) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second == "true";
	}
	return defaultValue;
}

std::string JsonParser::getRaw(const std::string &key) const
{
	auto it = values_.find(key);
	if (it != values_.end()) {
		return it->second;
	}
	return "";
}

std::string JsonParser::getObject(const std::string &key) const
{
	return getRaw(key);
}

std::vector<std::string> JsonParser::getArray(const std::string &key) const
{
	std::vector<std::string> result;
	std::string arr = getRaw(key);

	if (arr.empty() || arr[0] != '[')
		return result;

	size_t pos = 1;
	while (pos < arr.size() && arr[pos] != ']') {
		while (pos < arr.size() && std::isspace(static_cast<unsigned char>(arr[pos])))
			pos++;

		if (pos >= arr.size() || arr[pos] == ']')
			break;

		std::string value;
		if (arr[pos] == '"') {
			pos++;
			while (pos < arr.size() && arr[pos] != '"') {
				if (arr[pos] == '\\' && pos + 1 < arr.size()) {
					pos++;
				}
				value += arr[pos++];
			}
			pos++;
		} else if (arr[pos] == '{') {
			int depth = 1;
			value += arr[pos++];
			while (pos < arr.size() && depth > 0) {
				if (arr[pos] == '{')
					depth++;
				else if (arr[pos] == '}')
					depth--;
				value += arr[pos++];
			}
		} else {
			while (pos < arr.size() && arr[pos] != ',' && arr[pos] != ']') {
				value += arr[pos++];
			}
			value = trim(value);
		}

		if (!value.empty()) {
			result.push_back(value);
		}

		while (pos < arr.size() && (std::isspace(static_cast<unsigned char>(arr[pos])) || arr[pos] == ','))
			pos++;
	}

	return result;
}

std::vector<std::string> JsonParser::keys() const
{
	std::vector<std::string> result;
	result.reserve(values_.size());
	for (const auto &pair : values_) {
		result.push_back(pair.first);
	}
	return result;
}

// String utilities
std::string trim(const std::string &str)
{
	size_t start = str.find_first_not_of(" \t\r\n");
	if (start == std::string::npos)
		return "";
	size_t end = str.find_last_not_of(" \t\r\n");
	return str.substr(start, end - start + 1);
}

std::vector<std::string> split(const std::string &str, char delimiter)
{
	std::vector<std::string> result;
	if (str.empty()) {
		result.push_back("");
		return result;
	}
	std::stringstream ss(str);
	std::string item;
	while (std::getline(ss, item, delimiter)) {
		result.push_back(item);
	}
	return result;
}

std::string asciiLower(std::string value)
{
	std::transform(value.begin(), value.end(), value.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return value;
}

std::vector<IceServer> parseIceServers(const std::string &config)
{
	std::vector<IceServer> servers;
	std::stringstream lines(config);
	std::string rawLine;

	auto parseEntry = [&](const std::string &entryValue) {
		std::string line = trim(entryValue);
		if (line.empty() || startsWithInsensitive(line, "#") || startsWithInsensitive(line, "//")) {
			return;
		}

		IceServer server;

		const char separator = line.find('|') != std::string::npos   ? '|'
		                       : line.find(',') != std::string::npos ? ','
		                                                             : '\0';
		if (separator != '\0') {
			const std::vector<std::string> parts = split(line, separator);
			if (!parts.empty()) {
				server.urls = parts[0];
			}
			if (parts.size() > 1) {
				server.username = parts[1];
			}
			if (parts.size() > 2) {
				server.credential = parts[2];
			}
		} else {
			std::stringstream tokenStream(line);
			std::string token;
			std::vector<std::string> tokens;
			while (tokenStream >> token) {
				tokens.push_back(token);
			}

			if (!tokens.empty()) {
				server.urls = tokens[0];
			}

			for (size_t i = 1; i < tokens.size(); ++i) {
				const std::string &value = tokens[i];
				const size_t equalsPos = value.find('=');
				if (equalsPos != std::string::npos) {
					const std::string key = asciiLower(value.substr(0, equalsPos));
					const std::string mapped = value.substr(equalsPos + 1);
					if (key == "username" || key == "user") {
						server.username = mapped;
						continue;
					}
					if (key == "credential" || key == "password" || key == "pass") {
						server.credential = mapped;
						continue;
					}
				}

				if (server.username.empty()) {
					server.username = value;
				} else if (server.credential.empty()) {
					server.credential = value;
				}
			}
		}

		server.urls = trim(server.urls);
		server.username = trim(server.username);
		server.credential = trim(server.credential);
		if (!server.urls.empty() && isIceUrl(server.urls)) {
			servers.push_back(std::move(server));
		}
	};

	while (std::getline(lines, rawLine)) {
		const std::vector<std::string> entries = split(rawLine, ';');
		for (const auto &entry : entries) {
			parseEntry(entry);
		}
	}

	return servers;
}

// Time utilities
int64_t currentTimeMs()
{
	using namespace std::chrono;
	return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

std::string formatIsoTimestamp(int64_t ms)
{
	time_t seconds = ms / 1000;
	struct tm timeinfo;
#ifdef _WIN32
	gmtime_s(&timeinfo, &seconds);
#else
	gmtime_r(&seconds, &timeinfo);
#endif
	// File-name safe variant of ISO 8601
	char buffer[32];
	strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H-%M-%SZ", &timeinfo);
	return std::string(buffer);
}

std::string formatDuration(int64_t ms)
{
	const int64_t totalSeconds = ms < 0 ? 0 : ms / 1000;
	char buffer[32];
	snprintf(buffer, sizeof(buffer), "%02lld:%02lld", static_cast<long long>(totalSeconds / 60),
	         static_cast<long long>(totalSeconds % 60));
	return std::string(buffer);
}

// Logging
void setLogLevel(LogLevel level)
{
	switch (level) {
	case LogLevel::Debug:
		spdlog::set_level(spdlog::level::debug);
		break;
	case LogLevel::Info:
		spdlog::set_level(spdlog::level::info);
		break;
	case LogLevel::Warning:
		spdlog::set_level(spdlog::level::warn);
		break;
	case LogLevel::Error:
		spdlog::set_level(spdlog::level::err);
		break;
	}
}

void logInfo(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logFormatted(spdlog::level::info, format, args);
	va_end(args);
}

void logWarning(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logFormatted(spdlog::level::warn, format, args);
	va_end(args);
}

void logError(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logFormatted(spdlog::level::err, format, args);
	va_end(args);
}

void logDebug(const char *format, ...)
{
	va_list args;
	va_start(args, format);
	logFormatted(spdlog::level::debug, format, args);
	va_end(args);
}

} // namespace peermesh
