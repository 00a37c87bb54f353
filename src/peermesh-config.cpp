/*
 * PeerMesh
 * Session settings and configuration loading
 */

#include "peermesh-config.h"

#include <fstream>
#include <functional>
#include <sstream>

#include "peermesh-utils.h"

namespace peermesh
{

namespace
{

using SettingSetter = std::function<bool(SessionSettings &, const std::string &)>;

struct SettingField {
	const char *key;
	SettingSetter apply;
};

bool parseBoolValue(const std::string &value, bool &out)
{
	const std::string lowered = asciiLower(trim(value));
	if (lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "on") {
		out = true;
		return true;
	}
	if (lowered == "false" || lowered == "0" || lowered == "no" || lowered == "off") {
		out = false;
		return true;
	}
	return false;
}

bool parseInt64Value(const std::string &value, int64_t &out)
{
	try {
		size_t consumed = 0;
		const std::string trimmed = trim(value);
		const long long parsed = std::stoll(trimmed, &consumed);
		if (consumed != trimmed.size() || parsed < 0) {
			return false;
		}
		out = static_cast<int64_t>(parsed);
		return true;
	} catch (const std::exception &) {
		return false;
	}
}

SettingSetter stringField(std::string SessionSettings::*member)
{
	return [member](SessionSettings &settings, const std::string &value) {
		settings.*member = value;
		return true;
	};
}

SettingSetter boolField(bool SessionSettings::*member)
{
	return [member](SessionSettings &settings, const std::string &value) {
		return parseBoolValue(value, settings.*member);
	};
}

SettingSetter timingMs(int64_t Timing::*member)
{
	return [member](SessionSettings &settings, const std::string &value) {
		return parseInt64Value(value, settings.timing.*member);
	};
}

SettingSetter timingCount(int Timing::*member)
{
	return [member](SessionSettings &settings, const std::string &value) {
		int64_t parsed = 0;
		if (!parseInt64Value(value, parsed) || parsed > 1000) {
			return false;
		}
		settings.timing.*member = static_cast<int>(parsed);
		return true;
	};
}

std::string iceServersFromJsonValue(const std::string &raw)
{
	if (raw.empty() || raw[0] != '[') {
		return raw;
	}

	// Arrays of entries are folded into the ';' separated text form
	JsonParser wrapper("{\"v\":" + raw + "}");
	std::string joined;
	for (const auto &entry : wrapper.getArray("v")) {
		std::string line = entry;
		if (!entry.empty() && entry[0] == '{') {
			JsonParser object(entry);
			line = object.getString("urls", object.getString("url"));
			if (object.hasKey("username")) {
				line += "|" + object.getString("username") + "|" + object.getString("credential");
			}
		}
		if (!joined.empty()) {
			joined += ";";
		}
		joined += line;
	}
	return joined;
}

const std::vector<SettingField> &settingFields()
{
	static const std::vector<SettingField> fields = {
	    {"room", stringField(&SessionSettings::roomId)},
	    {"username", stringField(&SessionSettings::username)},
	    {"creator", boolField(&SessionSettings::isCreator)},
	    {"signaling_host", stringField(&SessionSettings::signalingHost)},
	    {"signaling_port",
	     [](SessionSettings &settings, const std::string &value) {
		     int64_t port = 0;
		     if (!parseInt64Value(value, port) || port == 0 || port > 65535) {
			     return false;
		     }
		     settings.signalingPort = static_cast<int>(port);
		     return true;
	     }},
	    {"signaling_path", stringField(&SessionSettings::signalingPath)},
	    {"signaling_key", stringField(&SessionSettings::signalingKey)},
	    {"signaling_secure", boolField(&SessionSettings::signalingSecure)},
	    {"ice_servers",
	     [](SessionSettings &settings, const std::string &value) {
		     settings.iceServers = parseIceServers(iceServersFromJsonValue(value));
		     return true;
	     }},
	    {"force_turn", boolField(&SessionSettings::forceTurn)},
	    {"topology",
	     [](SessionSettings &settings, const std::string &value) {
		     return parseTopology(asciiLower(trim(value)), settings.topology);
	     }},
	    {"transitions_enabled", boolField(&SessionSettings::transitionsEnabled)},
	    {"video", boolField(&SessionSettings::enableVideo)},
	    {"audio", boolField(&SessionSettings::enableAudio)},
	    {"recording_dir", stringField(&SessionSettings::recordingDirectory)},
	    {"join_retry_interval_ms", timingMs(&Timing::joinRetryIntervalMs)},
	    {"join_max_attempts", timingCount(&Timing::joinMaxAttempts)},
	    {"peer_list_broadcast_ms", timingMs(&Timing::peerListBroadcastMs)},
	    {"transition_settle_ms", timingMs(&Timing::transitionSettleMs)},
	    {"removal_delay_ms", timingMs(&Timing::removalDelayMs)},
	    {"media_recall_delay_ms", timingMs(&Timing::mediaRecallDelayMs)},
	    {"relay_after_failures", timingCount(&Timing::relayAfterFailures)},
	    {"max_media_recalls", timingCount(&Timing::maxMediaRecalls)},
	    {"control_reconnect_delay_ms", timingMs(&Timing::controlReconnectDelayMs)},
	    {"control_reconnect_max_attempts", timingCount(&Timing::controlReconnectMaxAttempts)},
	    {"newcomer_screen_delay_ms", timingMs(&Timing::newcomerScreenDelayMs)},
	    {"share_notify_delay_ms", timingMs(&Timing::shareNotifyDelayMs)},
	    {"screen_call_stagger_ms", timingMs(&Timing::screenCallStaggerMs)},
	    {"stop_share_repair_delay_ms", timingMs(&Timing::stopShareRepairDelayMs)},
	    {"stop_share_repair_stagger_ms", timingMs(&Timing::stopShareRepairStaggerMs)},
	    {"screen_share_started_delay_ms", timingMs(&Timing::screenShareStartedDelayMs)},
	    {"full_reconnect_delay_ms", timingMs(&Timing::fullReconnectDelayMs)},
	    {"stream_update_urgent_delay_ms", timingMs(&Timing::streamUpdateUrgentDelayMs)},
	    {"stream_update_delay_ms", timingMs(&Timing::streamUpdateDelayMs)},
	    {"reconnect_after_share_delay_ms", timingMs(&Timing::reconnectAfterShareDelayMs)},
	    {"camera_restore_max_retries", timingCount(&Timing::cameraRestoreMaxRetries)},
	    {"camera_restore_retry_ms", timingMs(&Timing::cameraRestoreRetryMs)},
	    {"screen_recovery_max_attempts", timingCount(&Timing::screenRecoveryMaxAttempts)},
	    {"screen_recovery_cooldown_ms", timingMs(&Timing::screenRecoveryCooldownMs)},
	    {"activity_check_ms", timingMs(&Timing::activityCheckMs)},
	    {"inactivity_grace_ms", timingMs(&Timing::inactivityGraceMs)},
	    {"recording_chunk_ms", timingMs(&Timing::recordingChunkMs)},
	};
	return fields;
}

const SettingField *findField(const std::string &key)
{
	for (const auto &field : settingFields()) {
		if (key == field.key) {
			return &field;
		}
	}
	return nullptr;
}

} // namespace

bool applySettingsJson(const std::string &json, SessionSettings &settings, std::string *error)
{
	const std::string trimmed = trim(json);
	if (trimmed.empty() || trimmed[0] != '{') {
		if (error) {
			*error = "settings must be a JSON object";
		}
		return false;
	}

	try {
		JsonParser parser(trimmed);
		for (const auto &key : parser.keys()) {
			const SettingField *field = findField(key);
			if (!field) {
				logWarning("Ignoring unknown setting '%s'", key.c_str());
				continue;
			}
			if (!field->apply(settings, parser.getString(key))) {
				logWarning("Invalid value for setting '%s', keeping default", key.c_str());
			}
		}
	} catch (const std::exception &e) {
		if (error) {
			*error = e.what();
		}
		return false;
	}

	return true;
}

bool loadSettingsFile(const std::string &path, SessionSettings &settings, std::string *error)
{
	std::ifstream file(path);
	if (!file) {
		if (error) {
			*error = "cannot open " + path;
		}
		return false;
	}

	std::stringstream contents;
	contents << file.rdbuf();
	if (!applySettingsJson(contents.str(), settings, error)) {
		return false;
	}

	logInfo("Loaded settings from %s", path.c_str());
	return true;
}

bool applySettingsArgument(const std::string &argument, SessionSettings &settings, std::string *error)
{
	const size_t equalsPos = argument.find('=');
	if (equalsPos == std::string::npos || equalsPos == 0) {
		if (error) {
			*error = "expected key=value, got '" + argument + "'";
		}
		return false;
	}

	const std::string key = trim(argument.substr(0, equalsPos));
	const std::string value = argument.substr(equalsPos + 1);
	const SettingField *field = findField(key);
	if (!field) {
		if (error) {
			*error = "unknown setting '" + key + "'";
		}
		return false;
	}

	if (!field->apply(settings, value)) {
		if (error) {
			*error = "invalid value for '" + key + "'";
		}
		return false;
	}
	return true;
}

bool validateSettings(const SessionSettings &settings, std::string *error)
{
	if (sanitizeRoomId(settings.roomId).empty()) {
		if (error) {
			*error = "room id is required";
		}
		return false;
	}
	if (settings.signalingHost.empty()) {
		if (error) {
			*error = "signaling host is required";
		}
		return false;
	}
	if (settings.timing.joinMaxAttempts < 1) {
		if (error) {
			*error = "join_max_attempts must be at least 1";
		}
		return false;
	}
	return true;
}

} // namespace peermesh
