#include "talkbar/assistant/ConfigManager.h"

#include "talkbar/assistant/ErrorHandler.h"
#include "talkbar/assistant/utils/StringUtils.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace talkbar::assistant {

ConfigManager::ConfigManager()
    : m_cfg(makeDefaultConfig())
{}

bool ConfigManager::loadFromFile(const std::string& path, ErrorInfo* err) {
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_cfg = makeDefaultConfig();
            applyEnvMappingOverrides(m_cfg);
            replaceEnvPlaceholdersRecursive(m_cfg);
        }

        // 落盘的是模板，保留 ${TALKBAR_API_KEY} 占位符
        ErrorInfo saveErr;
        const bool saved = saveToFile(path, &saveErr);

        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 0;
            err->message = "Config file not found, using default config and auto-created template: " + path;
            err->details = nlohmann::json{
                {"path", path},
                {"fallback", "default_config"},
                {"auto_created", saved}
            };
            if (!saved) (*err->details)["auto_create_failed"] = saveErr.toJson();
        }
        return true;
    }

    std::stringstream buffer;
    buffer << ifs.rdbuf();
    return loadFromString(buffer.str(), err);
}

bool ConfigManager::loadFromString(const std::string& jsonText, ErrorInfo* err) {
    nlohmann::json parsed;
    try {
        parsed = nlohmann::json::parse(jsonText);
    } catch (const nlohmann::json::parse_error& e) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = std::string("Config JSON parse failed: ") + e.what();
            err->details = nlohmann::json{{"snippet", jsonText.substr(0, 256)}};
        }
        return false;
    }

    if (!parsed.is_object()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Config root must be a JSON object";
        }
        return false;
    }

    // 用户文件只需写要改的键，其余沿用默认值
    mergeDefaults(parsed, makeDefaultConfig());
    applyEnvMappingOverrides(parsed);
    replaceEnvPlaceholdersRecursive(parsed);

    {
        std::lock_guard<std::mutex> lk(m_mu);
        m_cfg = std::move(parsed);
    }
    return true;
}

nlohmann::json ConfigManager::getRaw() const {
    std::lock_guard<std::mutex> lk(m_mu);
    return m_cfg;
}

bool ConfigManager::saveToFile(const std::string& path, ErrorInfo* err) const {
    const std::filesystem::path p(path);
    const auto parent = p.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec && !std::filesystem::exists(parent)) {
            if (err) {
                err->errorType = ErrorType::UnknownError;
                err->errorCode = 1;
                err->message = "Failed to create config directory: " + parent.string();
                err->details = nlohmann::json{{"path", path}, {"ec", ec.value()}, {"what", ec.message()}};
            }
            return false;
        }
    }

    std::ofstream ofs(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 2;
            err->message = "Failed to open config file for write: " + path;
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }

    ofs << makeDefaultConfig().dump(2) << "\n";
    ofs.flush();
    if (!ofs) {
        if (err) {
            err->errorType = ErrorType::UnknownError;
            err->errorCode = 3;
            err->message = "Failed to write config file: " + path;
            err->details = nlohmann::json{{"path", path}};
        }
        return false;
    }
    return true;
}

std::optional<nlohmann::json> ConfigManager::get(const std::string& keyPath) const {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) return std::nullopt;

    std::lock_guard<std::mutex> lk(m_mu);
    const nlohmann::json* p = getPtrByPath(m_cfg, parts);
    if (!p) return std::nullopt;
    return std::optional<nlohmann::json>{*p};
}

std::string ConfigManager::getString(const std::string& keyPath, const std::string& fallback) const {
    auto v = get(keyPath);
    if (!v.has_value() || !v->is_string()) return fallback;
    return utils::trimCopy(v->get<std::string>());
}

int ConfigManager::getInt(const std::string& keyPath, int fallback) const {
    auto v = get(keyPath);
    if (!v.has_value()) return fallback;
    if (v->is_number_integer()) return v->get<int>();
    if (v->is_number()) return static_cast<int>(v->get<double>());
    return fallback;
}

double ConfigManager::getDouble(const std::string& keyPath, double fallback) const {
    auto v = get(keyPath);
    if (!v.has_value() || !v->is_number()) return fallback;
    return v->get<double>();
}

bool ConfigManager::set(const std::string& keyPath, const nlohmann::json& v, ErrorInfo* err) {
    const auto parts = splitKeyPath(keyPath);
    if (parts.empty()) {
        if (err) {
            err->errorType = ErrorType::InvalidRequest;
            err->errorCode = 0;
            err->message = "Empty keyPath";
        }
        return false;
    }

    std::lock_guard<std::mutex> lk(m_mu);
    nlohmann::json* p = getOrCreatePtrByPath(m_cfg, parts);
    *p = v;
    return true;
}

void ConfigManager::applyEnvironmentOverrides() {
    std::lock_guard<std::mutex> lk(m_mu);
    applyEnvMappingOverrides(m_cfg);
    replaceEnvPlaceholdersRecursive(m_cfg);
}

std::vector<std::string> ConfigManager::validate() const {
    return validateJson(getRaw());
}

nlohmann::json ConfigManager::makeDefaultConfig() {
    nlohmann::json j;
    j["_comment"] = "talkbar voice assistant config (auto-generated). JSON has no comments; use _comment fields.";
    j["assistant"] = {
        {"_comment", "auto_hide_ms: overlay hides this long after a session finishes or fails."},
        {"auto_hide_ms", 5000}
    };
    j["llm"] = {
        {"_comment", "OpenAI-compatible chat endpoint. api_key is recommended to be injected via env var."},
        {"base_url", "http://localhost:4000/v1"},
        {"api_key", "${TALKBAR_API_KEY}"},
        {"model", "openclaw"},
        {"timeout_ms", 60000},
        {"max_retries", 1},
        {"temperature", 0.7},
        {"max_tokens", 1024},
        {"system_prompt", ""},
        {"history_messages", 40}
    };
    j["stt"] = {
        {"_comment", "Speech-to-Text via /audio/transcriptions. Empty base_url/api_key fall back to llm.*"},
        {"base_url", ""},
        {"api_key", ""},
        {"model", "whisper-1"},
        {"language", "th"},
        {"timeout_ms", 30000},
        {"sample_rate", 16000},
        {"start_threshold_db", -41.0},
        {"start_hold_ms", 120},
        {"pause_ms", 1500},
        {"listen_timeout_ms", 10000},
        {"phrase_time_limit_ms", 30000},
        {"calibration_ms", 500}
    };
    j["tts"] = {
        {"_comment", "Text-to-Speech via /audio/speech. Empty base_url/api_key fall back to llm.*"},
        {"base_url", ""},
        {"api_key", ""},
        {"model", "tts-1"},
        {"voice", "th-TH-PremwadeeNeural"},
        {"response_format", "mp3"},
        {"speed", 1.0},
        {"timeout_ms", 30000},
        {"max_playback_ms", 180000}
    };
    j["messages"] = {
        {"_comment", "User-facing overlay text."},
        {"listening", "กำลังฟัง…"},
        {"speak_now", "กำลังฟัง… พูดได้เลย"},
        {"thinking", "กำลังคิด…"},
        {"answer", "คำตอบ:"},
        {"no_speech", "ไม่สามารถเข้าใจเสียงได้ — ลองพูดใหม่อีกครั้ง"},
        {"no_microphone", "ไม่พบไมโครโฟน"},
        {"mic_permission", "ไม่ได้รับอนุญาตให้ใช้ไมโครโฟน"},
        {"stt_failed", "แปลงเสียงเป็นข้อความไม่สำเร็จ"},
        {"llm_unreachable", "ไม่สามารถเชื่อมต่อ OpenClaw ได้ — ตรวจสอบว่าเซิร์ฟเวอร์ทำงานอยู่"},
        {"llm_timeout", "OpenClaw ไม่ตอบสนองภายในเวลาที่กำหนด"},
        {"llm_failed", "LLM Error"},
        {"tts_failed", "TTS Error"},
        {"audio_output_failed", "ไม่สามารถเล่นเสียงได้"}
    };
    j["logging"] = {
        {"min_level", "info"},
        {"file", "logs/assistant.log"}
    };
    return j;
}

std::string ConfigManager::redactSensitive(const std::string& keyPath, const std::string& value) {
    if (!isSensitiveKeyPath(keyPath)) return value;
    const auto v = utils::trimCopy(value);
    if (v.size() <= 8) return "******";
    return v.substr(0, 2) + "******" + v.substr(v.size() - 2);
}

bool ConfigManager::looksLikeEnvPlaceholder(const std::string& s) {
    const auto pos = s.find("${");
    return pos != std::string::npos && s.find('}', pos) != std::string::npos;
}

std::optional<std::string> ConfigManager::getEnv(const std::string& name) {
    if (name.empty()) return std::nullopt;
#if defined(_WIN32)
    // MSVC: getenv 会触发 C4996，改用 _dupenv_s
    char* buf = nullptr;
    size_t len = 0;
    if (_dupenv_s(&buf, &len, name.c_str()) != 0 || !buf) return std::nullopt;
    std::string s = buf;
    std::free(buf);
#else
    const char* v = std::getenv(name.c_str());
    if (!v) return std::nullopt;
    std::string s = v;
#endif
    if (s.empty()) return std::nullopt;
    return s;
}

bool ConfigManager::isSensitiveKeyPath(const std::string& keyPath) {
    std::string low = keyPath;
    std::transform(low.begin(), low.end(), low.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return low.find("api_key") != std::string::npos || low.find("apikey") != std::string::npos || low.find("secret") != std::string::npos;
}

std::vector<std::string> ConfigManager::splitKeyPath(const std::string& keyPath) {
    std::vector<std::string> parts;
    std::string cur;
    for (char c : keyPath) {
        if (c == '.') {
            if (!cur.empty()) parts.push_back(cur);
            cur.clear();
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) parts.push_back(cur);
    return parts;
}

const nlohmann::json* ConfigManager::getPtrByPath(const nlohmann::json& root, const std::vector<std::string>& parts) {
    const nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) return nullptr;
        auto it = p->find(k);
        if (it == p->end()) return nullptr;
        p = &(*it);
    }
    return p;
}

nlohmann::json* ConfigManager::getOrCreatePtrByPath(nlohmann::json& root, const std::vector<std::string>& parts) {
    nlohmann::json* p = &root;
    for (const auto& k : parts) {
        if (!p->is_object()) {
            *p = nlohmann::json::object();
        }
        p = &((*p)[k]);
    }
    return p;
}

void ConfigManager::mergeDefaults(nlohmann::json& target, const nlohmann::json& defaults) {
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        auto found = target.find(it.key());
        if (found == target.end()) {
            target[it.key()] = it.value();
        } else if (found->is_object() && it.value().is_object()) {
            mergeDefaults(*found, it.value());
        }
    }
}

void ConfigManager::applyEnvMappingOverrides(nlohmann::json& root) {
    // 固定映射：env -> keyPath
    struct MapItem {
        const char* env;
        const char* keyPath;
        bool integer;
    };
    const MapItem mapping[] = {
        {"TALKBAR_API_KEY", "llm.api_key", false},
        {"TALKBAR_LLM_BASE_URL", "llm.base_url", false},
        {"TALKBAR_LLM_MODEL", "llm.model", false},
        {"TALKBAR_STT_BASE_URL", "stt.base_url", false},
        {"TALKBAR_TTS_BASE_URL", "tts.base_url", false},
        {"TALKBAR_AUTO_HIDE_MS", "assistant.auto_hide_ms", true},
    };

    for (const auto& m : mapping) {
        auto v = getEnv(m.env);
        if (!v.has_value()) continue;
        const auto val = utils::trimCopy(v.value());
        if (val.empty()) continue;
        nlohmann::json* p = getOrCreatePtrByPath(root, splitKeyPath(m.keyPath));
        if (m.integer) {
            try {
                *p = std::stoll(val);
            } catch (const std::exception&) {
                // 保留字符串，交给 validate() 报告
                *p = val;
            }
        } else {
            *p = val;
        }
    }
}

void ConfigManager::replaceEnvPlaceholdersRecursive(nlohmann::json& node) {
    if (node.is_object()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            replaceEnvPlaceholdersRecursive(it.value());
        }
        return;
    }
    if (node.is_array()) {
        for (auto& v : node) {
            replaceEnvPlaceholdersRecursive(v);
        }
        return;
    }
    if (node.is_string()) {
        node = replaceEnvPlaceholdersInString(node.get<std::string>());
    }
}

std::string ConfigManager::replaceEnvPlaceholdersInString(const std::string& s) {
    // 替换 ${ENV_NAME}；未找到 env 时保留原样
    std::string out;
    out.reserve(s.size());

    for (size_t i = 0; i < s.size();) {
        if (i + 2 < s.size() && s[i] == '$' && s[i + 1] == '{') {
            const auto end = s.find('}', i + 2);
            if (end != std::string::npos) {
                const auto name = s.substr(i + 2, end - (i + 2));
                auto v = getEnv(name);
                if (v.has_value()) {
                    out += v.value();
                } else {
                    out += s.substr(i, end - i + 1);
                }
                i = end + 1;
                continue;
            }
        }
        out.push_back(s[i]);
        i++;
    }
    return out;
}

std::vector<std::string> ConfigManager::validateJson(const nlohmann::json& cfgCopy) {
    std::vector<std::string> out;

    auto checkIntRange = [&](const nlohmann::json& parent, const char* key, const std::string& path,
                             long long lo, long long hi) {
        if (!parent.contains(key)) return;
        const auto& v = parent.at(key);
        if (!v.is_number_integer()) {
            out.push_back("Invalid '" + path + "' (integer required)");
            return;
        }
        const auto n = v.get<long long>();
        if (n < lo || n > hi) {
            out.push_back("Invalid '" + path + "' (range " + std::to_string(lo) + ".." + std::to_string(hi) + ")");
        }
    };

    auto checkUrl = [&](const nlohmann::json& parent, const std::string& path, bool required) {
        if (!parent.contains("base_url") || !parent.at("base_url").is_string()) {
            out.push_back("Missing or invalid '" + path + "' (string required)");
            return;
        }
        const auto url = utils::trimCopy(parent.at("base_url").get<std::string>());
        if (url.empty()) {
            if (required) out.push_back("Invalid '" + path + "' (empty)");
            return;
        }
        if (!(startsWith(url, "http://") || startsWith(url, "https://"))) {
            out.push_back("Invalid '" + path + "' (must start with http:// or https://)");
        }
    };

    // assistant
    if (!cfgCopy.contains("assistant") || !cfgCopy["assistant"].is_object()) {
        out.push_back("Missing or invalid 'assistant' object");
    } else {
        checkIntRange(cfgCopy["assistant"], "auto_hide_ms", "assistant.auto_hide_ms", 0, 600000);
    }

    // llm
    if (!cfgCopy.contains("llm") || !cfgCopy["llm"].is_object()) {
        out.push_back("Missing or invalid 'llm' object");
        return out;
    }
    const auto& llm = cfgCopy["llm"];
    checkUrl(llm, "llm.base_url", true);

    if (!llm.contains("model") || !llm["model"].is_string() || utils::trimCopy(llm["model"].get<std::string>()).empty()) {
        out.push_back("Missing or invalid 'llm.model' (non-empty string required)");
    }

    if (llm.contains("api_key")) {
        if (!llm["api_key"].is_string()) {
            out.push_back("Invalid 'llm.api_key' (string required)");
        } else {
            const auto key = utils::trimCopy(llm["api_key"].get<std::string>());
            // 本地代理通常不需要 key，仅警告
            if (looksLikeEnvPlaceholder(key)) {
                out.push_back("WARN: 'llm.api_key' has unresolved env placeholder: " + redactSensitive("llm.api_key", key));
            }
        }
    }

    checkIntRange(llm, "timeout_ms", "llm.timeout_ms", 1, 300000);
    checkIntRange(llm, "max_retries", "llm.max_retries", 0, 5);
    checkIntRange(llm, "max_tokens", "llm.max_tokens", 1, 32768);
    checkIntRange(llm, "history_messages", "llm.history_messages", 0, 1000);
    if (llm.contains("history_messages") && llm["history_messages"].is_number_integer() &&
        llm["history_messages"].get<long long>() % 2 != 0) {
        out.push_back("WARN: 'llm.history_messages' is odd; history is kept in user/assistant pairs");
    }
    if (llm.contains("temperature")) {
        if (!llm["temperature"].is_number()) {
            out.push_back("Invalid 'llm.temperature' (number required)");
        } else {
            const auto t = llm["temperature"].get<double>();
            if (t < 0.0 || t > 2.0) out.push_back("Invalid 'llm.temperature' (range 0..2)");
        }
    }

    // stt / tts
    for (const char* section : {"stt", "tts"}) {
        const std::string name(section);
        if (!cfgCopy.contains(name)) continue;
        if (!cfgCopy[name].is_object()) {
            out.push_back("Invalid '" + name + "' (object required)");
            continue;
        }
        checkUrl(cfgCopy[name], name + ".base_url", false);
        checkIntRange(cfgCopy[name], "timeout_ms", name + ".timeout_ms", 1, 300000);
    }
    if (cfgCopy.contains("stt") && cfgCopy["stt"].is_object()) {
        const auto& stt = cfgCopy["stt"];
        checkIntRange(stt, "pause_ms", "stt.pause_ms", 100, 10000);
        checkIntRange(stt, "listen_timeout_ms", "stt.listen_timeout_ms", 500, 120000);
        checkIntRange(stt, "phrase_time_limit_ms", "stt.phrase_time_limit_ms", 1000, 120000);
        checkIntRange(stt, "sample_rate", "stt.sample_rate", 8000, 48000);
    }

    // logging
    if (cfgCopy.contains("logging") && cfgCopy["logging"].is_object()) {
        const auto& lg = cfgCopy["logging"];
        if (lg.contains("min_level")) {
            if (!lg["min_level"].is_string() || !ErrorHandler::parseLogLevel(lg["min_level"].get<std::string>()).has_value()) {
                out.push_back("Invalid 'logging.min_level' (error|warning|info|debug)");
            }
        }
    }

    return out;
}

bool ConfigManager::hasHardValidationErrors(const std::vector<std::string>& issues) {
    for (const auto& s : issues) {
        if (!startsWith(s, "WARN:")) return true;
    }
    return false;
}

bool ConfigManager::startsWith(const std::string& s, const std::string& prefix) {
    return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

} // namespace talkbar::assistant
