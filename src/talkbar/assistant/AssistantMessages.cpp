#include "talkbar/assistant/AssistantMessages.h"

#include "talkbar/assistant/ConfigManager.h"

namespace talkbar::assistant {

static std::string withDetail(const std::string& head, const std::string& detail) {
    if (detail.empty()) return head;
    return head + ": " + detail;
}

AssistantMessages AssistantMessages::fromConfig(const ConfigManager& cfg) {
    AssistantMessages m;
    m.listening = cfg.getString("messages.listening", m.listening);
    m.speakNow = cfg.getString("messages.speak_now", m.speakNow);
    m.thinking = cfg.getString("messages.thinking", m.thinking);
    m.answer = cfg.getString("messages.answer", m.answer);
    m.noSpeech = cfg.getString("messages.no_speech", m.noSpeech);
    m.noMicrophone = cfg.getString("messages.no_microphone", m.noMicrophone);
    m.micPermission = cfg.getString("messages.mic_permission", m.micPermission);
    m.sttFailed = cfg.getString("messages.stt_failed", m.sttFailed);
    m.llmUnreachable = cfg.getString("messages.llm_unreachable", m.llmUnreachable);
    m.llmTimeout = cfg.getString("messages.llm_timeout", m.llmTimeout);
    m.llmFailed = cfg.getString("messages.llm_failed", m.llmFailed);
    m.ttsFailed = cfg.getString("messages.tts_failed", m.ttsFailed);
    m.audioOutputFailed = cfg.getString("messages.audio_output_failed", m.audioOutputFailed);
    return m;
}

std::string AssistantMessages::forError(PipelineStage stage, const ErrorInfo& info) const {
    switch (stage) {
        case PipelineStage::Capture:
            switch (info.errorType) {
                case ErrorType::NoSpeech:
                case ErrorType::TimeoutError:
                    return noSpeech;
                case ErrorType::DeviceError:
                    return withDetail(noMicrophone, info.message);
                case ErrorType::PermissionDenied:
                    return micPermission;
                default:
                    return withDetail(sttFailed, info.message);
            }
        case PipelineStage::Inference:
            switch (info.errorType) {
                case ErrorType::NetworkError:
                    return llmUnreachable;
                case ErrorType::TimeoutError:
                    return llmTimeout;
                default:
                    return withDetail(llmFailed, info.message);
            }
        case PipelineStage::Playback:
            switch (info.errorType) {
                case ErrorType::AudioError:
                case ErrorType::DeviceError:
                    return withDetail(audioOutputFailed, info.message);
                default:
                    return withDetail(ttsFailed, info.message);
            }
    }
    return info.message;
}

} // namespace talkbar::assistant
