#pragma once

#include "talkbar/assistant/ErrorTypes.h"

#include <string>

namespace talkbar::assistant {

class ConfigManager;

/**
 * @brief 面向用户的状态/错误文案（默认泰语，可由 messages.* 覆盖）
 */
struct AssistantMessages {
    std::string listening{"กำลังฟัง…"};
    std::string speakNow{"กำลังฟัง… พูดได้เลย"};
    std::string thinking{"กำลังคิด…"};
    std::string answer{"คำตอบ:"};
    std::string noSpeech{"ไม่สามารถเข้าใจเสียงได้ — ลองพูดใหม่อีกครั้ง"};
    std::string noMicrophone{"ไม่พบไมโครโฟน"};
    std::string micPermission{"ไม่ได้รับอนุญาตให้ใช้ไมโครโฟน"};
    std::string sttFailed{"แปลงเสียงเป็นข้อความไม่สำเร็จ"};
    std::string llmUnreachable{"ไม่สามารถเชื่อมต่อ OpenClaw ได้ — ตรวจสอบว่าเซิร์ฟเวอร์ทำงานอยู่"};
    std::string llmTimeout{"OpenClaw ไม่ตอบสนองภายในเวลาที่กำหนด"};
    std::string llmFailed{"LLM Error"};
    std::string ttsFailed{"TTS Error"};
    std::string audioOutputFailed{"ไม่สามารถเล่นเสียงได้"};

    // 缺失或非字符串的键保留默认值
    static AssistantMessages fromConfig(const ConfigManager& cfg);

    // 按阶段 + 错误类型选择文案；通用类文案附带错误详情
    std::string forError(PipelineStage stage, const ErrorInfo& info) const;
};

} // namespace talkbar::assistant
