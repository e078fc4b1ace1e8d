#ifndef SESSIONCONFIG
#define SESSIONCONFIG

#include <optional>
#include <string>
#include <vector>

enum class ResponseModality {
    AUDIO,
    TEXT
};

const char* responseModalityName(ResponseModality modality);
// accepts "AUDIO"/"TEXT" in any case
bool parseResponseModality(const std::string& name, ResponseModality& modality);

#define DEFAULT_VOICE "Puck"
#define DEFAULT_SYSTEM_INSTRUCTION "You are a helpful assistant and answer in a friendly tone."

// partial update: only the fields that are set get applied
struct SessionConfigUpdate {
    std::optional<std::string> voice_name;
    std::optional<std::string> system_instruction;
    std::optional<ResponseModality> response_modality;

    bool empty() const {
        return !voice_name && !system_instruction && !response_modality;
    }
};

struct SessionConfig {
    std::string voice_name = DEFAULT_VOICE;
    std::string system_instruction = DEFAULT_SYSTEM_INSTRUCTION;
    ResponseModality response_modality = ResponseModality::AUDIO;

    void merge(const SessionConfigUpdate& update);
    std::string describe() const;

    static const std::vector<std::string>& knownVoices();
    static bool isKnownVoice(const std::string& voice);
};

bool operator==(const SessionConfig& lhs, const SessionConfig& rhs);
bool operator!=(const SessionConfig& lhs, const SessionConfig& rhs);

#endif
