#include "SessionConfig.hpp"

#include <algorithm>
#include <cctype>

const char* responseModalityName(ResponseModality modality){
    switch(modality){
        case ResponseModality::AUDIO:
            return "AUDIO";
        case ResponseModality::TEXT:
            return "TEXT";
    }
    return "AUDIO";
}

bool parseResponseModality(const std::string& name, ResponseModality& modality){
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return std::toupper(c); });
    if(upper == "AUDIO"){
        modality = ResponseModality::AUDIO;
        return true;
    }
    if(upper == "TEXT"){
        modality = ResponseModality::TEXT;
        return true;
    }
    return false;
}

void SessionConfig::merge(const SessionConfigUpdate& update){
    if(update.voice_name){
        voice_name = *update.voice_name;
    }
    if(update.system_instruction){
        system_instruction = *update.system_instruction;
    }
    if(update.response_modality){
        response_modality = *update.response_modality;
    }
}

std::string SessionConfig::describe() const {
    return "voice=" + voice_name + ", mode=" + responseModalityName(response_modality);
}

const std::vector<std::string>& SessionConfig::knownVoices(){
    static const std::vector<std::string> voices = {"Aoede", "Charon", "Fenrir", "Kore", "Puck"};
    return voices;
}

bool SessionConfig::isKnownVoice(const std::string& voice){
    const std::vector<std::string>& voices = knownVoices();
    return std::find(voices.begin(), voices.end(), voice) != voices.end();
}

bool operator==(const SessionConfig& lhs, const SessionConfig& rhs){
    return lhs.voice_name == rhs.voice_name
        && lhs.system_instruction == rhs.system_instruction
        && lhs.response_modality == rhs.response_modality;
}

bool operator!=(const SessionConfig& lhs, const SessionConfig& rhs){
    return !(lhs == rhs);
}
