#include "GeminiProtocol.hpp"

#include <nlohmann/json.hpp>
extern "C"{
    #include <libavutil/base64.h>
}

using json = nlohmann::json;

std::string buildSetupMessage(const std::string& model, const SessionConfig& config){
    json generation_config = {
        {"responseModalities", json::array({responseModalityName(config.response_modality)})}
    };
    // a voice only means something when the answer is spoken
    if(config.response_modality == ResponseModality::AUDIO){
        generation_config["speechConfig"] = {
            {"voiceConfig", {
                {"prebuiltVoiceConfig", {{"voiceName", config.voice_name}}}
            }}
        };
    }

    json setup = {
        {"setup", {
            {"model", model},
            {"generationConfig", generation_config},
            {"systemInstruction", {
                {"parts", json::array({{{"text", config.system_instruction}}})}
            }}
        }}
    };
    return setup.dump();
}

std::string buildRealtimeInputMessage(const AudioChunk& chunk){
    json message = {
        {"realtimeInput", {
            {"mediaChunks", json::array({{
                {"mimeType", chunk.mime_type},
                {"data", base64Encode(chunk.data)}
            }})}
        }}
    };
    return message.dump();
}

std::string buildClientTextMessage(const std::string& text, bool end_of_turn){
    json message = {
        {"clientContent", {
            {"turns", json::array({{
                {"role", "user"},
                {"parts", json::array({{{"text", text}}})}
            }})},
            {"turnComplete", end_of_turn}
        }}
    };
    return message.dump();
}

bool isSetupComplete(const std::string& message){
    json j = json::parse(message, nullptr, false);
    return !j.is_discarded() && j.is_object() && j.contains("setupComplete");
}

bool parseServerMessage(const std::string& message, std::vector<InboundEvent>& events){
    json j = json::parse(message, nullptr, false);
    if(j.is_discarded() || !j.is_object()){
        return false;
    }

    auto content = j.find("serverContent");
    if(content == j.end() || !content->is_object()){
        return true;
    }

    auto turn = content->find("modelTurn");
    if(turn != content->end() && turn->contains("parts") && (*turn)["parts"].is_array()){
        for(const json& part : (*turn)["parts"]){
            auto inline_data = part.find("inlineData");
            if(inline_data != part.end() && inline_data->contains("data") && (*inline_data)["data"].is_string()){
                std::vector<uint8_t> audio;
                if(base64Decode((*inline_data)["data"].get<std::string>(), audio) && !audio.empty()){
                    events.push_back(InboundEvent::audioPayload(std::move(audio)));
                }
                continue;
            }
            auto text = part.find("text");
            if(text != part.end() && text->is_string() && !text->get<std::string>().empty()){
                events.push_back(InboundEvent::textPayload(text->get<std::string>()));
            }
        }
    }

    bool turn_complete = content->value("turnComplete", false);
    bool interrupted = content->value("interrupted", false);
    if(turn_complete || interrupted){
        events.push_back(InboundEvent::turnComplete());
    }
    return true;
}

std::string serverErrorText(const std::string& message){
    json j = json::parse(message, nullptr, false);
    if(j.is_discarded() || !j.is_object()){
        return "";
    }
    if(j.contains("error")){
        const json& error = j["error"];
        if(error.is_object() && error.contains("message") && error["message"].is_string()){
            return error["message"].get<std::string>();
        }
        return error.dump();
    }
    return "";
}

bool parseGoAway(const std::string& message, std::string& time_left){
    json j = json::parse(message, nullptr, false);
    if(j.is_discarded() || !j.is_object() || !j.contains("goAway")){
        return false;
    }
    const json& go_away = j["goAway"];
    time_left = go_away.is_object() ? go_away.value("timeLeft", "") : "";
    return true;
}

std::string base64Encode(const std::vector<uint8_t>& data){
    if(data.empty()){
        return "";
    }
    std::string out(AV_BASE64_SIZE(data.size()), '\0');
    if(!av_base64_encode(&out[0], out.size(), data.data(), data.size())){
        return "";
    }
    // drop the terminating NUL written by av_base64_encode
    out.resize(out.size() - 1);
    return out;
}

bool base64Decode(const std::string& text, std::vector<uint8_t>& data){
    data.resize(AV_BASE64_DECODE_SIZE(text.size()) + 3);
    int size = av_base64_decode(data.data(), text.c_str(), data.size());
    if(size < 0){
        data.clear();
        return false;
    }
    data.resize(size);
    return true;
}
