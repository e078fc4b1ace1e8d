#ifndef GEMINIPROTOCOL
#define GEMINIPROTOCOL

#include <string>
#include <vector>
#include "AudioFormat.hpp"
#include "LiveConnection.hpp"
#include "SessionConfig.hpp"

#define GEMINI_DEFAULT_MODEL "models/gemini-2.0-flash-exp"

// JSON messages of the BidiGenerateContent WebSocket API

std::string buildSetupMessage(const std::string& model, const SessionConfig& config);
std::string buildRealtimeInputMessage(const AudioChunk& chunk);
std::string buildClientTextMessage(const std::string& text, bool end_of_turn);

bool isSetupComplete(const std::string& message);

// Appends the events carried by one server message, in order: audio and text
// parts first, then a single TURN_COMPLETE for turnComplete/interrupted.
// Returns false if the message is not valid JSON.
bool parseServerMessage(const std::string& message, std::vector<InboundEvent>& events);

// server-initiated error text, empty if none
std::string serverErrorText(const std::string& message);

// goAway only announces that the server will close soon
bool parseGoAway(const std::string& message, std::string& time_left);

std::string base64Encode(const std::vector<uint8_t>& data);
bool base64Decode(const std::string& text, std::vector<uint8_t>& data);

#endif
