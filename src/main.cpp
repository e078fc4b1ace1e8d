#include <cstdio>
#include <iostream>
#include <string>
#include "SDLCaptureSource.hpp"
#include "ControlSurface.hpp"
#include "CredentialRotator.hpp"
#include "EnvFile.hpp"
#include "GeminiLiveConnection.hpp"
#include "SDLPlaybackSink.hpp"
#include "SessionErrors.hpp"
#include "SessionOrchestrator.hpp"

namespace {
    void printUsage(const char* program){
        printf("usage: %s [--voice NAME] [--mode AUDIO|TEXT] [--system TEXT] [--env FILE] [--verbose]\n", program);
        printf("commands while running:\n");
        printf("  <text>          send a message\n");
        printf("  /start          start a session with the current settings\n");
        printf("  /stop           stop the session\n");
        printf("  /voice NAME     change the voice (next connection)\n");
        printf("  /mode AUDIO|TEXT\n");
        printf("  /system TEXT    change the system instruction\n");
        printf("  /quit           end the current turn group and reconnect\n");
        printf("  /history        show the conversation\n");
        printf("  /status         show the session status\n");
        printf("  /exit           leave\n");
    }

    std::string argument(const std::string& line, size_t command_length){
        if(line.size() <= command_length){
            return "";
        }
        return line.substr(command_length + 1);
    }

    void printHistory(const ControlSurface& surface){
        for(const ControlSurface::Message& message : surface.messages()){
            const char* who = message.role == ControlSurface::Message::USER ? "you" :
                              message.role == ControlSurface::Message::MODEL ? "model" : "status";
            printf("[%s] %s\n", who, message.text.c_str());
        }
    }
}

int main(int argc, char* argv[]){
    SessionConfig config;
    std::string env_file = ".env";
    bool verbose = false;

    for(int i = 1; i < argc; i++){
        std::string arg = argv[i];
        bool has_value = i + 1 < argc;
        if(arg == "--voice" && has_value){
            config.voice_name = argv[++i];
        }else if(arg == "--mode" && has_value){
            if(!parseResponseModality(argv[++i], config.response_modality)){
                fprintf(stderr,"unknown response mode %s\n",argv[i]);
                return 1;
            }
        }else if(arg == "--system" && has_value){
            config.system_instruction = argv[++i];
        }else if(arg == "--env" && has_value){
            env_file = argv[++i];
        }else if(arg == "--verbose"){
            verbose = true;
        }else if(arg == "--help" || arg == "-h"){
            printUsage(argv[0]);
            return 0;
        }else{
            fprintf(stderr,"unknown argument %s\n",arg.c_str());
            printUsage(argv[0]);
            return 1;
        }
    }

    loadEnvFile(env_file);

    std::vector<Credential> credentials;
    try{
        credentials = CredentialRotator::loadFromEnvironment();
    }catch(const ConfigurationError& e){
        fprintf(stderr,"API keys configuration error: %s\n",e.what());
        return 1;
    }
    printf("%zu API keys loaded\n",credentials.size());

    CredentialRotator rotator(credentials);
    GeminiEndpoint endpoint;
    endpoint.verbose = verbose;
    GeminiLiveConnector connector(endpoint);
    SDLCaptureSource capture;
    SDLPlaybackSink playback;
    playback.setDebug(verbose);

    SessionOrchestrator::Policy policy;
    policy.verbose = verbose;
    SessionOrchestrator orchestrator(rotator, connector, capture, playback, policy);
    ControlSurface surface(orchestrator);

    surface.setDisplayCallback([](const ControlSurface::Message& message){
        switch(message.role){
            case ControlSurface::Message::MODEL:
                printf("%s",message.text.c_str());
                fflush(stdout);
                break;
            case ControlSurface::Message::STATUS:
                printf("\n[%s]\n",message.text.c_str());
                break;
            case ControlSurface::Message::USER:
                break;
        }
    });

    printUsage(argv[0]);
    if(!surface.start(config)){
        return 1;
    }
    printf("Session started - use headphones!\n");

    std::string line;
    while(std::getline(std::cin, line)){
        if(line.empty()){
            continue;
        }
        if(line[0] != '/'){
            if(!surface.sendText(line)){
                fprintf(stderr,"no active session, use /start\n");
            }
            continue;
        }

        if(line == "/exit"){
            break;
        }else if(line == "/start"){
            surface.start(surface.currentConfig());
        }else if(line == "/stop"){
            surface.stop();
            printf("Session stopped\n");
        }else if(line.compare(0, 6, "/voice") == 0){
            std::string voice = argument(line, 6);
            if(voice.empty()){
                fprintf(stderr,"usage: /voice NAME\n");
                continue;
            }
            SessionConfigUpdate update;
            update.voice_name = voice;
            surface.updateConfig(update);
        }else if(line.compare(0, 5, "/mode") == 0){
            ResponseModality modality;
            if(!parseResponseModality(argument(line, 5), modality)){
                fprintf(stderr,"mode must be AUDIO or TEXT\n");
                continue;
            }
            SessionConfigUpdate update;
            update.response_modality = modality;
            surface.updateConfig(update);
        }else if(line.compare(0, 7, "/system") == 0){
            std::string instruction = argument(line, 7);
            if(instruction.empty()){
                fprintf(stderr,"usage: /system TEXT\n");
                continue;
            }
            SessionConfigUpdate update;
            update.system_instruction = instruction;
            surface.updateConfig(update);
        }else if(line == "/quit"){
            surface.sendText(QUIT_COMMAND);
        }else if(line == "/history"){
            printHistory(surface);
        }else if(line == "/status"){
            printf("%s (%s), %s\n",surface.statusText().c_str(),surface.lastStatus().c_str(),
                   surface.currentConfig().describe().c_str());
        }else{
            fprintf(stderr,"unknown command %s\n",line.c_str());
        }
    }

    surface.stop();
    return 0;
}
