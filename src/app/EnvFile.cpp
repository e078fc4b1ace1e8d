#include "EnvFile.hpp"
#include "TextUtil.hpp"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {
    std::string unquote(const std::string& value){
        if(value.size() >= 2){
            char first = value.front();
            char last = value.back();
            if((first == '"' || first == '\'') && first == last){
                return value.substr(1, value.size() - 2);
            }
        }
        return value;
    }
}

std::map<std::string, std::string> parseEnvFile(const std::string& content){
    std::map<std::string, std::string> values;
    std::istringstream stream(content);
    std::string line;
    while(std::getline(stream, line)){
        line = trim(line);
        if(line.empty() || line[0] == '#'){
            continue;
        }
        if(line.compare(0, 7, "export ") == 0){
            line = trim(line.substr(7));
        }
        size_t eq = line.find('=');
        if(eq == std::string::npos){
            continue;
        }
        std::string key = trim(line.substr(0, eq));
        if(key.empty()){
            continue;
        }
        values[key] = unquote(trim(line.substr(eq + 1)));
    }
    return values;
}

bool loadEnvFile(const std::string& path){
    std::ifstream file(path);
    if(!file.is_open()){
        return false;
    }
    std::stringstream content;
    content << file.rdbuf();

    int loaded = 0;
    for(const auto& entry : parseEnvFile(content.str())){
        if(setenv(entry.first.c_str(), entry.second.c_str(), 0) == 0){
            loaded++;
        }
    }
    printf("read %d variables from %s\n",loaded,path.c_str());
    return true;
}
