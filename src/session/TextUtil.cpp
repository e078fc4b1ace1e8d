#include "TextUtil.hpp"

std::string trim(const std::string& value){
    const char* spaces = " \t\r\n";
    size_t begin = value.find_first_not_of(spaces);
    if(begin == std::string::npos){
        return "";
    }
    size_t end = value.find_last_not_of(spaces);
    return value.substr(begin, end - begin + 1);
}
