#include "CredentialRotator.hpp"
#include "SessionErrors.hpp"
#include "TextUtil.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>
#include <sstream>

CredentialRotator::CredentialRotator(const std::vector<Credential>& credentials)
    :credentials_(credentials)
    ,rng_(std::random_device{}())
{
    validate();
}

CredentialRotator::CredentialRotator(const std::vector<Credential>& credentials, unsigned int seed)
    :credentials_(credentials)
    ,rng_(seed)
{
    validate();
}

void CredentialRotator::validate() const {
    if(credentials_.empty()){
        throw ConfigurationError("credential set is empty");
    }
    for(const Credential& credential : credentials_){
        if(credential.empty()){
            throw ConfigurationError("credential set contains an empty entry");
        }
    }
}

Credential CredentialRotator::next(){
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if(queue_.empty()){
        refill();
    }
    Credential credential = queue_.front();
    queue_.pop_front();
    return credential;
}

void CredentialRotator::refill(){
    std::vector<Credential> shuffled = credentials_;
    std::shuffle(shuffled.begin(), shuffled.end(), rng_);
    queue_.assign(shuffled.begin(), shuffled.end());
}

std::vector<Credential> CredentialRotator::parse(const std::string& value){
    std::vector<Credential> credentials;
    std::stringstream stream(value);
    std::string item;
    while(std::getline(stream, item, ',')){
        item = trim(item);
        if(!item.empty()){
            credentials.push_back(item);
        }
    }
    if(credentials.empty()){
        throw ConfigurationError("no valid credentials found");
    }
    return credentials;
}

std::vector<Credential> CredentialRotator::loadFromEnvironment(const char* name){
    const char* value = std::getenv(name);
    if(!value || !*value){
        fprintf(stderr, "%s environment variable not set\n", name);
        throw ConfigurationError(std::string(name) + " is not set");
    }
    return parse(value);
}
