#ifndef CREDENTIALROTATOR
#define CREDENTIALROTATOR

#include <deque>
#include <mutex>
#include <random>
#include <string>
#include <vector>

typedef std::string Credential;

#define CREDENTIALS_ENV_NAME "GEMINI_API_KEYS"

class CredentialRotator {
public:
    // throws ConfigurationError when the set is empty or holds an empty entry
    explicit CredentialRotator(const std::vector<Credential>& credentials);
    CredentialRotator(const std::vector<Credential>& credentials, unsigned int seed);

    CredentialRotator(const CredentialRotator&) = delete;
    CredentialRotator& operator=(const CredentialRotator&) = delete;

    // every credential comes out once per cycle; a new shuffled cycle starts
    // when the current one runs dry
    Credential next();

    size_t size() const { return credentials_.size(); }

    // "a, b,,c" -> {"a","b","c"}; throws ConfigurationError when nothing is left
    static std::vector<Credential> parse(const std::string& value);
    static std::vector<Credential> loadFromEnvironment(const char* name = CREDENTIALS_ENV_NAME);

private:
    void validate() const;
    void refill();

    const std::vector<Credential> credentials_;
    std::deque<Credential> queue_;
    std::mt19937 rng_;
    std::mutex queue_mutex_;
};

#endif
