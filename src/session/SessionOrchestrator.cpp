#include "SessionOrchestrator.hpp"
#include "SessionErrors.hpp"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <system_error>

namespace {
    const char* const TASK_OUTBOUND = "outbound-realtime";
    const char* const TASK_CAPTURE = "capture";
    const char* const TASK_RECEIVE = "receive";
    const char* const TASK_PLAYBACK = "playback";
    const char* const TASK_TEXT = "text-injection";
}

SessionOrchestrator::SessionOrchestrator(CredentialRotator& credentials,
                                         LiveConnector& connector,
                                         CaptureSource& capture,
                                         PlaybackSink& playback)
    :SessionOrchestrator(credentials, connector, capture, playback, Policy())
{
}

SessionOrchestrator::SessionOrchestrator(CredentialRotator& credentials,
                                         LiveConnector& connector,
                                         CaptureSource& capture,
                                         PlaybackSink& playback,
                                         const Policy& policy)
    :credentials_(credentials)
    ,connector_(connector)
    ,capture_(capture)
    ,playback_(playback)
    ,policy_(policy)
    ,outbound_queue_(policy.outbound_queue_size)
    ,audio_turn_(0)
    ,state_(IDLE)
    ,current_group_(nullptr)
    ,should_stop_(false)
    ,is_running_(false)
{
}

SessionOrchestrator::~SessionOrchestrator(){
    stop();
}

const char* SessionOrchestrator::stateName(State state){
    switch(state){
        case IDLE:
            return "IDLE";
        case CONNECTING:
            return "CONNECTING";
        case ACTIVE:
            return "ACTIVE";
        case RECOVERING:
            return "RECOVERING";
        case TERMINATED:
            return "TERMINATED";
    }
    return "UNKNOWN";
}

bool SessionOrchestrator::isQuitCommand(const std::string& text){
    if(text.size() != 1){
        return false;
    }
    return std::tolower(static_cast<unsigned char>(text[0])) == QUIT_COMMAND[0];
}

bool SessionOrchestrator::start(const SessionConfig& config){
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if(is_running_){
        fprintf(stderr,"session already running\n");
        return false;
    }
    // a previous session may have terminated on its own
    joinThreads();

    {
        std::lock_guard<std::mutex> lock(config_mutex_);
        config_ = config;
    }
    should_stop_ = false;
    is_running_ = true;
    connector_.reset();

    outbound_queue_.clear();
    inbound_audio_queue_.clear();
    text_queue_.clear();
    config_queue_.clear();
    outbound_queue_.reopen();
    inbound_audio_queue_.reopen();
    text_queue_.reopen();
    config_queue_.reopen();

    try{
        config_thread_ = std::make_unique<std::thread>(&SessionOrchestrator::configApplyLoop, this);
        session_thread_ = std::make_unique<std::thread>(&SessionOrchestrator::sessionLoop, this);
    }catch(const std::exception& e){
        fprintf(stderr,"Failed to start session threads: %s\n",e.what());
        should_stop_ = true;
        config_queue_.close();
        joinThreads();
        is_running_ = false;
        return false;
    }
    printf("Session started (%s)\n",config.describe().c_str());
    return true;
}

void SessionOrchestrator::stop(){
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if(!session_thread_ && !config_thread_){
        return;
    }

    should_stop_ = true;
    connector_.cancel();
    {
        std::lock_guard<std::mutex> lock(group_mutex_);
        if(current_group_){
            current_group_->cancel();
        }
    }
    {
        std::lock_guard<std::mutex> lock(stop_mutex_);
    }
    stop_cv_.notify_all();
    config_queue_.close();

    joinThreads();

    outbound_queue_.clear();
    inbound_audio_queue_.clear();
    text_queue_.clear();
    is_running_ = false;
    printf("Session stopped\n");
}

void SessionOrchestrator::joinThreads(){
    if(session_thread_ && session_thread_->joinable()){
        session_thread_->join();
    }
    session_thread_.reset();

    // the config task lives as long as the session
    config_queue_.close();
    if(config_thread_ && config_thread_->joinable()){
        config_thread_->join();
    }
    config_thread_.reset();
}

bool SessionOrchestrator::sendText(const std::string& text){
    if(!is_running_){
        return false;
    }
    return text_queue_.push(text);
}

void SessionOrchestrator::updateConfig(const SessionConfigUpdate& update){
    if(update.empty()){
        return;
    }
    if(is_running_ && config_queue_.push(update)){
        return;
    }
    std::lock_guard<std::mutex> lock(config_mutex_);
    config_.merge(update);
}

SessionOrchestrator::State SessionOrchestrator::getState() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

SessionConfig SessionOrchestrator::getConfig() const {
    std::lock_guard<std::mutex> lock(config_mutex_);
    return config_;
}

void SessionOrchestrator::setState(State state, const std::string& message){
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_ = state;
    }
    printf("Session state: %s%s%s\n", stateName(state), message.empty() ? "" : " - ", message.c_str());
    if(state_callback_){
        state_callback_(state, message);
    }
}

bool SessionOrchestrator::sleepUnlessStopped(std::chrono::milliseconds delay){
    std::unique_lock<std::mutex> lock(stop_mutex_);
    return !stop_cv_.wait_for(lock, delay, [this]{ return should_stop_.load(); });
}

std::unique_ptr<LiveConnection> SessionOrchestrator::connect(){
    if(policy_.max_connect_attempts <= 0){
        throw ConnectionError("no connection attempts allowed");
    }

    std::exception_ptr last_error;
    for(int attempt = 1; attempt <= policy_.max_connect_attempts; attempt++){
        if(should_stop_){
            throw ConnectionError("connection cancelled");
        }
        Credential credential = credentials_.next();
        SessionConfig config = getConfig();
        try{
            std::unique_ptr<LiveConnection> connection = connector_.open(credential, config);
            if(!connection){
                throw ConnectionError("connector returned no connection");
            }
            printf("Live session connected (%s)\n",config.describe().c_str());
            return connection;
        }catch(const std::exception& e){
            last_error = std::current_exception();
            fprintf(stderr,"Failed to connect (attempt %d/%d): %s\n",
                    attempt, policy_.max_connect_attempts, e.what());
        }
        if(attempt < policy_.max_connect_attempts && !sleepUnlessStopped(policy_.retry_delay)){
            throw ConnectionError("connection cancelled");
        }
    }

    fprintf(stderr,"Failed to connect after %d attempts\n",policy_.max_connect_attempts);
    std::rethrow_exception(last_error);
}

void SessionOrchestrator::sessionLoop(){
    std::string final_message = "stopped";
    std::unique_ptr<LiveConnection> connection;

    setState(CONNECTING, "");
    try{
        connection = connect();
    }catch(const std::exception& e){
        if(!should_stop_){
            final_message = e.what();
        }
    }

    int device_failures = 0;
    while(connection && !should_stop_){
        setState(ACTIVE, getConfig().describe());
        GroupExit exit = runPipelines(*connection);
        connection->close();
        connection.reset();

        if(should_stop_ || exit == EXIT_CANCELLED){
            break;
        }

        std::string reason;
        if(exit == EXIT_DEVICE_FAILED){
            device_failures++;
            reason = "audio device failure";
            if(device_failures >= policy_.max_device_failures){
                fprintf(stderr,"Giving up after %d consecutive device failures\n",device_failures);
                final_message = "audio device failed " + std::to_string(device_failures) + " times";
                break;
            }
        }else{
            device_failures = 0;
            reason = exit == EXIT_QUIT ? "quit requested" : "pipeline failure";
        }

        if(exit == EXIT_QUIT && !policy_.reconnect_on_quit){
            final_message = "quit";
            break;
        }

        setState(RECOVERING, reason);
        setState(CONNECTING, "reconnecting with a new credential");
        try{
            connection = connect();
        }catch(const std::exception& e){
            if(!should_stop_){
                final_message = e.what();
            }
            break;
        }
        // keep a failing endpoint from spinning hot
        if(!sleepUnlessStopped(policy_.retry_delay)){
            break;
        }
    }

    if(connection){
        connection->close();
        connection.reset();
    }
    is_running_ = false;
    setState(TERMINATED, final_message);
}

void SessionOrchestrator::configApplyLoop(){
    SessionConfigUpdate update;
    while(config_queue_.pop(update)){
        SessionConfig applied;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            config_.merge(update);
            applied = config_;
        }
        printf("Updated config: %s\n",applied.describe().c_str());
    }
    if(policy_.verbose){
        printf("config update task ended\n");
    }
}

SessionOrchestrator::GroupExit SessionOrchestrator::runPipelines(LiveConnection& connection){
    if(!capture_.open(policy_.capture_format)){
        fprintf(stderr,"Session error: capture device could not be opened\n");
        return EXIT_DEVICE_FAILED;
    }
    if(!playback_.open(policy_.playback_format)){
        fprintf(stderr,"Session error: playback device could not be opened\n");
        capture_.close();
        return EXIT_DEVICE_FAILED;
    }

    outbound_queue_.reopen();
    inbound_audio_queue_.reopen();
    text_queue_.reopen();

    TaskGroup group;
    group.setCancelHandler([this, &connection]{
        connection.close();
        outbound_queue_.close();
        inbound_audio_queue_.close();
        text_queue_.close();
        capture_.close();
        playback_.close();
    });
    {
        std::lock_guard<std::mutex> lock(group_mutex_);
        current_group_ = &group;
        if(should_stop_){
            group.cancel();
        }
    }

    TaskGroup::Outcome outcome;
    try{
        group.spawn(TASK_TEXT, [this, &connection]{ textInjectionLoop(connection); });
        group.spawn(TASK_OUTBOUND, [this, &connection]{ outboundLoop(connection); });
        group.spawn(TASK_CAPTURE, [this, &group]{ captureLoop(group); });
        group.spawn(TASK_RECEIVE, [this, &connection, &group]{ receiveLoop(connection, group); });
        group.spawn(TASK_PLAYBACK, [this, &group]{ playbackLoop(group); });
        outcome = group.wait();
    }catch(const std::system_error& e){
        fprintf(stderr,"Failed to start pipeline threads: %s\n",e.what());
        group.cancel();
        outcome = group.wait();
        outcome.cancelled = false;
        outcome.error = std::make_exception_ptr(ConnectionError(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(group_mutex_);
        current_group_ = nullptr;
    }

    // nothing buffered for this connection may leak into the next one
    outbound_queue_.clear();
    size_t dropped = inbound_audio_queue_.clear();
    if(policy_.verbose && dropped > 0){
        printf("dropped %zu unplayed chunks at teardown\n",dropped);
    }
    logDeviceStats();
    return classifyOutcome(outcome);
}

void SessionOrchestrator::logDeviceStats(){
    CaptureSource::CaptureStats capture = capture_.getStats();
    PlaybackSink::PlaybackStats playback = playback_.getStats();
    printf("capture: %llu buffers read, %llu bytes dropped; playback: %llu buffers, %llu bytes played%s\n",
           (unsigned long long)capture.buffers_read, (unsigned long long)capture.bytes_dropped,
           (unsigned long long)playback.buffers_played, (unsigned long long)playback.bytes_played,
           playback.underrun ? " (underrun)" : "");
    if(capture.bytes_dropped > 0){
        fprintf(stderr,"capture overflowed, %llu bytes of microphone audio lost\n",
                (unsigned long long)capture.bytes_dropped);
    }
}

SessionOrchestrator::GroupExit SessionOrchestrator::classifyOutcome(const TaskGroup::Outcome& outcome){
    if(outcome.cancelled){
        printf("pipelines cancelled\n");
        return EXIT_CANCELLED;
    }
    if(outcome.error){
        try{
            std::rethrow_exception(outcome.error);
        }catch(const DeviceError& e){
            fprintf(stderr,"Session error in %s: device: %s\n",outcome.task.c_str(),e.what());
            return EXIT_DEVICE_FAILED;
        }catch(const std::exception& e){
            fprintf(stderr,"Session error in %s: %s\n",outcome.task.c_str(),e.what());
            return EXIT_FAILED;
        }catch(...){
            fprintf(stderr,"Session error in %s: unknown exception\n",outcome.task.c_str());
            return EXIT_FAILED;
        }
    }
    if(outcome.task == TASK_TEXT){
        printf("text pipeline finished, closing connection\n");
        return EXIT_QUIT;
    }
    fprintf(stderr,"pipeline %s ended unexpectedly\n",outcome.task.c_str());
    return EXIT_FAILED;
}

void SessionOrchestrator::outboundLoop(LiveConnection& connection){
    AudioChunk chunk;
    while(outbound_queue_.pop(chunk)){
        connection.sendAudio(chunk);
        if(policy_.verbose){
            printf("sent %zu bytes of audio\n",chunk.data.size());
        }
    }
}

void SessionOrchestrator::captureLoop(TaskGroup& group){
    std::vector<uint8_t> data;
    while(capture_.read(data)){
        AudioChunk chunk;
        chunk.data = std::move(data);
        // blocks while the network side is behind
        if(!outbound_queue_.push(std::move(chunk))){
            return;
        }
        data.clear();
    }
    if(!group.isCancelled()){
        throw DeviceError("capture stream closed unexpectedly");
    }
}

void SessionOrchestrator::receiveLoop(LiveConnection& connection, TaskGroup& group){
    InboundEvent event;
    while(connection.receive(event)){
        switch(event.type){
            case InboundEvent::AUDIO_PAYLOAD: {
                PlaybackChunk chunk;
                chunk.turn = audio_turn_;
                chunk.data = std::move(event.audio);
                inbound_audio_queue_.tryPush(std::move(chunk));
                break;
            }
            case InboundEvent::TEXT_PAYLOAD:
                if(text_callback_){
                    text_callback_(event.text);
                }else{
                    printf("%s",event.text.c_str());
                    fflush(stdout);
                }
                break;
            case InboundEvent::TURN_COMPLETE: {
                // barge-in: whatever the previous answer still had queued must not play
                audio_turn_++;
                size_t dropped = inbound_audio_queue_.clear();
                playback_.discard();
                if(policy_.verbose){
                    printf("turn complete, dropped %zu unplayed chunks\n",dropped);
                }
                if(turn_complete_callback_){
                    turn_complete_callback_();
                }
                break;
            }
        }
    }
    if(!group.isCancelled()){
        throw ConnectionError("connection closed by remote");
    }
}

void SessionOrchestrator::playbackLoop(TaskGroup& group){
    PlaybackChunk chunk;
    while(inbound_audio_queue_.pop(chunk)){
        // popped just before a turn ended
        if(chunk.turn != audio_turn_){
            continue;
        }
        if(!playback_.write(chunk.data)){
            if(!group.isCancelled()){
                throw DeviceError("playback stream closed unexpectedly");
            }
            return;
        }
    }
}

void SessionOrchestrator::textInjectionLoop(LiveConnection& connection){
    std::string text;
    while(text_queue_.pop(text)){
        if(isQuitCommand(text)){
            printf("quit command received\n");
            return;
        }
        connection.sendText(text.empty() ? "." : text, true);
    }
}
