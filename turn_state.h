#ifndef RTBRIDGE_TURN_STATE_H
#define RTBRIDGE_TURN_STATE_H

#include "model_events.h"

#include <string>

namespace rtbridge {

enum class TurnState
{
    Idle,
    UserSpeaking,
    ResponseInProgress,
    AssistantSpeaking
};

const char* turnStateName(TurnState state);

// Receives the side effects of model events. Called on the thread that
// drives TurnStateMachine::handle().
class TurnObserver
{
public:
    virtual ~TurnObserver() = default;

    virtual void onSessionReady() {}
    virtual void onAssistantAudio(const std::string& pcm16) = 0;
    // End of one audio stream: flush outbound audio with padding.
    virtual void onAssistantAudioDone() = 0;
    // User started talking over the assistant.
    virtual void onBargeIn() = 0;
    virtual void onModelError(const std::string& message) = 0;
    virtual void onModelClosed(int code, const std::string& reason) = 0;
};

// Conversation turn tracking driven only by model events, in arrival
// order. Not thread safe; one consumer thread per call owns it.
class TurnStateMachine
{
public:
    explicit TurnStateMachine(TurnObserver& observer);

    void handle(const ModelEvent& ev);

    TurnState state() const;
    bool sessionReady() const { return ready; }
    bool userSpeaking() const { return userTalking; }
    bool responseInProgress() const { return responding; }
    bool assistantSpeaking() const { return assistantTalking; }

    size_t audioChunks() const { return chunks; }
    size_t bargeIns() const { return interruptions; }

private:
    void logState() const;

    TurnObserver& observer;
    bool ready;
    bool userTalking;
    bool responding;
    bool assistantTalking;
    size_t chunks;
    size_t interruptions;
};

} // namespace rtbridge

#endif // RTBRIDGE_TURN_STATE_H
