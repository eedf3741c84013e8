#include "turn_state.h"
#include "log.h"

namespace rtbridge {

const char* turnStateName(TurnState state)
{
    switch (state) {
    case TurnState::Idle: return "idle";
    case TurnState::UserSpeaking: return "user_speaking";
    case TurnState::ResponseInProgress: return "response_in_progress";
    case TurnState::AssistantSpeaking: return "assistant_speaking";
    }
    return "unknown";
}

TurnStateMachine::TurnStateMachine(TurnObserver& observer_)
    : observer(observer_),
      ready(false),
      userTalking(false),
      responding(false),
      assistantTalking(false),
      chunks(0),
      interruptions(0)
{
}

TurnState TurnStateMachine::state() const
{
    if (userTalking)
        return TurnState::UserSpeaking;
    if (assistantTalking)
        return TurnState::AssistantSpeaking;
    if (responding)
        return TurnState::ResponseInProgress;
    return TurnState::Idle;
}

void TurnStateMachine::handle(const ModelEvent& ev)
{
    switch (ev.type) {
    case ModelEventType::SessionCreated:
        ready = true;
        logging::debug("OAI", "Session created and ready");
        observer.onSessionReady();
        break;

    case ModelEventType::SessionUpdated:
        logging::debug("OAI", "Session configuration updated");
        break;

    case ModelEventType::SpeechStarted:
        userTalking = true;
        logging::debug("OAI", "User started speaking");
        if (assistantTalking) {
            interruptions++;
            logging::debug("OAI", "User interrupted the assistant");
            observer.onBargeIn();
        }
        logState();
        break;

    case ModelEventType::SpeechStopped:
        userTalking = false;
        logging::debug("OAI", "User stopped speaking");
        logState();
        break;

    case ModelEventType::AudioCommitted:
        logging::debug("OAI", "Audio buffer committed");
        break;

    case ModelEventType::ResponseCreated:
        responding = true;
        logging::debug("OAI", "Response generation started");
        logState();
        break;

    case ModelEventType::OutputItemAdded:
        logging::debug("OAI", "Audio output item added");
        break;

    case ModelEventType::AudioDelta:
        if (ev.audio.empty()) {
            logging::debug("OAI", "Empty audio delta ignored");
            break;
        }
        observer.onAssistantAudio(ev.audio);
        assistantTalking = true;
        chunks++;
        if (chunks % 20 == 0)
            logging::debug("OAI", "handled audio chunks: " + std::to_string(chunks));
        break;

    case ModelEventType::AudioDone:
        assistantTalking = false;
        observer.onAssistantAudioDone();
        logging::debug("OAI", "Audio generation completed");
        break;

    case ModelEventType::ResponseDone:
        responding = false;
        assistantTalking = false;
        logging::debug("OAI", "Response completed - ready for next input");
        logState();
        break;

    case ModelEventType::Error:
        logging::error("OAI", "Error: " + ev.message);
        observer.onModelError(ev.message);
        break;

    case ModelEventType::Closed:
        ready = false;
        userTalking = false;
        responding = false;
        assistantTalking = false;
        observer.onModelClosed(ev.closeCode, ev.message);
        break;

    case ModelEventType::Unhandled:
        logging::debug("OAI", ev.name + ": " + logging::preview(ev.raw, 300));
        break;
    }
}

void TurnStateMachine::logState() const
{
    logging::debug("OAI", std::string("Conversation state: ") + turnStateName(state()) +
                   " (user_speaking=" + (userTalking ? "true" : "false") +
                   ", response_in_progress=" + (responding ? "true" : "false") +
                   ", assistant_speaking=" + (assistantTalking ? "true" : "false") + ")");
}

} // namespace rtbridge
