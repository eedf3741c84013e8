#include "session_registry.h"

namespace rtbridge {

bool SessionRegistry::insert(const std::string& streamSid, std::shared_ptr<BridgeSession> session)
{
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.emplace(streamSid, std::move(session)).second;
}

bool SessionRegistry::remove(const std::string& streamSid, const std::shared_ptr<BridgeSession>& session)
{
    std::lock_guard<std::mutex> lock(mtx);
    auto it = sessions.find(streamSid);
    if (it == sessions.end() || it->second != session)
        return false;
    sessions.erase(it);
    return true;
}

std::vector<std::shared_ptr<BridgeSession>> SessionRegistry::snapshot() const
{
    std::lock_guard<std::mutex> lock(mtx);
    std::vector<std::shared_ptr<BridgeSession>> out;
    out.reserve(sessions.size());
    for (const auto& entry : sessions)
        out.push_back(entry.second);
    return out;
}

size_t SessionRegistry::size() const
{
    std::lock_guard<std::mutex> lock(mtx);
    return sessions.size();
}

} // namespace rtbridge
