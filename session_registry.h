#ifndef RTBRIDGE_SESSION_REGISTRY_H
#define RTBRIDGE_SESSION_REGISTRY_H

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace rtbridge {

class BridgeSession;

// Active calls keyed by telephony stream id.
class SessionRegistry
{
public:
    // False if the id is already taken.
    bool insert(const std::string& streamSid, std::shared_ptr<BridgeSession> session);

    // Removes the entry only while it still maps to `session`, so a late
    // teardown cannot evict a newer call with the same id.
    bool remove(const std::string& streamSid, const std::shared_ptr<BridgeSession>& session);

    std::vector<std::shared_ptr<BridgeSession>> snapshot() const;
    size_t size() const;

private:
    mutable std::mutex mtx;
    std::map<std::string, std::shared_ptr<BridgeSession>> sessions;
};

} // namespace rtbridge

#endif // RTBRIDGE_SESSION_REGISTRY_H
