#include "RecordingPlugin.hpp"

using namespace surveyor;

namespace test_utils {

bool RecordingPlugin::Start(Registry& registry, ErrorInfo* err)
{
    ++starts;
    for (const auto& def : defs_)
    {
        Handler h;
        h.plugin = this;
        h.name = def.name;
        h.priority = def.priority;
        h.event_type = def.type;
        h.max_instances = def.max_instances;
        h.transforms = def.transforms;

        HandlerCallback inner = def.callback;
        const std::string handler_name = def.name;
        h.callback = [this, inner, handler_name](Event& e, ErrorInfo* cb_err) {
            record(handler_name, e);
            return inner ? inner(e, cb_err) : true;
        };

        if (!registry.RegisterHandler(std::move(h), err))
            return false;
    }

    if (fail_start)
        return Fail(err, ErrorKind::Configuration, "start failure requested", name_);
    return true;
}

void RecordingPlugin::record(const std::string& handler, const Event& e)
{
    std::lock_guard<std::mutex> lock(mutex_);
    calls_.push_back(handler + ":" + e.entity.asset.CanonicalValue());
}

std::vector<std::string> RecordingPlugin::calls() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_;
}

size_t RecordingPlugin::callCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

} // namespace test_utils
