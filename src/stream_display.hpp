#pragma once
#include "document.hpp"
#include "render_adapter.hpp"
#include "reveal_scheduler.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace trickle {

// What the presentation layer draws for one slot
struct RenderSnapshot {
    StructuredDocument document; // ends with a Cursor block while revealing
    bool revealing = false;
    std::string identity_key;
    size_t revealed = 0;
    size_t total = 0;
};

using SnapshotSink = std::function<void(const RenderSnapshot&)>;

// One UI slot showing a content stream: a RevealScheduler feeding a
// RenderAdapter. Every visible change is rendered and pushed to the sink.
class StreamDisplay {
public:
    StreamDisplay(TimerService& timers, const MarkupRenderer& renderer,
                  const RevealConfig& config, SnapshotSink sink);
    ~StreamDisplay();

    StreamDisplay(const StreamDisplay&) = delete;
    StreamDisplay& operator=(const StreamDisplay&) = delete;

    void update(const std::string& text, bool streaming, const std::string& identity_key);
    void mark_complete();
    void end_stream();

    // Render the current state without waiting for a change
    RenderSnapshot snapshot();

    // Cancel pending reveal work; the sink is not called afterwards
    void teardown();

    const RevealScheduler& scheduler() const { return scheduler_; }
    const RenderAdapter& adapter() const { return adapter_; }

private:
    void on_change();

    RevealScheduler scheduler_;
    RenderAdapter adapter_;
    SnapshotSink sink_;
    uint64_t rendered_generation_ = 0;
};

} // namespace trickle
