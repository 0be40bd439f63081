#include "stream_display.hpp"

namespace trickle {

StreamDisplay::StreamDisplay(TimerService& timers, const MarkupRenderer& renderer,
                             const RevealConfig& config, SnapshotSink sink)
    : scheduler_(timers, config),
      adapter_(renderer, config.cursor_marker),
      sink_(std::move(sink))
{
    scheduler_.set_change_listener([this]() { on_change(); });
}

StreamDisplay::~StreamDisplay() {
    teardown();
}

void StreamDisplay::update(const std::string& text, bool streaming,
                           const std::string& identity_key) {
    scheduler_.update(text, streaming, identity_key);
}

void StreamDisplay::mark_complete() {
    scheduler_.mark_complete();
}

void StreamDisplay::end_stream() {
    scheduler_.end_stream();
}

void StreamDisplay::teardown() {
    scheduler_.teardown();
    sink_ = nullptr;
}

RenderSnapshot StreamDisplay::snapshot() {
    if (scheduler_.generation() != rendered_generation_) {
        adapter_.reset();
        rendered_generation_ = scheduler_.generation();
    }

    RenderSnapshot snap;
    snap.revealing = scheduler_.is_revealing();
    snap.document = adapter_.apply(scheduler_.visible_text(), snap.revealing);
    snap.identity_key = scheduler_.identity_key();
    snap.revealed = scheduler_.revealed_length();
    snap.total = scheduler_.authoritative_text().size();
    return snap;
}

void StreamDisplay::on_change() {
    if (!sink_) return;
    RenderSnapshot snap = snapshot();
    // The sink may tear this display down while running
    SnapshotSink sink = sink_;
    sink(snap);
}

} // namespace trickle
