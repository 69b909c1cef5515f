#include "platform/linux/pipewire_capture.hpp"

#include <format>
#include <print>
#include <span>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate)
    : ring_buf_(ring_buf), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    close();
    pw_deinit();
}

std::expected<void, std::string> PipeWireCapture::open() {
    if (capturing_.load(std::memory_order_relaxed)) return {};

    loop_ = pw_thread_loop_new("v2m-capture", nullptr);
    if (!loop_) {
        return std::unexpected("failed to create PipeWire thread loop");
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "v2m",
        PW_KEY_APP_NAME, "v2m",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "v2m-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        destroy_stream();
        return std::unexpected("failed to create PipeWire capture stream");
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret < 0) {
        destroy_stream();
        return std::unexpected(std::format("stream connect failed: {}", spa_strerror(ret)));
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        destroy_stream();
        return std::unexpected(std::format("thread loop start failed: {}", spa_strerror(ret)));
    }

    ring_buf_.reset();
    stream_error_.store(false, std::memory_order_relaxed);
    capturing_.store(true, std::memory_order_release);
    return {};
}

size_t PipeWireCapture::read(std::vector<int16_t>& out) {
    return ring_buf_.drain_into(out);
}

void PipeWireCapture::close() {
    if (!capturing_.exchange(false, std::memory_order_acq_rel)) return;

    if (loop_) pw_thread_loop_stop(loop_);
    destroy_stream();

    if (auto lost = ring_buf_.overruns(); lost > 0) {
        std::println(stderr, "audio: {} samples lost to ring buffer overrun", lost);
    }
}

void PipeWireCapture::destroy_stream() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->capturing_.load(std::memory_order_relaxed)) {
        auto* samples = reinterpret_cast<const int16_t*>(
            static_cast<const uint8_t*>(d->data) + d->chunk->offset);
        self->ring_buf_.write(std::span<const int16_t>(samples, d->chunk->size / sizeof(int16_t)));
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    if (state == PW_STREAM_STATE_ERROR) {
        static_cast<PipeWireCapture*>(userdata)->stream_error_.store(true, std::memory_order_relaxed);
    }
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
