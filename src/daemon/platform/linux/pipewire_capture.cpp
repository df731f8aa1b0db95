#include "platform/linux/pipewire_capture.hpp"

#include <cmath>
#include <print>
#include <spa/param/audio/format-utils.h>
#include <spa/utils/result.h>

PipeWireCapture::PipeWireCapture(RingBuffer& ring_buf, uint32_t sample_rate)
    : ring_buf_(ring_buf), sample_rate_(sample_rate) {
    pw_init(nullptr, nullptr);
}

PipeWireCapture::~PipeWireCapture() {
    stop();
    pw_deinit();
}

bool PipeWireCapture::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    failed_.store(false, std::memory_order_release);
    streaming_.store(false, std::memory_order_relaxed);

    loop_ = pw_thread_loop_new("push-dictate", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_NODE_NAME, "push-dictate",
        PW_KEY_APP_NAME, "push-dictate",
        nullptr
    );

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        "push-dictate-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create stream");
        teardown();
        return false;
    }

    // F32LE mono at the configured rate; PipeWire resamples for us.
    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_F32_LE,
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
        std::println(stderr, "audio: stream connect failed: {}", spa_strerror(ret));
        teardown();
        return false;
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        teardown();
        return false;
    }

    capturing_.store(true, std::memory_order_release);
    return true;
}

void PipeWireCapture::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    teardown();
    level_.store(0.0f, std::memory_order_relaxed);
}

void PipeWireCapture::teardown() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

// Realtime thread: no locks, no allocation, no logging.
void PipeWireCapture::on_process(void* userdata) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (!d->data || !d->chunk) {
        pw_stream_queue_buffer(self->stream_, buf);
        return;
    }

    auto* samples = reinterpret_cast<const float*>(
        static_cast<const uint8_t*>(d->data) + d->chunk->offset);
    size_t count = d->chunk->size / sizeof(float);

    if (count > 0) {
        self->ring_buf_.write(samples, count);

        float sum = 0.0f;
        for (size_t i = 0; i < count; ++i) {
            sum += samples[i] * samples[i];
        }
        self->level_.store(std::sqrt(sum / static_cast<float>(count)), std::memory_order_relaxed);
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireCapture::on_state_changed(void* userdata, enum pw_stream_state old,
                                       enum pw_stream_state state, const char* error) {
    auto* self = static_cast<PipeWireCapture*>(userdata);

    if (state == PW_STREAM_STATE_STREAMING) {
        self->streaming_.store(true, std::memory_order_relaxed);
    }

    bool lost = state == PW_STREAM_STATE_ERROR ||
                (state == PW_STREAM_STATE_UNCONNECTED &&
                 self->streaming_.load(std::memory_order_relaxed) &&
                 self->capturing_.load(std::memory_order_relaxed));
    if (lost) {
        self->failed_.store(true, std::memory_order_release);
    }

    if (error || lost) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error ? error : "disconnected");
    }
}
