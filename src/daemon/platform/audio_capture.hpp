#pragma once

// Always-open input stream. Implementations push samples into a RingBuffer
// from their realtime callback and never block it.
class AudioCapture {
public:
    virtual ~AudioCapture() = default;
    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;
    // Set from the stream thread when the device errors or disappears.
    virtual bool failed() const = 0;
    // RMS of the most recent callback block.
    virtual float level() const = 0;
};
